#include "retrying_http_client.hpp"
#include "log.hpp"
#include <algorithm>
#include <cctype>
#include <optional>
#include <spdlog/spdlog.h>
#include <thread>

namespace wfh {

namespace {

std::shared_ptr<spdlog::logger> retry_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("http");
  }();
  return logger;
}

std::optional<long long> header_number(const HttpResponse &resp,
                                       const std::string &name) {
  auto value = header_value(resp, name);
  if (!value || value->empty()) {
    return std::nullopt;
  }
  try {
    return std::stoll(*value);
  } catch (const std::exception &) {
    return std::nullopt;
  }
}

bool mentions_secondary_limit(const std::string &body) {
  std::string lower = body;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return lower.find("secondary rate limit") != std::string::npos ||
         lower.find("abuse detection") != std::string::npos;
}

enum class Outcome { Done, PrimaryLimit, SecondaryLimit, ServerError };

Outcome classify(const HttpResponse &resp) {
  if (resp.status_code == 403) {
    auto remaining = header_number(resp, "X-RateLimit-Remaining");
    auto reset = header_number(resp, "X-RateLimit-Reset");
    if (remaining && *remaining == 0 && reset) {
      return Outcome::PrimaryLimit;
    }
    // X-RateLimit-Used alone, with no remaining quota reported, comes with
    // secondary limits.
    const bool used_only = !remaining && header_value(resp, "X-RateLimit-Used");
    if (header_value(resp, "Retry-After") || used_only ||
        mentions_secondary_limit(resp.body)) {
      return Outcome::SecondaryLimit;
    }
    return Outcome::Done;
  }
  if (resp.status_code == 429) {
    return Outcome::SecondaryLimit;
  }
  if (resp.status_code >= 500) {
    return Outcome::ServerError;
  }
  return Outcome::Done;
}

std::chrono::milliseconds until_reset(long long reset_epoch,
                                      std::chrono::milliseconds margin) {
  auto reset_time = std::chrono::system_clock::time_point(
      std::chrono::seconds(reset_epoch));
  auto now = std::chrono::system_clock::now();
  std::chrono::milliseconds wait{0};
  if (reset_time > now) {
    wait = std::chrono::duration_cast<std::chrono::milliseconds>(reset_time -
                                                                 now);
  }
  return wait + margin;
}

} // namespace

RetriesExhausted::RetriesExhausted(std::string url, long last_status,
                                   int attempts)
    : std::runtime_error("Exhausted retries for " + url + " after " +
                         std::to_string(attempts) + " attempts (last status " +
                         std::to_string(last_status) + ")"),
      url_(std::move(url)), last_status_(last_status), attempts_(attempts) {}

RetryingHttpClient::RetryingHttpClient(std::unique_ptr<HttpClient> inner,
                                       RetryPolicy policy, Sleeper sleeper)
    : inner_(std::move(inner)), policy_(policy), sleep_(std::move(sleeper)) {
  if (!inner_) {
    throw std::invalid_argument("RetryingHttpClient requires a transport");
  }
  policy_.max_attempts = std::max(1, policy_.max_attempts);
  if (!sleep_) {
    sleep_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
  }
}

HttpResponse RetryingHttpClient::get(const std::string &url,
                                     const std::vector<std::string> &headers) {
  long last_status = 0;
  for (int attempt = 1; attempt <= policy_.max_attempts; ++attempt) {
    HttpResponse resp;
    try {
      resp = inner_->get(url, headers);
    } catch (const TransientNetworkError &e) {
      last_status = 0;
      retry_log()->warn("Transport error on {} (attempt {}/{}): {}", url,
                        attempt, policy_.max_attempts, e.what());
      if (attempt < policy_.max_attempts) {
        sleep_(policy_.server_backoff * attempt);
      }
      continue;
    }
    last_status = resp.status_code;
    std::chrono::milliseconds wait{0};
    switch (classify(resp)) {
    case Outcome::Done:
      return resp;
    case Outcome::PrimaryLimit:
      wait = until_reset(*header_number(resp, "X-RateLimit-Reset"),
                         policy_.rate_limit_margin);
      retry_log()->warn("Primary rate limit hit. Sleeping {} ms", wait.count());
      break;
    case Outcome::SecondaryLimit:
      wait = policy_.secondary_backoff * attempt;
      retry_log()->warn("Secondary rate limit on {} (HTTP {}). Sleeping {} ms",
                        url, resp.status_code, wait.count());
      break;
    case Outcome::ServerError:
      wait = policy_.server_backoff * attempt;
      retry_log()->warn("HTTP {} from {} (attempt {}/{}). Sleeping {} ms",
                        resp.status_code, url, attempt, policy_.max_attempts,
                        wait.count());
      break;
    }
    // The discarded response is dropped here, before the next request.
    if (attempt < policy_.max_attempts) {
      sleep_(wait);
    }
  }
  retry_log()->error("Exhausted retries for {}", url);
  throw RetriesExhausted(url, last_status, policy_.max_attempts);
}

} // namespace wfh
