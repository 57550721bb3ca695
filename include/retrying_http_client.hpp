/**
 * @file retrying_http_client.hpp
 * @brief HTTP client decorator that retries rate limited and failing calls.
 */
#ifndef WORKFLOWHARVEST_RETRYING_HTTP_CLIENT_HPP
#define WORKFLOWHARVEST_RETRYING_HTTP_CLIENT_HPP

#include "http_client.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace wfh {

/// Tunables for RetryingHttpClient.
struct RetryPolicy {
  int max_attempts{6}; ///< Total requests issued before giving up
  std::chrono::milliseconds server_backoff{500};    ///< Per-attempt step on 5xx
  std::chrono::milliseconds secondary_backoff{1000}; ///< Per-attempt step on
                                                     ///< secondary limits
  std::chrono::milliseconds rate_limit_margin{1000}; ///< Added after a reset
};

/**
 * Raised once every attempt of a request ended in a retryable outcome.
 */
class RetriesExhausted : public std::runtime_error {
public:
  RetriesExhausted(std::string url, long last_status, int attempts);

  /// Request target that could not be completed.
  const std::string &url() const noexcept { return url_; }

  /// Status of the final attempt, zero when it failed at transport level.
  long last_status() const noexcept { return last_status_; }

  /// Number of requests issued.
  int attempts() const noexcept { return attempts_; }

private:
  std::string url_;
  long last_status_;
  int attempts_;
};

/**
 * Decorates another HttpClient with the GitHub retry rules.
 *
 * Per attempt:
 * - 403 with `X-RateLimit-Remaining: 0` and a reset epoch sleeps until the
 *   reset plus RetryPolicy::rate_limit_margin;
 * - 403 with a secondary rate limit signal, and 429, back off linearly by
 *   RetryPolicy::secondary_backoff;
 * - 5xx and transport errors back off linearly by
 *   RetryPolicy::server_backoff;
 * - every other response is returned as is.
 *
 * All waits share one attempt counter bounded by RetryPolicy::max_attempts.
 */
class RetryingHttpClient : public HttpClient {
public:
  using Sleeper = std::function<void(std::chrono::milliseconds)>;

  /**
   * @param inner Transport performing the real requests.
   * @param policy Attempt budget and backoff steps.
   * @param sleeper Wait primitive; defaults to std::this_thread::sleep_for.
   */
  RetryingHttpClient(std::unique_ptr<HttpClient> inner, RetryPolicy policy = {},
                     Sleeper sleeper = {});

  /// @copydoc HttpClient::get()
  /// @throws RetriesExhausted When the attempt budget is used up.
  HttpResponse get(const std::string &url,
                   const std::vector<std::string> &headers) override;

private:
  std::unique_ptr<HttpClient> inner_;
  RetryPolicy policy_;
  Sleeper sleep_;
};

} // namespace wfh

#endif // WORKFLOWHARVEST_RETRYING_HTTP_CLIENT_HPP
