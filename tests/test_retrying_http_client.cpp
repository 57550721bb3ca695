#include "retrying_http_client.hpp"
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <ctime>
#include <deque>
#include <memory>
#include <string>
#include <vector>

using namespace wfh;

namespace {

/// Replays a scripted list of responses; throws for status -1.
class ScriptedHttpClient : public HttpClient {
public:
  explicit ScriptedHttpClient(std::deque<HttpResponse> script, int *calls)
      : script_(std::move(script)), calls_(calls) {}

  HttpResponse get(const std::string &,
                   const std::vector<std::string> &) override {
    ++*calls_;
    if (script_.empty()) {
      HttpResponse ok;
      ok.status_code = 200;
      return ok;
    }
    HttpResponse next = script_.front();
    if (script_.size() > 1) {
      script_.pop_front();
    }
    if (next.status_code == -1) {
      throw TransientNetworkError("connection reset");
    }
    return next;
  }

private:
  std::deque<HttpResponse> script_;
  int *calls_;
};

HttpResponse status(long code, std::vector<std::string> headers = {},
                    std::string body = {}) {
  HttpResponse r;
  r.status_code = code;
  r.headers = std::move(headers);
  r.body = std::move(body);
  return r;
}

struct SleepLog {
  std::vector<std::chrono::milliseconds> waits;
  RetryingHttpClient::Sleeper sleeper() {
    return [this](std::chrono::milliseconds d) { waits.push_back(d); };
  }
};

} // namespace

TEST_CASE("server errors are retried with linear backoff") {
  int calls = 0;
  SleepLog sleeps;
  RetryingHttpClient client(
      std::make_unique<ScriptedHttpClient>(
          std::deque<HttpResponse>{status(500), status(502),
                                   status(200, {}, "[]")},
          &calls),
      RetryPolicy{}, sleeps.sleeper());
  auto res = client.get("https://api.example/x", {});
  REQUIRE(res.status_code == 200);
  REQUIRE(res.body == "[]");
  REQUIRE(calls == 3);
  REQUIRE(sleeps.waits.size() == 2);
  CHECK(sleeps.waits[0] == std::chrono::milliseconds(500));
  CHECK(sleeps.waits[1] == std::chrono::milliseconds(1000));
}

TEST_CASE("persistent server errors exhaust the attempt budget") {
  int calls = 0;
  SleepLog sleeps;
  RetryingHttpClient client(
      std::make_unique<ScriptedHttpClient>(
          std::deque<HttpResponse>{status(500)}, &calls),
      RetryPolicy{}, sleeps.sleeper());
  try {
    client.get("https://api.example/y", {});
    FAIL("expected RetriesExhausted");
  } catch (const RetriesExhausted &e) {
    CHECK(e.attempts() == 6);
    CHECK(e.last_status() == 500);
    CHECK(e.url() == "https://api.example/y");
  }
  REQUIRE(calls == 6);
  // No wait after the final attempt.
  REQUIRE(sleeps.waits.size() == 5);
}

TEST_CASE("transport errors count against the same budget") {
  int calls = 0;
  SleepLog sleeps;
  RetryPolicy policy;
  policy.max_attempts = 3;
  RetryingHttpClient client(
      std::make_unique<ScriptedHttpClient>(
          std::deque<HttpResponse>{status(-1)}, &calls),
      policy, sleeps.sleeper());
  REQUIRE_THROWS_AS(client.get("https://api.example/z", {}), RetriesExhausted);
  REQUIRE(calls == 3);
}

TEST_CASE("primary rate limit sleeps until the reset") {
  int calls = 0;
  SleepLog sleeps;
  const auto reset = std::time(nullptr) + 30;
  RetryingHttpClient client(
      std::make_unique<ScriptedHttpClient>(
          std::deque<HttpResponse>{
              status(403,
                     {"X-RateLimit-Remaining: 0",
                      "x-ratelimit-reset: " + std::to_string(reset)},
                     "{\"message\":\"API rate limit exceeded\"}"),
              status(200)},
          &calls),
      RetryPolicy{}, sleeps.sleeper());
  REQUIRE(client.get("https://api.example/orgs", {}).status_code == 200);
  REQUIRE(calls == 2);
  REQUIRE(sleeps.waits.size() == 1);
  // Reset is ~30 s away, plus the one second margin.
  CHECK(sleeps.waits[0] > std::chrono::seconds(25));
  CHECK(sleeps.waits[0] <= std::chrono::seconds(31));
}

TEST_CASE("secondary limits back off by the secondary step") {
  int calls = 0;
  SleepLog sleeps;
  RetryingHttpClient client(
      std::make_unique<ScriptedHttpClient>(
          std::deque<HttpResponse>{
              status(403, {},
                     "{\"message\":\"You have exceeded a secondary rate "
                     "limit\"}"),
              status(429), status(200)},
          &calls),
      RetryPolicy{}, sleeps.sleeper());
  REQUIRE(client.get("https://api.example/s", {}).status_code == 200);
  REQUIRE(calls == 3);
  REQUIRE(sleeps.waits.size() == 2);
  CHECK(sleeps.waits[0] == std::chrono::milliseconds(1000));
  CHECK(sleeps.waits[1] == std::chrono::milliseconds(2000));
}

TEST_CASE("403 with only X-RateLimit-Used is a secondary limit") {
  int calls = 0;
  SleepLog sleeps;
  RetryingHttpClient client(
      std::make_unique<ScriptedHttpClient>(
          std::deque<HttpResponse>{
              status(403, {"X-RateLimit-Used: 61"}, "{\"message\":\"no\"}"),
              status(200)},
          &calls),
      RetryPolicy{}, sleeps.sleeper());
  REQUIRE(client.get("https://api.example/u", {}).status_code == 200);
  REQUIRE(calls == 2);
  REQUIRE(sleeps.waits.size() == 1);
  CHECK(sleeps.waits[0] == std::chrono::milliseconds(1000));

  // With quota still reported, the same 403 is a plain refusal.
  int quota_calls = 0;
  RetryingHttpClient quota(
      std::make_unique<ScriptedHttpClient>(
          std::deque<HttpResponse>{status(
              403, {"X-RateLimit-Used: 61", "X-RateLimit-Remaining: 4939"})},
          &quota_calls),
      RetryPolicy{}, sleeps.sleeper());
  REQUIRE(quota.get("https://api.example/u", {}).status_code == 403);
  REQUIRE(quota_calls == 1);
}

TEST_CASE("client errors are returned without retrying") {
  int calls = 0;
  SleepLog sleeps;
  RetryingHttpClient client(
      std::make_unique<ScriptedHttpClient>(
          std::deque<HttpResponse>{status(404)}, &calls),
      RetryPolicy{}, sleeps.sleeper());
  REQUIRE(client.get("https://api.example/missing", {}).status_code == 404);
  REQUIRE(calls == 1);
  REQUIRE(sleeps.waits.empty());

  int plain_calls = 0;
  RetryingHttpClient forbidden(
      std::make_unique<ScriptedHttpClient>(
          std::deque<HttpResponse>{status(403, {}, "{\"message\":\"nope\"}")},
          &plain_calls),
      RetryPolicy{}, sleeps.sleeper());
  REQUIRE(forbidden.get("https://api.example/private", {}).status_code == 403);
  REQUIRE(plain_calls == 1);
}

TEST_CASE("header lookup ignores case and trims") {
  HttpResponse r = status(200, {"Content-Type: text/plain",
                                "X-RateLimit-Remaining:   42  "});
  REQUIRE(header_value(r, "x-ratelimit-remaining") == std::string("42"));
  REQUIRE_FALSE(header_value(r, "Retry-After").has_value());
}
