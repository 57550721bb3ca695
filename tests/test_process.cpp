#include "process.hpp"
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <thread>

using namespace wfh;

TEST_CASE("captures output and exit status", "[process]") {
  ProcessResult res =
      run_process({"sh", "-c", "printf out; printf err >&2; exit 3"});
  CHECK(res.exit_code == 3);
  CHECK(res.out == "out");
  CHECK(res.err == "err");
  CHECK_FALSE(res.timed_out);
  CHECK_FALSE(res.cancelled);
}

TEST_CASE("honours working directory and environment", "[process]") {
  ProcessOptions opts;
  opts.cwd = "/";
  opts.env = {{"WFH_PROBE", "42"}};
  ProcessResult res = run_process({"sh", "-c", "pwd; echo $WFH_PROBE"}, opts);
  CHECK(res.exit_code == 0);
  CHECK(res.out == "/\n42\n");
}

TEST_CASE("large output does not deadlock", "[process]") {
  ProcessResult res = run_process(
      {"sh", "-c", "head -c 1000000 /dev/zero | tr '\\0' a"});
  CHECK(res.exit_code == 0);
  CHECK(res.out.size() == 1000000);
}

TEST_CASE("missing executable exits with 127", "[process]") {
  ProcessResult res = run_process({"wfh-definitely-not-a-command"});
  CHECK(res.exit_code == 127);
}

TEST_CASE("deadline kills the process group", "[process]") {
  ProcessOptions opts;
  opts.timeout = std::chrono::milliseconds(200);
  auto start = std::chrono::steady_clock::now();
  ProcessResult res = run_process({"sh", "-c", "sleep 30 & sleep 30"}, opts);
  auto elapsed = std::chrono::steady_clock::now() - start;
  CHECK(res.timed_out);
  CHECK(elapsed < std::chrono::seconds(5));
}

TEST_CASE("cancellation stops a running command", "[process]") {
  CancellationToken token;
  ProcessOptions opts;
  opts.cancel = &token;
  std::thread canceller([&token] {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    token.cancel();
  });
  auto start = std::chrono::steady_clock::now();
  ProcessResult res = run_process({"sleep", "30"}, opts);
  canceller.join();
  CHECK(res.cancelled);
  CHECK(std::chrono::steady_clock::now() - start < std::chrono::seconds(5));
}

TEST_CASE("empty command line is rejected", "[process]") {
  REQUIRE_THROWS_AS(run_process({}), std::runtime_error);
}
