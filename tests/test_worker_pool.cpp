#include "clone_permits.hpp"
#include "worker_pool.hpp"
#include <atomic>
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <future>
#include <thread>
#include <vector>

using namespace wfh;

TEST_CASE("worker pool runs tasks concurrently") {
  WorkerPool p(2);
  p.start();
  std::atomic<int> count{0};
  auto start = std::chrono::steady_clock::now();
  auto f1 = p.submit("a", [&] {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    ++count;
  });
  auto f2 = p.submit("b", [&] {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    ++count;
  });
  f1.get();
  f2.get();
  auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                     std::chrono::steady_clock::now() - start)
                     .count();
  p.stop();
  REQUIRE(count == 2);
  REQUIRE(elapsed < 180);
  REQUIRE(p.completed_jobs() == 2);
}

TEST_CASE("worker pool handles more tasks than workers") {
  WorkerPool p(2);
  p.start();
  std::atomic<int> count{0};
  std::vector<std::future<void>> futs;
  for (int i = 0; i < 6; ++i) {
    futs.push_back(p.submit("job", [&] {
      std::this_thread::sleep_for(std::chrono::milliseconds(20));
      ++count;
    }));
  }
  for (auto &f : futs) {
    f.get();
  }
  REQUIRE(count == 6);
  REQUIRE(p.outstanding_jobs() == 0);
}

TEST_CASE("job exceptions reach the future") {
  WorkerPool p(1);
  p.start();
  auto f = p.submit("boom", [] { throw std::runtime_error("boom"); });
  REQUIRE_THROWS_AS(f.get(), std::runtime_error);
  auto ok = p.submit("after", [] {});
  REQUIRE_NOTHROW(ok.get());
}

TEST_CASE("stopped pool runs jobs inline") {
  WorkerPool p(0);
  REQUIRE(p.workers() == 1);
  bool ran = false;
  p.submit("inline", [&] { ran = true; }).get();
  REQUIRE(ran);
}

TEST_CASE("stop discards queued jobs") {
  WorkerPool p(1);
  p.start();
  std::promise<void> gate;
  std::promise<void> started;
  auto opened = gate.get_future().share();
  auto running = p.submit("blocker", [opened, &started] {
    started.set_value();
    opened.wait();
  });
  started.get_future().wait();
  auto queued = p.submit("queued", [] {});
  std::thread releaser([&gate] {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    gate.set_value();
  });
  p.stop();
  releaser.join();
  REQUIRE_NOTHROW(running.get());
  // The queued task was destroyed unrun.
  REQUIRE_THROWS_AS(queued.get(), std::future_error);
}

TEST_CASE("clone permits bound concurrency") {
  ClonePermits permits(2);
  REQUIRE(permits.capacity() == 2);
  WorkerPool p(6);
  p.start();
  std::atomic<int> active{0};
  std::atomic<int> peak{0};
  std::vector<std::future<void>> futs;
  for (int i = 0; i < 6; ++i) {
    futs.push_back(p.submit("clone", [&] {
      ClonePermits::Guard guard(permits, nullptr);
      int now = ++active;
      int seen = peak.load();
      while (now > seen && !peak.compare_exchange_weak(seen, now)) {
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(30));
      --active;
    }));
  }
  for (auto &f : futs) {
    f.get();
  }
  REQUIRE(peak.load() <= 2);
  REQUIRE(permits.available() == 2);
}

TEST_CASE("waiting for a permit observes cancellation") {
  ClonePermits permits(1);
  permits.acquire();
  CancellationToken token;
  std::thread canceller([&token] {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    token.cancel();
  });
  auto start = std::chrono::steady_clock::now();
  REQUIRE_THROWS_AS(permits.acquire(&token), OperationCancelled);
  canceller.join();
  REQUIRE(std::chrono::steady_clock::now() - start <
          std::chrono::seconds(2));
  permits.release();
  REQUIRE(permits.available() == 1);
}

TEST_CASE("lease is returned once by whoever releases first") {
  ClonePermits permits(1);
  CancellationToken token;
  ClonePermits::Lease lease(permits);
  lease.acquire(token);
  REQUIRE(lease.held());
  REQUIRE(permits.available() == 0);

  // Supervisor reclaims the permit; the holder's own release is a no-op.
  token.cancel();
  REQUIRE(lease.release());
  REQUIRE(permits.available() == 1);
  REQUIRE_FALSE(lease.release());
  REQUIRE(permits.available() == 1);
}

TEST_CASE("lease is not held when acquired with a cancelled token") {
  ClonePermits permits(1);
  CancellationToken token;
  token.cancel();
  {
    ClonePermits::Lease lease(permits);
    REQUIRE_THROWS_AS(lease.acquire(token), OperationCancelled);
    REQUIRE_FALSE(lease.held());
  }
  REQUIRE(permits.available() == 1);
}
