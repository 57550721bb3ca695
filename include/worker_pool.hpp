/**
 * @file worker_pool.hpp
 * @brief Fixed size thread pool executing repository jobs.
 *
 * Jobs are I/O bound (network, `git` subprocesses, file writes), so the pool
 * is sized generously and concurrency of the expensive phase is bounded
 * separately by ClonePermits.
 */
#ifndef WORKFLOWHARVEST_WORKER_POOL_HPP
#define WORKFLOWHARVEST_WORKER_POOL_HPP

#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace wfh {

/**
 * Thread pool with a FIFO job queue.
 */
class WorkerPool {
public:
  /// @param workers Number of worker threads (at least one).
  explicit WorkerPool(int workers);

  /// Destructor stops the worker threads.
  ~WorkerPool();

  WorkerPool(const WorkerPool &) = delete;
  WorkerPool &operator=(const WorkerPool &) = delete;

  /// Start the worker threads.
  void start();

  /**
   * Stop the worker threads.
   *
   * Running jobs finish; jobs still queued are discarded and their futures
   * report `std::future_errc::broken_promise`.
   */
  void stop();

  /**
   * Submit a job for execution.
   *
   * When the pool is not running the job executes synchronously on the
   * calling thread.
   *
   * @param name Label used in log lines.
   * @param job Callable to execute on a worker thread.
   * @return Future that becomes ready once the job completes; exceptions
   *         escaping the job are stored in it.
   */
  std::future<void> submit(std::string name, std::function<void()> job);

  /// Number of queued plus running jobs.
  std::size_t outstanding_jobs() const;

  /// Jobs that finished, with or without an exception.
  std::size_t completed_jobs() const {
    return completed_.load(std::memory_order_relaxed);
  }

  int workers() const { return workers_; }

private:
  struct ScheduledJob {
    std::string name;
    std::shared_ptr<std::packaged_task<void()>> task;
  };

  void worker();

  int workers_;
  std::atomic<bool> running_{false};
  std::vector<std::thread> threads_;
  std::queue<ScheduledJob> jobs_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::atomic<std::size_t> queued_{0};
  std::atomic<std::size_t> in_flight_{0};
  std::atomic<std::size_t> completed_{0};
};

} // namespace wfh

#endif // WORKFLOWHARVEST_WORKER_POOL_HPP
