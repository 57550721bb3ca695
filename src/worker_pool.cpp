#include "worker_pool.hpp"
#include "log.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace wfh {

namespace {

std::shared_ptr<spdlog::logger> pool_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("pool");
  }();
  return logger;
}

} // namespace

WorkerPool::WorkerPool(int workers) : workers_(std::max(1, workers)) {}

/**
 * Stop the worker pool on destruction.
 */
WorkerPool::~WorkerPool() { stop(); }

/**
 * Start worker threads if not already running.
 */
void WorkerPool::start() {
  if (running_)
    return;
  running_ = true;
  threads_.reserve(workers_);
  for (int i = 0; i < workers_; ++i) {
    threads_.emplace_back(&WorkerPool::worker, this);
  }
  pool_log()->debug("Started {} workers", workers_);
}

/**
 * Stop worker threads and clear pending jobs.
 */
void WorkerPool::stop() {
  if (!running_)
    return;
  std::size_t dropped = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    running_ = false;
    dropped = jobs_.size();
    std::queue<ScheduledJob> empty;
    jobs_.swap(empty);
    queued_.store(0, std::memory_order_relaxed);
  }
  cv_.notify_all();
  for (auto &t : threads_) {
    if (t.joinable())
      t.join();
  }
  threads_.clear();
  if (dropped > 0) {
    pool_log()->warn("Discarded {} queued jobs on shutdown", dropped);
  }
}

std::future<void> WorkerPool::submit(std::string name,
                                     std::function<void()> job) {
  if (!running_) {
    std::packaged_task<void()> pt(std::move(job));
    auto fut = pt.get_future();
    pt();
    completed_.fetch_add(1, std::memory_order_relaxed);
    return fut;
  }
  auto task = std::make_shared<std::packaged_task<void()>>(std::move(job));
  std::future<void> fut = task->get_future();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    jobs_.push(ScheduledJob{std::move(name), task});
    queued_.fetch_add(1, std::memory_order_relaxed);
  }
  cv_.notify_one();
  return fut;
}

std::size_t WorkerPool::outstanding_jobs() const {
  return queued_.load(std::memory_order_relaxed) +
         in_flight_.load(std::memory_order_relaxed);
}

/**
 * Worker thread loop processing queued jobs.
 */
void WorkerPool::worker() {
  while (true) {
    ScheduledJob job;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      cv_.wait(lock, [this] { return !running_ || !jobs_.empty(); });
      if (!running_)
        return;
      job = std::move(jobs_.front());
      jobs_.pop();
      queued_.fetch_sub(1, std::memory_order_relaxed);
      in_flight_.fetch_add(1, std::memory_order_relaxed);
    }
    pool_log()->trace("Running {}", job.name);
    (*job.task)();
    in_flight_.fetch_sub(1, std::memory_order_relaxed);
    completed_.fetch_add(1, std::memory_order_relaxed);
  }
}

} // namespace wfh
