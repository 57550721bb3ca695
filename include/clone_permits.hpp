/**
 * @file clone_permits.hpp
 * @brief Counting semaphore bounding concurrent clone/walk phases.
 */
#ifndef WORKFLOWHARVEST_CLONE_PERMITS_HPP
#define WORKFLOWHARVEST_CLONE_PERMITS_HPP

#include "cancellation.hpp"
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace wfh {

/**
 * Counting semaphore whose acquire honours a CancellationToken.
 */
class ClonePermits {
public:
  explicit ClonePermits(int permits);

  /**
   * Block until a permit is free.
   *
   * @throws OperationCancelled When @p cancel is set before a permit becomes
   *         available.
   */
  void acquire(const CancellationToken *cancel = nullptr);

  void release();

  int available() const;
  int capacity() const { return capacity_; }

  /// RAII holder releasing its permit on destruction.
  class Guard {
  public:
    Guard(ClonePermits &permits, const CancellationToken *cancel)
        : permits_(permits) {
      permits_.acquire(cancel);
    }
    ~Guard() { permits_.release(); }
    Guard(const Guard &) = delete;
    Guard &operator=(const Guard &) = delete;

  private:
    ClonePermits &permits_;
  };

  /**
   * Permit that the job holding it or a supervisor may give back, whichever
   * comes first. Lets a watchdog reclaim the permit of a job that keeps
   * running after it was cancelled.
   */
  class Lease {
  public:
    explicit Lease(ClonePermits &permits) : permits_(permits) {}
    ~Lease() { release(); }
    Lease(const Lease &) = delete;
    Lease &operator=(const Lease &) = delete;

    /**
     * Block until a permit is free and hold it.
     *
     * @throws OperationCancelled When @p cancel is set before or while the
     *         permit is taken; the permit is not held afterwards.
     */
    void acquire(const CancellationToken &cancel);

    /// Return the permit if still held; later calls do nothing.
    bool release();

    bool held() const;

  private:
    ClonePermits &permits_;
    mutable std::mutex mutex_;
    bool held_{false};
  };

private:
  int capacity_;
  int available_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
};

} // namespace wfh

#endif // WORKFLOWHARVEST_CLONE_PERMITS_HPP
