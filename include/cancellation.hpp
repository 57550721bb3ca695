/**
 * @file cancellation.hpp
 * @brief Cooperative cancellation shared between the crawler and its jobs.
 */
#ifndef WORKFLOWHARVEST_CANCELLATION_HPP
#define WORKFLOWHARVEST_CANCELLATION_HPP

#include <atomic>
#include <stdexcept>
#include <string>

namespace wfh {

/// Raised by long running operations that observed a cancellation request.
class OperationCancelled : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/**
 * One-way cancellation flag.
 *
 * The crawler's watchdog sets it; blocking operations (permit waits, git
 * subprocesses, revision loops) poll it and stop at the next safe point.
 */
class CancellationToken {
public:
  void cancel() noexcept { cancelled_.store(true, std::memory_order_release); }

  bool cancelled() const noexcept {
    return cancelled_.load(std::memory_order_acquire);
  }

  /// @throws OperationCancelled naming @p what when the flag is set.
  void throw_if_cancelled(const std::string &what) const {
    if (cancelled()) {
      throw OperationCancelled(what + " cancelled");
    }
  }

private:
  std::atomic<bool> cancelled_{false};
};

} // namespace wfh

#endif // WORKFLOWHARVEST_CANCELLATION_HPP
