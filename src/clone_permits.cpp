#include "clone_permits.hpp"
#include <algorithm>

namespace wfh {

namespace {
// Cancellation is polled; nobody notifies the condition variable on cancel.
constexpr auto kCancelPoll = std::chrono::milliseconds(100);
} // namespace

ClonePermits::ClonePermits(int permits)
    : capacity_(std::max(1, permits)), available_(capacity_) {}

void ClonePermits::acquire(const CancellationToken *cancel) {
  std::unique_lock<std::mutex> lock(mutex_);
  while (available_ == 0) {
    if (cancel != nullptr) {
      cancel->throw_if_cancelled("Waiting for a clone permit");
    }
    cv_.wait_for(lock, kCancelPoll);
  }
  if (cancel != nullptr) {
    cancel->throw_if_cancelled("Waiting for a clone permit");
  }
  --available_;
}

void ClonePermits::release() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    available_ = std::min(capacity_, available_ + 1);
  }
  cv_.notify_one();
}

int ClonePermits::available() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return available_;
}

void ClonePermits::Lease::acquire(const CancellationToken &cancel) {
  permits_.acquire(&cancel);
  std::lock_guard<std::mutex> lock(mutex_);
  // A supervisor cancels before it calls release(), so a cancel that raced
  // the acquire is visible here.
  if (cancel.cancelled()) {
    permits_.release();
    cancel.throw_if_cancelled("Waiting for a clone permit");
  }
  held_ = true;
}

bool ClonePermits::Lease::release() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!held_) {
      return false;
    }
    held_ = false;
  }
  permits_.release();
  return true;
}

bool ClonePermits::Lease::held() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return held_;
}

} // namespace wfh
