#include "internal/retry/clock.hpp"

namespace satp::retry {

bool InterruptibleSleeper::Sleep(std::chrono::milliseconds delay) {
  std::unique_lock lock(mutex_);
  return !cv_.wait_for(lock, delay, [this] { return cancelled_; });
}

void InterruptibleSleeper::Cancel() {
  {
    std::lock_guard lock(mutex_);
    cancelled_ = true;
  }
  cv_.notify_all();
}

bool InterruptibleSleeper::Cancelled() const {
  std::lock_guard lock(mutex_);
  return cancelled_;
}

} // namespace satp::retry
