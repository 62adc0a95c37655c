#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace satp::retry {

// Monotonic time source for stage deadlines.
class Clock {
 public:
  using TimePoint = std::chrono::steady_clock::time_point;

  virtual ~Clock() = default;
  virtual TimePoint Now() const = 0;
};

class SteadyClock final : public Clock {
 public:
  TimePoint Now() const override {
    return std::chrono::steady_clock::now();
  }
};

/*
  Backoff waits. Sleep returns false when the wait was cut short by
  Cancel(); after Cancel() every later Sleep returns false immediately.
*/
class Sleeper {
 public:
  virtual ~Sleeper() = default;

  virtual bool Sleep(std::chrono::milliseconds delay) = 0;
  virtual void Cancel() = 0;
  virtual bool Cancelled() const = 0;
};

class InterruptibleSleeper final : public Sleeper {
 public:
  bool Sleep(std::chrono::milliseconds delay) override;
  void Cancel() override;
  bool Cancelled() const override;

 private:
  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  bool                    cancelled_ = false;
};

} // namespace satp::retry
