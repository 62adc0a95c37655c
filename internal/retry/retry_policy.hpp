#pragma once

#include <chrono>
#include <cstdint>

namespace satp::retry {

/*
  Inputs for one retry decision. attempt_count is the number of failed
  attempts made so far in the current stage; elapsed is measured from
  stage entry.
*/
struct RetryContext {
  uint32_t                  attempt_count = 0;
  uint32_t                  max_retries   = 0;
  std::chrono::milliseconds max_timeout{0};
  std::chrono::milliseconds elapsed{0};
};

struct RetryDecision {
  enum class Action { kRetry, kAbort };

  Action                    action = Action::kAbort;
  std::chrono::milliseconds delay{0};

  static RetryDecision Retry(std::chrono::milliseconds delay) {
    return {Action::kRetry, delay};
  }
  static RetryDecision Abort() {
    return {Action::kAbort, std::chrono::milliseconds(0)};
  }

  bool ShouldRetry() const {
    return action == Action::kRetry;
  }
};

class RetryPolicy {
 public:
  virtual ~RetryPolicy() = default;

  virtual RetryDecision Decide(const RetryContext& ctx) const = 0;
};

/*
  Exponential backoff: initial * 2^(attempt-1), capped by max_backoff and
  by the time left before max_timeout.

  Aborts when max_retries attempts have been spent or the stage deadline
  has passed. max_retries counts total attempts, so max_retries=3 allows
  exactly three calls. A zero max_timeout means no deadline.
*/
class ExponentialBackoffPolicy final : public RetryPolicy {
 public:
  ExponentialBackoffPolicy(std::chrono::milliseconds initial_backoff, std::chrono::milliseconds max_backoff);

  RetryDecision Decide(const RetryContext& ctx) const override;

 private:
  std::chrono::milliseconds initial_backoff_;
  std::chrono::milliseconds max_backoff_;
};

} // namespace satp::retry
