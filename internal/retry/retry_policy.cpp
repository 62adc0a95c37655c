#include "internal/retry/retry_policy.hpp"

#include <algorithm>

namespace satp::retry {

ExponentialBackoffPolicy::ExponentialBackoffPolicy(std::chrono::milliseconds initial_backoff, std::chrono::milliseconds max_backoff)
    : initial_backoff_(initial_backoff), max_backoff_(std::max(max_backoff, initial_backoff)) {
}

RetryDecision ExponentialBackoffPolicy::Decide(const RetryContext& ctx) const {
  if (ctx.attempt_count >= ctx.max_retries) {
    return RetryDecision::Abort();
  }

  const bool bounded = ctx.max_timeout.count() > 0;
  if (bounded && ctx.elapsed >= ctx.max_timeout) {
    return RetryDecision::Abort();
  }

  // shift is capped so the multiplication cannot overflow
  const auto shift = std::min<uint32_t>(ctx.attempt_count == 0 ? 0 : ctx.attempt_count - 1, 20);
  auto       delay = std::min(initial_backoff_ * (int64_t{1} << shift), max_backoff_);

  if (bounded) {
    delay = std::min(delay, ctx.max_timeout - ctx.elapsed);
  }
  return RetryDecision::Retry(delay);
}

} // namespace satp::retry
