#include "ftr/resilience/retry_policy.h"

#include <algorithm>

namespace ftr::resilience {

namespace {

// Caps the exponent so the shift cannot overflow.
constexpr int kMaxBackoffShift = 20;

}  // namespace

core::Result<bool, core::Error> validate_retry_policy(const RetryPolicy& policy) {
  using R = core::Result<bool, core::Error>;

  if (policy.max_attempts < 1) {
    return R::err(
        core::make_error(core::ErrorKind::kInvalidConfig, "max_attempts must be >= 1"));
  }
  if (policy.base_delay.count() < 0 || policy.max_jitter.count() < 0) {
    return R::err(core::make_error(core::ErrorKind::kInvalidConfig,
                                   "retry delays must be non-negative"));
  }
  return R::ok(true);
}

core::Duration RandomJitter::next(const core::Duration max) {
  if (max <= core::Duration::zero()) {
    return core::Duration::zero();
  }
  std::uniform_int_distribution<core::Duration::rep> dist(0, max.count());
  std::lock_guard<std::mutex> lock(mutex_);
  return core::Duration{dist(engine_)};
}

core::Duration backoff_delay(const RetryPolicy& policy, const int attempt,
                             IJitterSource& jitter) {
  const int shift = std::clamp(attempt - 1, 0, kMaxBackoffShift);
  const core::Duration base = std::chrono::duration_cast<core::Duration>(policy.base_delay);
  const core::Duration jitter_max = std::chrono::duration_cast<core::Duration>(policy.max_jitter);
  return base * (std::int64_t{1} << shift) + jitter.next(jitter_max);
}

}  // namespace ftr::resilience
