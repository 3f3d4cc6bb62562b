#include "ftr/resilience/token_bucket.h"

#include <algorithm>
#include <cmath>
#include <string>

namespace ftr::resilience {

namespace {

// Absorbs rounding in the refill arithmetic after a computed wait.
constexpr double kTokenEpsilon = 1e-9;

}  // namespace

TokenBucketConfig TokenBucketConfig::from_requests_per_minute(
    const int rpm, const std::chrono::milliseconds max_wait) {
  TokenBucketConfig config;
  config.capacity = static_cast<double>(rpm);
  config.refill_per_second = static_cast<double>(rpm) / 60.0;
  config.max_wait = max_wait;
  return config;
}

core::Result<bool, core::Error> validate_bucket_config(const TokenBucketConfig& config) {
  using R = core::Result<bool, core::Error>;

  if (!(config.capacity >= 1.0)) {
    return R::err(
        core::make_error(core::ErrorKind::kInvalidConfig, "bucket capacity must be >= 1"));
  }
  if (!(config.refill_per_second > 0.0)) {
    return R::err(
        core::make_error(core::ErrorKind::kInvalidConfig, "bucket refill rate must be > 0"));
  }
  if (config.max_wait.count() < 0) {
    return R::err(
        core::make_error(core::ErrorKind::kInvalidConfig, "bucket max_wait must be >= 0"));
  }
  return R::ok(true);
}

TokenBucket::TokenBucket(TokenBucketConfig config, core::IClock& clock)
    : config_(config), clock_(clock), tokens_(config.capacity), last_refill_(clock.now()) {}

void TokenBucket::refill_locked(const core::Instant now) {
  if (now <= last_refill_) {
    return;
  }
  const double elapsed = std::chrono::duration<double>(now - last_refill_).count();
  tokens_ = std::min(config_.capacity, tokens_ + elapsed * config_.refill_per_second);
  last_refill_ = now;
}

core::Result<AcquireReceipt, core::Error> TokenBucket::acquire(
    const core::CancellationToken& cancellation) {
  using R = core::Result<AcquireReceipt, core::Error>;

  AcquireReceipt receipt;
  const core::Duration max_wait = std::chrono::duration_cast<core::Duration>(config_.max_wait);

  for (;;) {
    if (cancellation.is_cancelled()) {
      return R::err(core::make_error(core::ErrorKind::kCancelled,
                                     "request cancelled while waiting for rate limiter"));
    }

    core::Duration wait{};
    {
      std::lock_guard<std::mutex> lock(mutex_);
      refill_locked(clock_.now());
      if (tokens_ + kTokenEpsilon >= 1.0) {
        tokens_ = std::max(0.0, tokens_ - 1.0);
        return R::ok(receipt);
      }
      const double seconds = (1.0 - tokens_) / config_.refill_per_second;
      wait = std::chrono::ceil<core::Duration>(std::chrono::duration<double>(seconds));
    }

    if (receipt.waited + wait > max_wait) {
      return R::err(core::make_error(
          core::ErrorKind::kRateLimited,
          "rate limit wait of " +
              std::to_string(
                  std::chrono::duration_cast<std::chrono::milliseconds>(receipt.waited + wait)
                      .count()) +
              "ms exceeds maximum of " + std::to_string(config_.max_wait.count()) + "ms"));
    }

    clock_.sleep_for(wait);
    receipt.waited += wait;
    ++receipt.waits;
  }
}

RateLimiterSnapshot TokenBucket::snapshot() {
  std::lock_guard<std::mutex> lock(mutex_);
  refill_locked(clock_.now());
  return RateLimiterSnapshot{"memory", config_.capacity, tokens_, config_.refill_per_second};
}

}  // namespace ftr::resilience
