#pragma once

#include "ftr/core/cancellation.h"
#include "ftr/core/clock.h"
#include "ftr/core/error.h"
#include "ftr/core/result.h"

#include <chrono>
#include <string>

namespace ftr::resilience {

// AcquireReceipt describes an admitted acquire(): how long the caller was suspended and how
// many times it re-checked the bucket.
struct AcquireReceipt {
  core::Duration waited{core::Duration::zero()};
  int waits{0};
};

struct RateLimiterSnapshot {
  std::string backend;  // "memory" or "redis"
  double capacity{0.0};
  double tokens{0.0};
  double refill_per_second{0.0};
};

// IRateLimiter is admission control for one provider, shared by every session.
class IRateLimiter {
 public:
  virtual ~IRateLimiter() = default;

  // acquire admits the caller or fails:
  // - kRateLimited when the wait for a token would exceed the configured maximum
  // - kCancelled when the cancellation token fires before the caller is admitted
  // A token consumed by an admitted caller is never refunded.
  [[nodiscard]] virtual core::Result<AcquireReceipt, core::Error> acquire(
      const core::CancellationToken& cancellation) = 0;

  [[nodiscard]] virtual RateLimiterSnapshot snapshot() = 0;

 protected:
  IRateLimiter() = default;
  IRateLimiter(const IRateLimiter&) = default;
  IRateLimiter& operator=(const IRateLimiter&) = default;
  IRateLimiter(IRateLimiter&&) = default;
  IRateLimiter& operator=(IRateLimiter&&) = default;
};

// TokenBucketConfig: capacity tokens, refilled continuously at refill_per_second.
struct TokenBucketConfig {
  double capacity{60.0};
  double refill_per_second{1.0};
  std::chrono::milliseconds max_wait{std::chrono::milliseconds{5000}};

  // from_requests_per_minute gives a bucket of `rpm` tokens refilled over one minute.
  static TokenBucketConfig from_requests_per_minute(int rpm, std::chrono::milliseconds max_wait);
};

[[nodiscard]] core::Result<bool, core::Error> validate_bucket_config(const TokenBucketConfig& config);

}  // namespace ftr::resilience
