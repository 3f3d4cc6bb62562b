#pragma once

#include "ftr/core/clock.h"
#include "ftr/resilience/rate_limiter.h"

#include <mutex>

namespace ftr::resilience {

// TokenBucket is the in-process IRateLimiter.
//
// Every refill-and-take is one critical section of constant-time arithmetic. The mutex is
// released before the caller sleeps, so a waiting caller never blocks the others; after
// the sleep the caller re-enters the critical section and checks again. Another caller may
// win the refilled token, in which case the loop waits again as long as the total stays
// within max_wait.
class TokenBucket final : public IRateLimiter {
 public:
  TokenBucket(TokenBucketConfig config, core::IClock& clock);
  ~TokenBucket() override = default;

  TokenBucket(const TokenBucket&) = delete;
  TokenBucket& operator=(const TokenBucket&) = delete;
  TokenBucket(TokenBucket&&) = delete;
  TokenBucket& operator=(TokenBucket&&) = delete;

  [[nodiscard]] core::Result<AcquireReceipt, core::Error> acquire(
      const core::CancellationToken& cancellation) override;

  [[nodiscard]] RateLimiterSnapshot snapshot() override;

 private:
  TokenBucketConfig config_;
  core::IClock& clock_;

  std::mutex mutex_;
  double tokens_;
  core::Instant last_refill_;

  // refill_locked credits tokens for the time since last_refill_. Caller holds mutex_.
  void refill_locked(core::Instant now);
};

}  // namespace ftr::resilience
