#pragma once

#include "ftr/core/clock.h"
#include "ftr/core/ids.h"
#include "ftr/resilience/rate_limiter.h"

#include <memory>
#include <string>

// Forward declare Redis++ types to avoid exposing them in header
namespace sw {
namespace redis {
class Redis;
}
}  // namespace sw

namespace ftr::resilience {

// RedisTokenBucket is an IRateLimiter whose bucket lives in Redis, so several server
// processes calling the same provider share one quota.
//
// Redis data model:
// - ftr:ratelimit:{provider} (hash): tokens (float), last_refill (seconds, Redis TIME)
// - expires once a full refill has elapsed with no traffic
//
// Refill-and-take runs as one Lua script, so it is atomic across processes. The script
// reads the Redis server clock; the injected IClock is only used to sleep between checks.
class RedisTokenBucket final : public IRateLimiter {
 public:
  // Throws std::runtime_error if the connection or script load fails.
  RedisTokenBucket(const std::string& redis_uri, const core::ProviderId& provider,
                   TokenBucketConfig config, core::IClock& clock);
  ~RedisTokenBucket() override;

  RedisTokenBucket(const RedisTokenBucket&) = delete;
  RedisTokenBucket& operator=(const RedisTokenBucket&) = delete;
  RedisTokenBucket(RedisTokenBucket&&) = delete;
  RedisTokenBucket& operator=(RedisTokenBucket&&) = delete;

  // Besides the IRateLimiter errors, a Redis failure is reported as kStorage.
  [[nodiscard]] core::Result<AcquireReceipt, core::Error> acquire(
      const core::CancellationToken& cancellation) override;

  [[nodiscard]] RateLimiterSnapshot snapshot() override;

  // reset deletes the bucket key; the next acquire starts from a full bucket.
  void reset();

 private:
  std::unique_ptr<sw::redis::Redis> redis_;
  std::string key_;
  TokenBucketConfig config_;
  core::IClock& clock_;
  std::string take_script_sha_;
};

}  // namespace ftr::resilience
