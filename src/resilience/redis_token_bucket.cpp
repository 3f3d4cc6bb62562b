#include "ftr/resilience/redis_token_bucket.h"

#include <sw/redis++/redis++.h>

#include <chrono>
#include <stdexcept>
#include <vector>

namespace ftr::resilience {

namespace {

// Args: capacity, refill_per_second
// Returns: { admitted (0|1), wait_micros, tokens_millis }
constexpr const char* kTakeTokenScript = R"LUA(
local key = KEYS[1]
local capacity = tonumber(ARGV[1])
local rate = tonumber(ARGV[2])

local t = redis.call('TIME')
local now = tonumber(t[1]) + tonumber(t[2]) / 1000000

local tokens = tonumber(redis.call('HGET', key, 'tokens'))
local last = tonumber(redis.call('HGET', key, 'last_refill'))
if tokens == nil or last == nil then
  tokens = capacity
  last = now
end

if now > last then
  tokens = math.min(capacity, tokens + (now - last) * rate)
  last = now
end

local admitted = 0
local wait_us = 0
if tokens >= 1 then
  tokens = tokens - 1
  admitted = 1
else
  wait_us = math.ceil((1 - tokens) / rate * 1000000)
end

redis.call('HSET', key, 'tokens', tostring(tokens), 'last_refill', tostring(last))
redis.call('EXPIRE', key, math.ceil(capacity / rate) + 60)

return {admitted, wait_us, math.floor(tokens * 1000)}
)LUA";

}  // namespace

RedisTokenBucket::RedisTokenBucket(const std::string& redis_uri, const core::ProviderId& provider,
                                   TokenBucketConfig config, core::IClock& clock)
    : key_("ftr:ratelimit:" + provider.value), config_(config), clock_(clock) {
  try {
    redis_ = std::make_unique<sw::redis::Redis>(redis_uri);
    redis_->ping();
    take_script_sha_ = redis_->script_load(kTakeTokenScript);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to connect to Redis: " + std::string(e.what()));
  }
}

RedisTokenBucket::~RedisTokenBucket() = default;

core::Result<AcquireReceipt, core::Error> RedisTokenBucket::acquire(
    const core::CancellationToken& cancellation) {
  using R = core::Result<AcquireReceipt, core::Error>;

  AcquireReceipt receipt;
  const core::Duration max_wait = std::chrono::duration_cast<core::Duration>(config_.max_wait);
  const std::vector<std::string> keys = {key_};
  const std::vector<std::string> args = {std::to_string(config_.capacity),
                                         std::to_string(config_.refill_per_second)};

  for (;;) {
    if (cancellation.is_cancelled()) {
      return R::err(core::make_error(core::ErrorKind::kCancelled,
                                     "request cancelled while waiting for rate limiter"));
    }

    std::vector<long long> reply;
    try {
      sw::redis::StringView script_sha{take_script_sha_};
      reply = redis_->evalsha<std::vector<long long>>(script_sha, keys.begin(), keys.end(),
                                                      args.begin(), args.end());
    } catch (const std::exception& e) {
      return R::err(core::make_error(core::ErrorKind::kStorage,
                                     "Redis rate limiter error: " + std::string(e.what())));
    }
    if (reply.size() != 3) {
      return R::err(core::make_error(core::ErrorKind::kStorage,
                                     "Redis rate limiter returned a malformed reply"));
    }

    if (reply[0] == 1) {
      return R::ok(receipt);
    }

    const core::Duration wait = std::chrono::microseconds{reply[1]};
    if (receipt.waited + wait > max_wait) {
      return R::err(core::make_error(
          core::ErrorKind::kRateLimited,
          "rate limit wait exceeds maximum of " + std::to_string(config_.max_wait.count()) +
              "ms (shared bucket " + key_ + ")"));
    }

    clock_.sleep_for(wait);
    receipt.waited += wait;
    ++receipt.waits;
  }
}

RateLimiterSnapshot RedisTokenBucket::snapshot() {
  RateLimiterSnapshot snapshot{"redis", config_.capacity, config_.capacity,
                               config_.refill_per_second};
  try {
    const auto tokens = redis_->hget(key_, "tokens");
    if (tokens) {
      snapshot.tokens = std::stod(*tokens);
    }
  } catch (const std::exception& /*e*/) {
    // An unreachable backend reads as an empty bucket.
    snapshot.tokens = 0.0;
  }
  return snapshot;
}

void RedisTokenBucket::reset() { redis_->del(key_); }

}  // namespace ftr::resilience
