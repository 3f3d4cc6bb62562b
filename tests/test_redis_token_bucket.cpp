#include "ftr/core/clock.h"
#include "ftr/resilience/redis_health.h"
#include "ftr/resilience/redis_token_bucket.h"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <cstdlib>
#include <stdexcept>

using namespace ftr;
using namespace std::chrono_literals;

// Helper: Check if Redis integration tests should run
static bool should_run_redis_tests() {
  const char* env = std::getenv("FTR_TEST_REDIS");
  return env != nullptr && std::string(env) == "1";
}

// Helper: Get Redis URI from environment or use default
static std::string get_redis_uri() {
  const char* env = std::getenv("FTR_REDIS_URI");
  if (env != nullptr) {
    return std::string(env);
  }
  return "tcp://127.0.0.1:6379";
}

static resilience::TokenBucketConfig slow_bucket(const double capacity) {
  resilience::TokenBucketConfig config;
  config.capacity = capacity;
  config.refill_per_second = 0.001;
  config.max_wait = 0ms;
  return config;
}

TEST_CASE("RedisTokenBucket: two limiters share one provider quota",
          "[resilience][redis][integration]") {
  if (!should_run_redis_tests()) {
    SKIP("Redis integration tests disabled (set FTR_TEST_REDIS=1 to enable)");
  }

  core::FixedClock clock("2026-01-01T00:00:00Z");
  const core::ProviderId provider{"redis-test-shared"};
  resilience::RedisTokenBucket first(get_redis_uri(), provider, slow_bucket(3.0), clock);
  resilience::RedisTokenBucket second(get_redis_uri(), provider, slow_bucket(3.0), clock);
  first.reset();

  REQUIRE(first.acquire({}).has_value());
  REQUIRE(second.acquire({}).has_value());
  REQUIRE(first.acquire({}).has_value());

  const auto limited = second.acquire({});
  REQUIRE_FALSE(limited.has_value());
  CHECK(limited.error().kind == core::ErrorKind::kRateLimited);

  const auto snapshot = first.snapshot();
  CHECK(snapshot.backend == "redis");
  CHECK(snapshot.tokens < 1.0);

  first.reset();
  CHECK(second.acquire({}).has_value());
  first.reset();
}

TEST_CASE("RedisTokenBucket: cancellation wins before any script call",
          "[resilience][redis][integration]") {
  if (!should_run_redis_tests()) {
    SKIP("Redis integration tests disabled (set FTR_TEST_REDIS=1 to enable)");
  }

  core::FixedClock clock("2026-01-01T00:00:00Z");
  resilience::RedisTokenBucket limiter(get_redis_uri(), core::ProviderId{"redis-test-cancel"},
                                       slow_bucket(1.0), clock);
  core::CancellationSource source;
  source.cancel();

  const auto result = limiter.acquire(source.token());
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().kind == core::ErrorKind::kCancelled);
}

TEST_CASE("RedisTokenBucket: unreachable server throws at construction",
          "[resilience][redis][integration]") {
  if (!should_run_redis_tests()) {
    SKIP("Redis integration tests disabled (set FTR_TEST_REDIS=1 to enable)");
  }

  core::FixedClock clock("2026-01-01T00:00:00Z");
  CHECK_THROWS_AS(resilience::RedisTokenBucket("tcp://127.0.0.1:1", core::ProviderId{"x"},
                                               slow_bucket(1.0), clock),
                  std::runtime_error);
  CHECK_FALSE(resilience::redis_ping("tcp://127.0.0.1:1").reachable);
}

TEST_CASE("redis_ping reports a reachable server", "[resilience][redis][integration]") {
  if (!should_run_redis_tests()) {
    SKIP("Redis integration tests disabled (set FTR_TEST_REDIS=1 to enable)");
  }

  const auto health = resilience::redis_ping(get_redis_uri());
  CHECK(health.reachable);
  CHECK(health.error.empty());
}
