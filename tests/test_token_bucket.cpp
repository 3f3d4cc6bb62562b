#include "ftr/core/cancellation.h"
#include "ftr/core/clock.h"
#include "ftr/resilience/token_bucket.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace ftr;
using namespace std::chrono_literals;
using Catch::Matchers::WithinAbs;
using resilience::TokenBucket;
using resilience::TokenBucketConfig;

namespace {

TokenBucketConfig bucket(const double capacity, const double refill,
                         const std::chrono::milliseconds max_wait) {
  TokenBucketConfig config;
  config.capacity = capacity;
  config.refill_per_second = refill;
  config.max_wait = max_wait;
  return config;
}

}  // namespace

TEST_CASE("TokenBucket admits up to capacity without waiting", "[resilience][bucket]") {
  core::FixedClock clock("2026-01-01T00:00:00Z");
  TokenBucket limiter(bucket(2.0, 1.0, 5000ms), clock);

  for (int i = 0; i < 2; ++i) {
    const auto receipt = limiter.acquire({});
    REQUIRE(receipt.has_value());
    CHECK(receipt.value().waits == 0);
    CHECK(receipt.value().waited == core::Duration::zero());
  }
  CHECK(clock.total_slept() == core::Duration::zero());
}

TEST_CASE("TokenBucket suspends the caller until a token refills", "[resilience][bucket]") {
  core::FixedClock clock("2026-01-01T00:00:00Z");
  TokenBucket limiter(bucket(1.0, 1.0, 5000ms), clock);

  REQUIRE(limiter.acquire({}).has_value());
  const auto receipt = limiter.acquire({});
  REQUIRE(receipt.has_value());
  CHECK(receipt.value().waits == 1);
  CHECK(receipt.value().waited == 1s);
  CHECK(clock.total_slept() == 1s);
}

TEST_CASE("TokenBucket fails fast when the wait would exceed max_wait", "[resilience][bucket]") {
  core::FixedClock clock("2026-01-01T00:00:00Z");
  TokenBucket limiter(bucket(1.0, 1.0, 500ms), clock);

  REQUIRE(limiter.acquire({}).has_value());
  const auto rejected = limiter.acquire({});
  REQUIRE_FALSE(rejected.has_value());
  CHECK(rejected.error().kind == core::ErrorKind::kRateLimited);
  CHECK(clock.total_slept() == core::Duration::zero());
}

TEST_CASE("TokenBucket observes cancellation before admitting", "[resilience][bucket]") {
  core::FixedClock clock("2026-01-01T00:00:00Z");
  TokenBucket limiter(bucket(5.0, 1.0, 5000ms), clock);

  core::CancellationSource source;
  source.cancel();
  const auto result = limiter.acquire(source.token());
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().kind == core::ErrorKind::kCancelled);
  CHECK_THAT(limiter.snapshot().tokens, WithinAbs(5.0, 1e-9));
}

TEST_CASE("TokenBucket refill never exceeds capacity", "[resilience][bucket]") {
  core::FixedClock clock("2026-01-01T00:00:00Z");
  TokenBucket limiter(bucket(3.0, 1.0, 0ms), clock);

  for (int i = 0; i < 3; ++i) {
    REQUIRE(limiter.acquire({}).has_value());
  }
  CHECK_THAT(limiter.snapshot().tokens, WithinAbs(0.0, 1e-9));

  clock.advance(1500ms);
  CHECK_THAT(limiter.snapshot().tokens, WithinAbs(1.5, 1e-9));

  clock.advance(1h);
  const auto snapshot = limiter.snapshot();
  CHECK(snapshot.backend == "memory");
  CHECK_THAT(snapshot.tokens, WithinAbs(3.0, 1e-9));
  CHECK(snapshot.capacity == 3.0);
}

TEST_CASE("TokenBucket shared by many threads admits exactly capacity", "[resilience][bucket]") {
  core::FixedClock clock("2026-01-01T00:00:00Z");
  TokenBucket limiter(bucket(10.0, 1.0, 0ms), clock);

  std::atomic<int> admitted{0};
  std::atomic<int> limited{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&] {
      for (int i = 0; i < 5; ++i) {
        const auto result = limiter.acquire({});
        if (result.has_value()) {
          ++admitted;
        } else if (result.error().kind == core::ErrorKind::kRateLimited) {
          ++limited;
        }
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  CHECK(admitted.load() == 10);
  CHECK(limited.load() == 30);
}

TEST_CASE("TokenBucketConfig from requests per minute", "[resilience][bucket][config]") {
  const auto config = TokenBucketConfig::from_requests_per_minute(30, 2000ms);
  CHECK(config.capacity == 30.0);
  CHECK_THAT(config.refill_per_second, WithinAbs(0.5, 1e-12));
  CHECK(config.max_wait == 2000ms);

  CHECK(resilience::validate_bucket_config(config).has_value());
  CHECK_FALSE(resilience::validate_bucket_config(bucket(0.5, 1.0, 0ms)).has_value());
  CHECK_FALSE(resilience::validate_bucket_config(bucket(1.0, 0.0, 0ms)).has_value());
  CHECK_FALSE(resilience::validate_bucket_config(bucket(1.0, 1.0, -1ms)).has_value());
}
