#pragma once

#include "ftr/core/clock.h"
#include "ftr/core/error.h"
#include "ftr/core/result.h"

#include <chrono>
#include <cstdint>
#include <mutex>
#include <random>

namespace ftr::resilience {

struct RetryPolicy {
  int max_attempts{3};  // total attempts, including the first
  std::chrono::milliseconds base_delay{std::chrono::milliseconds{1000}};
  std::chrono::milliseconds max_jitter{std::chrono::milliseconds{250}};
};

[[nodiscard]] core::Result<bool, core::Error> validate_retry_policy(const RetryPolicy& policy);

// IJitterSource supplies the random part of a backoff delay, in [0, max].
class IJitterSource {
 public:
  virtual ~IJitterSource() = default;
  virtual core::Duration next(core::Duration max) = 0;

 protected:
  IJitterSource() = default;
  IJitterSource(const IJitterSource&) = default;
  IJitterSource& operator=(const IJitterSource&) = default;
  IJitterSource(IJitterSource&&) = default;
  IJitterSource& operator=(IJitterSource&&) = default;
};

// Uniform jitter from a seeded engine. Thread-safe.
class RandomJitter final : public IJitterSource {
 public:
  explicit RandomJitter(std::uint64_t seed = std::random_device{}()) : engine_(seed) {}

  core::Duration next(core::Duration max) override;

 private:
  std::mutex mutex_;
  std::mt19937_64 engine_;
};

// No jitter; backoff becomes exactly base_delay * 2^(n-1).
class NoJitter final : public IJitterSource {
 public:
  core::Duration next(core::Duration /*max*/) override { return core::Duration::zero(); }
};

// backoff_delay is the wait after failed attempt n (1-based): base * 2^(n-1) + jitter.
[[nodiscard]] core::Duration backoff_delay(const RetryPolicy& policy, int attempt,
                                           IJitterSource& jitter);

}  // namespace ftr::resilience
