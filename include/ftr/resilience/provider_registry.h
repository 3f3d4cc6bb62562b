#pragma once

#include "ftr/core/clock.h"
#include "ftr/core/ids.h"
#include "ftr/resilience/circuit_breaker.h"
#include "ftr/resilience/rate_limiter.h"
#include "ftr/resilience/retry_policy.h"

#include <map>
#include <memory>
#include <mutex>
#include <vector>

namespace ftr::resilience {

// ProviderSettings is everything that protects calls to one external provider.
struct ProviderSettings {
  CircuitBreakerConfig breaker;
  TokenBucketConfig bucket;
  RetryPolicy retry;
};

// ProviderGuards is the process-wide shared state of one provider. Entries are created once
// and never removed, so references handed out by the registry stay valid for its lifetime.
struct ProviderGuards {
  core::ProviderId id;
  RetryPolicy retry;
  std::unique_ptr<CircuitBreaker> breaker;
  std::unique_ptr<IRateLimiter> limiter;
};

struct ProviderStatus {
  core::ProviderId id;
  CircuitSnapshot circuit;
  RateLimiterSnapshot bucket;
};

class ProviderRegistry {
 public:
  ProviderRegistry(ProviderSettings defaults, core::IClock& clock);

  ProviderRegistry(const ProviderRegistry&) = delete;
  ProviderRegistry& operator=(const ProviderRegistry&) = delete;
  ProviderRegistry(ProviderRegistry&&) = delete;
  ProviderRegistry& operator=(ProviderRegistry&&) = delete;
  ~ProviderRegistry() = default;

  // configure registers a provider with its own settings; an in-process TokenBucket is used
  // unless a limiter is supplied (e.g. a RedisTokenBucket shared across processes).
  // Returns false if the provider already exists.
  bool configure(const core::ProviderId& id, const ProviderSettings& settings,
                 std::unique_ptr<IRateLimiter> limiter = nullptr);

  // guards returns the provider's state, creating it with the default settings on first use.
  ProviderGuards& guards(const core::ProviderId& id);

  [[nodiscard]] std::vector<ProviderStatus> status();

 private:
  ProviderSettings defaults_;
  core::IClock& clock_;

  std::mutex mutex_;
  std::map<core::ProviderId, std::unique_ptr<ProviderGuards>> providers_;

  std::unique_ptr<ProviderGuards> make_guards(const core::ProviderId& id,
                                              const ProviderSettings& settings,
                                              std::unique_ptr<IRateLimiter> limiter);
};

}  // namespace ftr::resilience
