#include "ftr/resilience/provider_registry.h"

#include "ftr/resilience/token_bucket.h"

#include <utility>

namespace ftr::resilience {

ProviderRegistry::ProviderRegistry(ProviderSettings defaults, core::IClock& clock)
    : defaults_(defaults), clock_(clock) {}

std::unique_ptr<ProviderGuards> ProviderRegistry::make_guards(
    const core::ProviderId& id, const ProviderSettings& settings,
    std::unique_ptr<IRateLimiter> limiter) {
  auto guards = std::make_unique<ProviderGuards>();
  guards->id = id;
  guards->retry = settings.retry;
  guards->breaker = std::make_unique<CircuitBreaker>(settings.breaker, clock_);
  guards->limiter =
      limiter != nullptr ? std::move(limiter) : std::make_unique<TokenBucket>(settings.bucket, clock_);
  return guards;
}

bool ProviderRegistry::configure(const core::ProviderId& id, const ProviderSettings& settings,
                                 std::unique_ptr<IRateLimiter> limiter) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (providers_.find(id) != providers_.end()) {
    return false;
  }
  providers_.emplace(id, make_guards(id, settings, std::move(limiter)));
  return true;
}

ProviderGuards& ProviderRegistry::guards(const core::ProviderId& id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = providers_.find(id);
  if (it == providers_.end()) {
    it = providers_.emplace(id, make_guards(id, defaults_, nullptr)).first;
  }
  return *it->second;
}

std::vector<ProviderStatus> ProviderRegistry::status() {
  std::vector<ProviderGuards*> snapshot;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [id, guards] : providers_) {
      snapshot.push_back(guards.get());
    }
  }

  std::vector<ProviderStatus> result;
  result.reserve(snapshot.size());
  for (auto* guards : snapshot) {
    result.push_back(
        ProviderStatus{guards->id, guards->breaker->snapshot(), guards->limiter->snapshot()});
  }
  return result;
}

}  // namespace ftr::resilience
