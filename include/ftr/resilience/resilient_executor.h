#pragma once

#include "ftr/core/cancellation.h"
#include "ftr/core/clock.h"
#include "ftr/core/error.h"
#include "ftr/core/ids.h"
#include "ftr/core/result.h"
#include "ftr/resilience/circuit_breaker.h"
#include "ftr/resilience/outbound_call.h"
#include "ftr/resilience/provider_registry.h"
#include "ftr/resilience/retry_policy.h"
#include "ftr/storage/audit_recorder.h"

#include <exception>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>

namespace ftr::resilience {

// CallContext ties an outbound call to the session that owns it.
struct CallContext {
  core::CancellationToken cancellation;
  std::string trace_id;  // audit trace; empty records under "provider-<id>"
};

// PermitGuard releases a breaker permit unless the attempt was settled, so a call that
// escapes with an exception cannot hold the half-open trial slot.
class PermitGuard {
 public:
  PermitGuard(CircuitBreaker& breaker, const CircuitPermit& permit)
      : breaker_(breaker), permit_(permit) {}

  PermitGuard(const PermitGuard&) = delete;
  PermitGuard& operator=(const PermitGuard&) = delete;

  ~PermitGuard() {
    if (armed_) {
      breaker_.release(permit_);
    }
  }

  void dismiss() { armed_ = false; }

 private:
  CircuitBreaker& breaker_;
  CircuitPermit permit_;
  bool armed_{true};
};

// ResilientExecutor is the single wrapper every outbound call goes through.
//
// Per attempt, in order:
//   1. circuit breaker admission: a rejection ends the call with kCircuitOpen and consumes
//      neither a token nor an attempt
//   2. rate limiter acquire: may suspend this caller; kRateLimited ends the call
//   3. the call itself
//   4. classification: success, transient failure (retried after
//      base_delay * 2^(n-1) + jitter) or permanent failure (kProviderRejected, no retry)
// A transient failure on the last attempt ends the call with kRetriesExhausted carrying the
// last failure. Error::attempts is the number of calls actually made.
//
// A std::exception thrown by the call is treated as a transient kServerError. Any other
// exception releases the permit and propagates.
//
// A permanent failure proves the provider is reachable, so the breaker records it as a
// success. A call abandoned because its session was cancelled is released, not counted,
// unless it failed with a timeout.
class ResilientExecutor {
 public:
  ResilientExecutor(ProviderRegistry& providers, core::IClock& clock, IJitterSource& jitter,
                    storage::AuditRecorder audit);

  // execute runs `call` (a callable returning CallOutcome<T>) under the guards of `provider`.
  template <typename Fn>
  auto execute(const core::ProviderId& provider, Fn&& call, const CallContext& context = {})
      -> core::Result<typename std::invoke_result_t<Fn&>::value_type, core::Error>;

  [[nodiscard]] ProviderRegistry& providers() { return providers_; }

 private:
  ProviderRegistry& providers_;
  core::IClock& clock_;
  IJitterSource& jitter_;
  storage::AuditRecorder audit_;

  // admit runs breaker admission then rate limiting for one attempt.
  core::Result<CircuitPermit, core::Error> admit(ProviderGuards& guards,
                                                 const CallContext& context, int attempt);

  void complete_success(ProviderGuards& guards, const CircuitPermit& permit,
                        const CallContext& context, int attempt);

  // complete_failure records a failed attempt. It returns the error that ends the call, or
  // nullopt after sleeping the backoff when another attempt should be made.
  std::optional<core::Error> complete_failure(ProviderGuards& guards, const CircuitPermit& permit,
                                              const ProviderFailure& failure,
                                              const CallContext& context, int attempt);

  [[nodiscard]] std::string trace_for(const ProviderGuards& guards,
                                      const CallContext& context) const;
};

template <typename Fn>
auto ResilientExecutor::execute(const core::ProviderId& provider, Fn&& call,
                                const CallContext& context)
    -> core::Result<typename std::invoke_result_t<Fn&>::value_type, core::Error> {
  using T = typename std::invoke_result_t<Fn&>::value_type;
  using R = core::Result<T, core::Error>;

  ProviderGuards& guards = providers_.guards(provider);
  const int max_attempts = guards.retry.max_attempts;

  for (int attempt = 1;; ++attempt) {
    auto permit = admit(guards, context, attempt);
    if (!permit.has_value()) {
      return R::err(permit.error());
    }

    std::optional<CallOutcome<T>> attempted;
    {
      PermitGuard guard(*guards.breaker, permit.value());
      try {
        attempted.emplace(call());
      } catch (const std::exception& e) {
        attempted.emplace(CallOutcome<T>::err(
            ProviderFailure{FailureKind::kServerError, e.what(), std::nullopt}));
      }
      guard.dismiss();
    }
    auto& outcome = *attempted;
    if (outcome.has_value()) {
      complete_success(guards, permit.value(), context, attempt);
      return R::ok(std::move(outcome).value());
    }

    if (auto terminal =
            complete_failure(guards, permit.value(), outcome.error(), context, attempt)) {
      return R::err(std::move(*terminal));
    }
    if (attempt >= max_attempts) {
      // complete_failure always ends the call on the last attempt.
      return R::err(core::Error{core::ErrorKind::kRetriesExhausted,
                                "provider " + provider.value + ": retries exhausted", attempt});
    }
  }
}

}  // namespace ftr::resilience
