#include "ftr/resilience/resilient_executor.h"

#include <nlohmann/json.hpp>

#include <chrono>

namespace ftr::resilience {

namespace {

std::int64_t to_millis(const core::Duration duration) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
}

core::Error with_attempts(core::Error error, const int attempts) {
  error.attempts = attempts;
  return error;
}

core::Error cancelled_error(const core::ProviderId& provider, const int attempts) {
  return core::Error{core::ErrorKind::kCancelled,
                     "provider " + provider.value + ": call abandoned, session cancelled",
                     attempts};
}

}  // namespace

ResilientExecutor::ResilientExecutor(ProviderRegistry& providers, core::IClock& clock,
                                     IJitterSource& jitter, storage::AuditRecorder audit)
    : providers_(providers), clock_(clock), jitter_(jitter), audit_(audit) {}

std::string ResilientExecutor::trace_for(const ProviderGuards& guards,
                                         const CallContext& context) const {
  if (!context.trace_id.empty()) {
    return context.trace_id;
  }
  return "provider-" + guards.id.value;
}

core::Result<CircuitPermit, core::Error> ResilientExecutor::admit(ProviderGuards& guards,
                                                                  const CallContext& context,
                                                                  const int attempt) {
  using R = core::Result<CircuitPermit, core::Error>;
  const int made = attempt - 1;
  const std::string trace = trace_for(guards, context);

  if (context.cancellation.is_cancelled()) {
    return R::err(cancelled_error(guards.id, made));
  }

  auto permit = guards.breaker->try_acquire();
  if (!permit.has_value()) {
    audit_.record(trace, "CircuitRejected",
                  {{"provider", guards.id.value}, {"attempt", attempt}}, {guards.id.value});
    return R::err(with_attempts(permit.error(), made));
  }

  auto receipt = guards.limiter->acquire(context.cancellation);
  if (!receipt.has_value()) {
    guards.breaker->release(permit.value());
    if (receipt.error().kind == core::ErrorKind::kRateLimited) {
      audit_.record(trace, "RateLimitRejected",
                    {{"provider", guards.id.value}, {"attempt", attempt}}, {guards.id.value});
    }
    return R::err(with_attempts(receipt.error(), made));
  }

  audit_.record(trace, "ProviderCallAttempted",
                {{"provider", guards.id.value},
                 {"attempt", attempt},
                 {"trial", permit.value().trial},
                 {"rate_limit_wait_ms", to_millis(receipt.value().waited)}},
                {guards.id.value});
  return R::ok(permit.value());
}

void ResilientExecutor::complete_success(ProviderGuards& guards, const CircuitPermit& permit,
                                         const CallContext& context, const int attempt) {
  guards.breaker->record_success(permit);
  audit_.record(trace_for(guards, context), "ProviderCallSucceeded",
                {{"provider", guards.id.value}, {"attempt", attempt}}, {guards.id.value});
}

std::optional<core::Error> ResilientExecutor::complete_failure(ProviderGuards& guards,
                                                               const CircuitPermit& permit,
                                                               const ProviderFailure& failure,
                                                               const CallContext& context,
                                                               const int attempt) {
  const std::string trace = trace_for(guards, context);
  const bool transient = is_transient(failure.kind);

  if (context.cancellation.is_cancelled() && failure.kind != FailureKind::kTimeout) {
    guards.breaker->release(permit);
    return cancelled_error(guards.id, attempt);
  }

  nlohmann::json payload = {{"provider", guards.id.value},
                            {"attempt", attempt},
                            {"failure", std::string{to_string(failure.kind)}},
                            {"transient", transient}};
  if (failure.status_code.has_value()) {
    payload["status_code"] = *failure.status_code;
  }
  audit_.record(trace, "ProviderCallFailed", payload, {guards.id.value});

  if (!transient) {
    guards.breaker->record_success(permit);
    return core::Error{core::ErrorKind::kProviderRejected,
                       "provider " + guards.id.value + " rejected the request: " + failure.message,
                       attempt};
  }

  if (guards.breaker->record_failure(permit)) {
    audit_.record(trace, "CircuitOpened",
                  {{"provider", guards.id.value},
                   {"failure_threshold", guards.breaker->config().failure_threshold}},
                  {guards.id.value});
  }

  if (context.cancellation.is_cancelled()) {
    return cancelled_error(guards.id, attempt);
  }

  if (attempt >= guards.retry.max_attempts) {
    return core::Error{core::ErrorKind::kRetriesExhausted,
                       "provider " + guards.id.value + ": retries exhausted after " +
                           std::to_string(attempt) + " attempts; last failure " +
                           std::string{to_string(failure.kind)} + ": " + failure.message,
                       attempt};
  }

  const core::Duration delay = backoff_delay(guards.retry, attempt, jitter_);
  audit_.record(trace, "ProviderRetryScheduled",
                {{"provider", guards.id.value},
                 {"attempt", attempt},
                 {"delay_ms", to_millis(delay)}},
                {guards.id.value});
  clock_.sleep_for(delay);

  if (context.cancellation.is_cancelled()) {
    return cancelled_error(guards.id, attempt);
  }
  return std::nullopt;
}

}  // namespace ftr::resilience
