#pragma once

#include <string>
#include <string_view>

namespace ftr::core {

// ErrorKind classifies every failure the engine can report.
// Matching-domain kinds are returned to the immediate caller as typed results.
// Resilience-domain kinds stay distinct so the caller can choose a different user-facing
// message for "busy, try again", "service down" and "bad input".
enum class ErrorKind {
  // Matching domain
  kInvalidQuery,    // no field populated, or malformed amount/date
  kEmptyResult,     // no candidate cleared the acceptance threshold
  kStaleReference,  // clarification answer for expired or missing pending state

  // Resilience domain
  kRateLimited,       // admission wait would exceed the configured maximum
  kCircuitOpen,       // provider is failing fast during a sustained outage
  kRetriesExhausted,  // transient failure persisted past max_attempts
  kProviderRejected,  // permanent provider failure (validation / 4xx-equivalent)
  kCancelled,         // owning session was torn down while the call was pending

  // Storage / application
  kNotFound,
  kConflict,
  kStorage,
  kInvalidConfig,
};

struct Error {
  ErrorKind kind;
  std::string message;
  int attempts{0};  // outbound attempts actually made (resilience errors only)
};

[[nodiscard]] constexpr std::string_view to_string(const ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kInvalidQuery:
      return "invalid_query";
    case ErrorKind::kEmptyResult:
      return "empty_result";
    case ErrorKind::kStaleReference:
      return "stale_reference";
    case ErrorKind::kRateLimited:
      return "rate_limited";
    case ErrorKind::kCircuitOpen:
      return "circuit_open";
    case ErrorKind::kRetriesExhausted:
      return "retries_exhausted";
    case ErrorKind::kProviderRejected:
      return "provider_rejected";
    case ErrorKind::kCancelled:
      return "cancelled";
    case ErrorKind::kNotFound:
      return "not_found";
    case ErrorKind::kConflict:
      return "conflict";
    case ErrorKind::kStorage:
      return "storage";
    case ErrorKind::kInvalidConfig:
      return "invalid_config";
  }
  return "unknown";
}

// is_resilience_error is true for failures raised by the outbound-call wrapper.
[[nodiscard]] constexpr bool is_resilience_error(const ErrorKind kind) {
  return kind == ErrorKind::kRateLimited || kind == ErrorKind::kCircuitOpen ||
         kind == ErrorKind::kRetriesExhausted || kind == ErrorKind::kProviderRejected ||
         kind == ErrorKind::kCancelled;
}

inline Error make_error(const ErrorKind kind, std::string message) {
  return Error{kind, std::move(message), 0};
}

}  // namespace ftr::core
