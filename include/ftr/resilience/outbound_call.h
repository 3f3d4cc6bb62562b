#pragma once

#include "ftr/core/result.h"

#include <optional>
#include <string>
#include <string_view>

namespace ftr::resilience {

// FailureKind is how a provider adapter reports a failed attempt.
enum class FailureKind {
  kTimeout,              // transient
  kProviderRateLimited,  // transient: the provider said "slow down"
  kServerError,          // transient: 5xx-equivalent
  kBadRequest,           // permanent: validation / 4xx-equivalent
};

[[nodiscard]] std::string_view to_string(FailureKind kind);

[[nodiscard]] constexpr bool is_transient(const FailureKind kind) {
  return kind != FailureKind::kBadRequest;
}

struct ProviderFailure {
  FailureKind kind{FailureKind::kServerError};
  std::string message;
  std::optional<int> status_code;
};

// classify_status maps an HTTP-style status code to a FailureKind.
// 408 and 504 are timeouts, 429 is a provider rate limit, other 5xx are server errors and
// every remaining code is a bad request.
[[nodiscard]] FailureKind classify_status(int status_code);

// CallOutcome is what one attempt of an outbound call returns.
template <typename T>
using CallOutcome = core::Result<T, ProviderFailure>;

}  // namespace ftr::resilience
