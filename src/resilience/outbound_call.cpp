#include "ftr/resilience/outbound_call.h"

namespace ftr::resilience {

std::string_view to_string(const FailureKind kind) {
  switch (kind) {
    case FailureKind::kTimeout:
      return "timeout";
    case FailureKind::kProviderRateLimited:
      return "provider_rate_limited";
    case FailureKind::kServerError:
      return "server_error";
    case FailureKind::kBadRequest:
      return "bad_request";
  }
  return "server_error";
}

FailureKind classify_status(const int status_code) {
  if (status_code == 408 || status_code == 504) {
    return FailureKind::kTimeout;
  }
  if (status_code == 429) {
    return FailureKind::kProviderRateLimited;
  }
  if (status_code >= 500 && status_code <= 599) {
    return FailureKind::kServerError;
  }
  return FailureKind::kBadRequest;
}

}  // namespace ftr::resilience
