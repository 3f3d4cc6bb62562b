#pragma once

#include "ftr/core/ids.h"
#include "ftr/resilience/outbound_call.h"

#include <string>

namespace ftr::llm {

struct ReasoningRequest {
  std::string purpose;  // short tag recorded for audit, e.g. "clarification"
  std::string prompt;   // already redacted upstream
};

// IReasoningProvider is one attempt against the external reasoning model. Implementations
// report failures as ProviderFailure values and never retry themselves; retry, rate limiting
// and circuit breaking belong to ResilientExecutor.
class IReasoningProvider {
 public:
  virtual ~IReasoningProvider() = default;

  [[nodiscard]] virtual core::ProviderId id() const = 0;
  virtual resilience::CallOutcome<std::string> complete(const ReasoningRequest& request) = 0;

 protected:
  IReasoningProvider() = default;
  IReasoningProvider(const IReasoningProvider&) = default;
  IReasoningProvider& operator=(const IReasoningProvider&) = default;
  IReasoningProvider(IReasoningProvider&&) = default;
  IReasoningProvider& operator=(IReasoningProvider&&) = default;
};

}  // namespace ftr::llm
