#pragma once

#include "ftr/core/error.h"
#include "ftr/core/result.h"
#include "ftr/llm/reasoning_provider.h"
#include "ftr/resilience/resilient_executor.h"

#include <string>

namespace ftr::llm {

// ReasoningClient is how the rest of the engine talks to the reasoning model: every request
// goes through ResilientExecutor under the provider's id.
class ReasoningClient {
 public:
  ReasoningClient(IReasoningProvider& provider, resilience::ResilientExecutor& executor)
      : provider_(provider), executor_(executor) {}

  [[nodiscard]] core::Result<std::string, core::Error> ask(
      const ReasoningRequest& request, const resilience::CallContext& context = {});

 private:
  IReasoningProvider& provider_;
  resilience::ResilientExecutor& executor_;
};

}  // namespace ftr::llm
