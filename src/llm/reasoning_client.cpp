#include "ftr/llm/reasoning_client.h"

namespace ftr::llm {

core::Result<std::string, core::Error> ReasoningClient::ask(
    const ReasoningRequest& request, const resilience::CallContext& context) {
  return executor_.execute(
      provider_.id(), [this, &request]() { return provider_.complete(request); }, context);
}

}  // namespace ftr::llm
