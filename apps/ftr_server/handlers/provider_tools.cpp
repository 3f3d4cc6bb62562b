#include "provider_tools.h"

#include "ftr/app/app_service.h"

#include "tool_support.h"

#include <chrono>

namespace ftr::server::handlers {

using json = nlohmann::json;

json handle_provider_status(const json& /*params*/, ServerContext& ctx) {
  json providers = json::array();
  for (const auto& status : ctx.providers.status()) {
    json circuit = {
        {"state", std::string{resilience::to_string(status.circuit.state)}},
        {"consecutive_failures", status.circuit.consecutive_failures},
        {"trial_in_flight", status.circuit.trial_in_flight},
    };
    if (status.circuit.opened_at.has_value()) {
      const auto open_for = ctx.clock.now() - status.circuit.opened_at.value();
      circuit["open_for_ms"] =
          std::chrono::duration_cast<std::chrono::milliseconds>(open_for).count();
    }
    providers.push_back({
        {"provider", status.id.value},
        {"circuit", circuit},
        {"rate_limit",
         {{"backend", status.bucket.backend},
          {"capacity", status.bucket.capacity},
          {"tokens", status.bucket.tokens},
          {"refill_per_second", status.bucket.refill_per_second}}},
    });
  }
  return {{"providers", providers}};
}

json handle_ask_reasoning_provider(const json& params, ServerContext& ctx) {
  const auto prompt = optional_string(params, "prompt");
  if (!prompt.has_value()) {
    return error_json("invalid_params", "prompt is required");
  }

  app::ReasoningCallRequest request;
  if (const auto session = optional_string(params, "session_id")) {
    request.session_id = core::SessionId{*session};
  }
  request.request.purpose = optional_string(params, "purpose").value_or("general");
  request.request.prompt = *prompt;
  request.trace_id =
      optional_string(params, "trace_id").value_or(core::new_trace_id(ctx.id_gen).value);

  auto response = app::ask_reasoning_provider(request, ctx.reasoning, ctx.services, ctx.id_gen,
                                              ctx.clock);
  if (!response.has_value()) {
    json error = error_json(response.error());
    error["trace_id"] = request.trace_id.value();
    return error;
  }
  return {{"trace_id", response.value().trace_id}, {"text", response.value().text}};
}

}  // namespace ftr::server::handlers
