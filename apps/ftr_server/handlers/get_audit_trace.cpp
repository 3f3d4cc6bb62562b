#include "get_audit_trace.h"

#include "ftr/app/app_service.h"

#include "tool_support.h"
#include <string>

namespace ftr::server::handlers {

using json = nlohmann::json;

json handle_get_audit_trace(const json& params, ServerContext& ctx) {
  const auto trace_id = optional_string(params, "trace_id");
  if (!trace_id.has_value()) {
    return error_json("invalid_params", "trace_id is required");
  }

  json result;
  result["trace_id"] = *trace_id;
  result["events"] = json::array();

  for (const auto& event : app::fetch_audit_trace(*trace_id, ctx.services)) {
    json payload = json::parse(event.payload, nullptr, false);
    if (payload.is_discarded()) {
      payload = event.payload;
    }
    result["events"].push_back({
        {"event_id", event.event_id},
        {"trace_id", event.trace_id},
        {"event_type", event.event_type},
        {"payload", payload},
        {"created_at", event.created_at},
        {"refs", event.refs},
    });
  }

  return result;
}

}  // namespace ftr::server::handlers
