#include "tool_registry.h"

#include "dispute_tools.h"
#include "get_audit_trace.h"
#include "merchant_tools.h"
#include "provider_tools.h"
#include "resolution_tools.h"

namespace ftr::server::handlers {

std::unordered_map<std::string, ToolHandler> build_tool_registry() {
  return {
      {"resolve_transaction", handle_resolve_transaction},
      {"answer_clarification", handle_answer_clarification},
      {"end_session", handle_end_session},
      {"search_merchant", handle_search_merchant},
      {"get_merchant", handle_get_merchant},
      {"flag_dispute", handle_flag_dispute},
      {"get_dispute_status", handle_get_dispute_status},
      {"list_disputes", handle_list_disputes},
      {"get_audit_trace", handle_get_audit_trace},
      {"provider_status", handle_provider_status},
      {"ask_reasoning_provider", handle_ask_reasoning_provider},
  };
}

}  // namespace ftr::server::handlers
