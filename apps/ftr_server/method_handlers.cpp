#include "method_handlers.h"

#include "ftr/core/version.h"

#include "handlers/tool_registry.h"

namespace ftr::server {

using json = nlohmann::json;

namespace {

json string_property(const char* description) {
  return {{"type", "string"}, {"description", description}};
}

json tool(const char* name, const char* description, json properties,
          std::initializer_list<const char*> required) {
  json schema = {{"type", "object"}, {"properties", std::move(properties)}};
  if (required.size() > 0) {
    schema["required"] = json::array();
    for (const char* field : required) {
      schema["required"].push_back(field);
    }
  }
  return {{"name", name}, {"description", description}, {"inputSchema", std::move(schema)}};
}

}  // namespace

json handle_initialize(const JsonRpcRequest& /*req*/, ServerContext& /*ctx*/) {
  return json{
      {"protocolVersion", "2024-11-05"},
      {"capabilities", {{"tools", json::object()}}},
      {"serverInfo", {{"name", "fuzzy-txn-resolver"}, {"version", core::kBuildVersion}}},
  };
}

json handle_ping(const JsonRpcRequest& /*req*/, ServerContext& /*ctx*/) {
  return json::object();
}

json handle_tools_list(const JsonRpcRequest& /*req*/, ServerContext& /*ctx*/) {
  const json session = string_property("Conversation session id");
  const json user = string_property("User id (defaults to the configured user)");
  const json trace = string_property("Audit trace id (generated when absent)");

  json tools = json::array();

  tools.push_back(tool(
      "resolve_transaction",
      "Find the user's transaction from an approximate amount, date and merchant",
      {{"session_id", session},
       {"user_id", user},
       {"amount", {{"type", {"number", "string"}}, {"description", "Approximate amount"}}},
       {"currency", string_property("3-letter currency code")},
       {"date", string_property("Approximate date, YYYY-MM-DD")},
       {"merchant", string_property("Merchant name or card descriptor")},
       {"transaction_id", string_property("Exact transaction id, if known")},
       {"trace_id", trace}},
      {"session_id"}));

  tools.push_back(tool(
      "answer_clarification",
      "Answer a pending clarification by rank, transaction id or a refined description",
      {{"session_id", session},
       {"rank", {{"type", "integer"}, {"description", "1-based option number"}}},
       {"transaction_id", string_property("Chosen transaction id")},
       {"refine", {{"type", "object"}, {"description", "Refined amount/date/merchant"}}},
       {"in_reply_to", string_property("query_fingerprint of the clarification answered")},
       {"trace_id", trace}},
      {"session_id"}));

  tools.push_back(tool("search_merchant", "Identify a merchant from a name or card descriptor",
                       {{"query", string_property("Merchant text")}, {"session_id", session}},
                       {"query"}));

  tools.push_back(tool("get_merchant", "Fetch a merchant by id",
                       {{"merchant_id", string_property("Merchant id")}, {"session_id", session}},
                       {"merchant_id"}));

  tools.push_back(tool("flag_dispute", "File a dispute for one of the user's transactions",
                       {{"transaction_id", string_property("Disputed transaction id")},
                        {"complaint", string_property("What is wrong with the transaction")},
                        {"user_id", user},
                        {"session_id", session},
                        {"trace_id", trace}},
                       {"transaction_id", "complaint"}));

  tools.push_back(tool("get_dispute_status", "Fetch the status of one of the user's disputes",
                       {{"dispute_id", string_property("Dispute id")},
                        {"user_id", user},
                        {"session_id", session}},
                       {"dispute_id"}));

  tools.push_back(tool("list_disputes", "List the user's disputes, most recent first",
                       {{"user_id", user}, {"session_id", session}}, {}));

  tools.push_back(tool("get_audit_trace", "Fetch audit events by trace_id",
                       {{"trace_id", string_property("Trace id")}}, {"trace_id"}));

  tools.push_back(tool("provider_status", "Circuit and rate-limit state of every provider",
                       json::object(), {}));

  tools.push_back(tool("ask_reasoning_provider",
                       "Send a prompt to the reasoning provider through the resilience wrapper",
                       {{"prompt", string_property("Redacted prompt")},
                        {"purpose", string_property("Short purpose tag")},
                        {"session_id", session},
                        {"trace_id", trace}},
                       {"prompt"}));

  tools.push_back(tool("end_session", "Tear down a session and cancel its in-flight calls",
                       {{"session_id", session}}, {"session_id"}));

  return json{{"tools", tools}};
}

json handle_tools_call(const JsonRpcRequest& req, ServerContext& ctx) {
  const auto name_it = req.params.find("name");
  const std::string tool_name =
      name_it != req.params.end() && name_it->is_string() ? name_it->get<std::string>() : "";
  const auto args_it = req.params.find("arguments");
  const json tool_params =
      args_it != req.params.end() && args_it->is_object() ? *args_it : json::object();

  // Tool registry
  static const auto tool_registry = handlers::build_tool_registry();

  const auto it = tool_registry.find(tool_name);
  if (it == tool_registry.end()) {
    return handlers::error_json("unknown_tool", "Unknown tool: " + tool_name);
  }

  return it->second(tool_params, ctx);
}

std::unordered_map<std::string, MethodHandler> build_method_registry() {
  return {
      {"initialize", handle_initialize},
      {"ping", handle_ping},
      {"tools/list", handle_tools_list},
      {"tools/call", handle_tools_call},
  };
}

}  // namespace ftr::server
