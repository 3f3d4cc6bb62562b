#pragma once

#include <nlohmann/json.hpp>

#include "mcp_protocol.h"
#include "server_context.h"
#include <functional>
#include <string>
#include <unordered_map>

namespace ftr::server {

using MethodHandler = std::function<nlohmann::json(const JsonRpcRequest& req, ServerContext& ctx)>;

nlohmann::json handle_initialize(const JsonRpcRequest& req, ServerContext& ctx);
nlohmann::json handle_ping(const JsonRpcRequest& req, ServerContext& ctx);
nlohmann::json handle_tools_list(const JsonRpcRequest& req, ServerContext& ctx);

// handle_tools_call dispatches params.name to the tool registry with params.arguments.
// Tool failures come back as a normal result carrying an "error" object; only protocol
// problems become JSON-RPC errors.
nlohmann::json handle_tools_call(const JsonRpcRequest& req, ServerContext& ctx);

// Methods the server answers: initialize, ping, tools/list, tools/call.
std::unordered_map<std::string, MethodHandler> build_method_registry();

}  // namespace ftr::server
