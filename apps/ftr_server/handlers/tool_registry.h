#pragma once

#include <nlohmann/json.hpp>

#include "../server_context.h"
#include "tool_support.h"
#include <functional>
#include <string>
#include <unordered_map>

namespace ftr::server::handlers {

using ToolHandler = std::function<nlohmann::json(const nlohmann::json& params, ServerContext& ctx)>;

std::unordered_map<std::string, ToolHandler> build_tool_registry();

}  // namespace ftr::server::handlers
