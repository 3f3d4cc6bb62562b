#pragma once

#include <nlohmann/json.hpp>

#include "../server_context.h"

namespace ftr::server::handlers {

nlohmann::json handle_provider_status(const nlohmann::json& params, ServerContext& ctx);
nlohmann::json handle_ask_reasoning_provider(const nlohmann::json& params, ServerContext& ctx);

}  // namespace ftr::server::handlers
