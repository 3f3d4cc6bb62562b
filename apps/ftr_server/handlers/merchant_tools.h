#pragma once

#include <nlohmann/json.hpp>

#include "../server_context.h"

namespace ftr::server::handlers {

nlohmann::json handle_search_merchant(const nlohmann::json& params, ServerContext& ctx);
nlohmann::json handle_get_merchant(const nlohmann::json& params, ServerContext& ctx);

}  // namespace ftr::server::handlers
