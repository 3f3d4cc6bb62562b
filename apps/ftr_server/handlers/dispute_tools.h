#pragma once

#include <nlohmann/json.hpp>

#include "../server_context.h"

namespace ftr::server::handlers {

nlohmann::json handle_flag_dispute(const nlohmann::json& params, ServerContext& ctx);
nlohmann::json handle_get_dispute_status(const nlohmann::json& params, ServerContext& ctx);
nlohmann::json handle_list_disputes(const nlohmann::json& params, ServerContext& ctx);

}  // namespace ftr::server::handlers
