#pragma once

#include <nlohmann/json.hpp>

#include "../server_context.h"

namespace ftr::server::handlers {

nlohmann::json handle_resolve_transaction(const nlohmann::json& params, ServerContext& ctx);
nlohmann::json handle_answer_clarification(const nlohmann::json& params, ServerContext& ctx);
nlohmann::json handle_end_session(const nlohmann::json& params, ServerContext& ctx);

}  // namespace ftr::server::handlers
