#pragma once

#include <nlohmann/json.hpp>

#include "ftr/core/error.h"
#include "ftr/core/ids.h"
#include "ftr/core/result.h"
#include "ftr/disambiguation/disambiguation_session.h"
#include "ftr/domain/dispute.h"
#include "ftr/domain/match_query.h"
#include "ftr/domain/merchant.h"

#include "../server_context.h"
#include <optional>
#include <string>
#include <string_view>

namespace ftr::server::handlers {

// Tool results report failures in-band as {"error": {"kind", "message"[, "attempts"]}} so
// the conversational layer can tell "busy" from "service down" from "bad input".
nlohmann::json error_json(std::string_view kind, const std::string& message);
nlohmann::json error_json(const core::Error& error);

// optional_string returns params[key] when it is a non-empty string.
std::optional<std::string> optional_string(const nlohmann::json& params, const char* key);

// user_for returns params.user_id or the configured default user.
core::UserId user_for(const nlohmann::json& params, const ServerContext& ctx);

// parse_match_query reads amount (number or decimal string), currency, date, merchant and
// transaction_id. A malformed amount or date is kInvalidQuery.
core::Result<domain::MatchQuery, core::Error> parse_match_query(const nlohmann::json& params,
                                                               const std::string& currency);

// note_turn_if_session counts this tool call as a turn of params.session_id, if given.
void note_turn_if_session(const nlohmann::json& params, ServerContext& ctx);

nlohmann::json candidate_json(const domain::MatchCandidate& candidate);
nlohmann::json turn_json(const disambiguation::TurnResult& turn);
nlohmann::json dispute_json(const domain::Dispute& dispute);
nlohmann::json merchant_json(const domain::Merchant& merchant);

}  // namespace ftr::server::handlers
