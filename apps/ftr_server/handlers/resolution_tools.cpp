#include "resolution_tools.h"

#include "ftr/app/app_service.h"

#include "tool_support.h"

namespace ftr::server::handlers {

using json = nlohmann::json;

namespace {

json response_json(const app::ResolutionResponse& response) {
  json result = turn_json(response.turn);
  result["trace_id"] = response.trace_id;
  result["session_id"] = response.session_id.value;
  result["session_state"] = std::string{disambiguation::to_string(response.state)};
  return result;
}

}  // namespace

json handle_resolve_transaction(const json& params, ServerContext& ctx) {
  const auto session = optional_string(params, "session_id");
  if (!session.has_value()) {
    return error_json("invalid_params", "session_id is required");
  }

  auto query = parse_match_query(params, ctx.config.engine.default_currency);
  if (!query.has_value()) {
    return error_json(query.error());
  }

  app::ResolutionRequest request{
      .session_id = core::SessionId{*session},
      .user_id = user_for(params, ctx),
      .query = query.value(),
      .trace_id = optional_string(params, "trace_id"),
  };

  auto response = app::run_resolution_turn(request, ctx.services, ctx.id_gen, ctx.clock);
  if (!response.has_value()) {
    return error_json(response.error());
  }
  return response_json(response.value());
}

json handle_answer_clarification(const json& params, ServerContext& ctx) {
  const auto session = optional_string(params, "session_id");
  if (!session.has_value()) {
    return error_json("invalid_params", "session_id is required");
  }

  // Exactly one of rank, transaction_id or refine selects the answer.
  std::optional<disambiguation::Selection> selection;
  if (const auto it = params.find("rank"); it != params.end() && it->is_number_integer()) {
    const auto rank = it->get<long long>();
    selection = disambiguation::SelectRank{rank < 0 ? 0 : static_cast<std::size_t>(rank)};
  } else if (const auto txn_id = optional_string(params, "transaction_id")) {
    selection = disambiguation::SelectTransaction{core::TransactionId{*txn_id}};
  } else if (const auto refine = params.find("refine");
             refine != params.end() && refine->is_object()) {
    auto query = parse_match_query(*refine, ctx.config.engine.default_currency);
    if (!query.has_value()) {
      return error_json(query.error());
    }
    selection = disambiguation::RefineQuery{query.value()};
  }
  if (!selection.has_value()) {
    return error_json("invalid_params", "one of rank, transaction_id or refine is required");
  }

  app::ClarificationAnswerRequest request{
      .session_id = core::SessionId{*session},
      .answer = disambiguation::ClarificationAnswer{*selection, optional_string(params, "in_reply_to")},
      .trace_id = optional_string(params, "trace_id"),
  };

  auto response = app::answer_clarification(request, ctx.services, ctx.id_gen, ctx.clock);
  if (!response.has_value()) {
    return error_json(response.error());
  }
  return response_json(response.value());
}

json handle_end_session(const json& params, ServerContext& ctx) {
  const auto session = optional_string(params, "session_id");
  if (!session.has_value()) {
    return error_json("invalid_params", "session_id is required");
  }
  const bool ended = app::end_session(core::SessionId{*session}, ctx.services);
  return {{"session_id", *session}, {"ended", ended}};
}

}  // namespace ftr::server::handlers
