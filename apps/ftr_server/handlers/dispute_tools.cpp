#include "dispute_tools.h"

#include "ftr/app/app_service.h"

#include "tool_support.h"

namespace ftr::server::handlers {

using json = nlohmann::json;

json handle_flag_dispute(const json& params, ServerContext& ctx) {
  note_turn_if_session(params, ctx);

  const auto txn_id = optional_string(params, "transaction_id");
  const auto complaint = optional_string(params, "complaint");
  if (!txn_id.has_value() || !complaint.has_value()) {
    return error_json("invalid_params", "transaction_id and complaint are required");
  }

  app::FlagDisputeRequest request{
      .user_id = user_for(params, ctx),
      .transaction_id = core::TransactionId{*txn_id},
      .complaint = *complaint,
      .trace_id = optional_string(params, "trace_id"),
  };

  auto dispute = app::flag_dispute(request, ctx.services, ctx.id_gen, ctx.clock);
  if (!dispute.has_value()) {
    return error_json(dispute.error());
  }
  return dispute_json(dispute.value());
}

json handle_get_dispute_status(const json& params, ServerContext& ctx) {
  note_turn_if_session(params, ctx);

  const auto dispute_id = optional_string(params, "dispute_id");
  if (!dispute_id.has_value()) {
    return error_json("invalid_params", "dispute_id is required");
  }

  auto dispute = app::get_dispute_status(user_for(params, ctx), core::DisputeId{*dispute_id},
                                         ctx.services);
  if (!dispute.has_value()) {
    return error_json(dispute.error());
  }
  return dispute_json(dispute.value());
}

json handle_list_disputes(const json& params, ServerContext& ctx) {
  note_turn_if_session(params, ctx);

  json disputes = json::array();
  for (const auto& dispute : app::list_disputes(user_for(params, ctx), ctx.services)) {
    disputes.push_back(dispute_json(dispute));
  }
  return {{"disputes", disputes}, {"count", disputes.size()}};
}

}  // namespace ftr::server::handlers
