#include "merchant_tools.h"

#include "ftr/app/app_service.h"

#include "tool_support.h"

namespace ftr::server::handlers {

using json = nlohmann::json;

json handle_search_merchant(const json& params, ServerContext& ctx) {
  note_turn_if_session(params, ctx);

  const auto text = optional_string(params, "query");
  if (!text.has_value()) {
    return error_json("invalid_params", "query is required");
  }

  json matches = json::array();
  for (const auto& match : app::lookup_merchant(*text, ctx.services)) {
    json entry = merchant_json(match.merchant);
    entry["match"] = std::string{matching::to_string(match.tier)};
    matches.push_back(std::move(entry));
  }
  return {{"merchants", matches}, {"count", matches.size()}};
}

json handle_get_merchant(const json& params, ServerContext& ctx) {
  note_turn_if_session(params, ctx);

  const auto merchant_id = optional_string(params, "merchant_id");
  if (!merchant_id.has_value()) {
    return error_json("invalid_params", "merchant_id is required");
  }

  auto merchant = app::get_merchant(core::MerchantId{*merchant_id}, ctx.services);
  if (!merchant.has_value()) {
    return error_json(merchant.error());
  }
  return merchant_json(merchant.value());
}

}  // namespace ftr::server::handlers
