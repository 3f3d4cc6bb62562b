#include "tool_support.h"

#include "ftr/app/app_service.h"
#include "ftr/core/calendar.h"
#include "ftr/core/money.h"

namespace ftr::server::handlers {

using json = nlohmann::json;

json error_json(const std::string_view kind, const std::string& message) {
  return {{"error", {{"kind", std::string{kind}}, {"message", message}}}};
}

json error_json(const core::Error& error) {
  json result = error_json(core::to_string(error.kind), error.message);
  if (core::is_resilience_error(error.kind)) {
    result["error"]["attempts"] = error.attempts;
  }
  return result;
}

std::optional<std::string> optional_string(const json& params, const char* key) {
  const auto it = params.find(key);
  if (it == params.end() || !it->is_string()) {
    return std::nullopt;
  }
  std::string value = it->get<std::string>();
  if (value.empty()) {
    return std::nullopt;
  }
  return value;
}

core::UserId user_for(const json& params, const ServerContext& ctx) {
  return core::UserId{optional_string(params, "user_id").value_or(ctx.config.engine.default_user_id)};
}

core::Result<domain::MatchQuery, core::Error> parse_match_query(const json& params,
                                                               const std::string& currency) {
  using R = core::Result<domain::MatchQuery, core::Error>;

  domain::MatchQuery query;
  const std::string query_currency = optional_string(params, "currency").value_or(currency);

  if (const auto it = params.find("amount"); it != params.end() && !it->is_null()) {
    std::optional<core::Money> amount;
    if (it->is_number()) {
      amount = core::money_from_major(it->get<double>(), query_currency);
    } else if (it->is_string()) {
      amount = core::parse_money(it->get<std::string>(), query_currency);
    }
    if (!amount.has_value()) {
      return R::err(core::make_error(core::ErrorKind::kInvalidQuery, "amount is not a number"));
    }
    query.amount = amount;
  }

  if (const auto date_text = optional_string(params, "date")) {
    const auto date = core::parse_iso_date(*date_text);
    if (!date.has_value()) {
      return R::err(core::make_error(core::ErrorKind::kInvalidQuery,
                                     "date '" + *date_text + "' is not a valid YYYY-MM-DD date"));
    }
    query.date = date;
  }

  query.merchant_text = optional_string(params, "merchant");
  if (const auto txn_id = optional_string(params, "transaction_id")) {
    query.transaction_id = core::TransactionId{*txn_id};
  }
  return R::ok(std::move(query));
}

void note_turn_if_session(const json& params, ServerContext& ctx) {
  if (const auto session = optional_string(params, "session_id")) {
    app::note_session_turn(core::SessionId{*session}, ctx.services, ctx.id_gen, ctx.clock);
  }
}

json candidate_json(const domain::MatchCandidate& candidate) {
  const auto& txn = candidate.transaction;
  json j = {
      {"transaction_id", txn.id.value},
      {"amount", core::format_decimal(txn.amount)},
      {"currency", txn.amount.currency},
      {"date", core::format_iso_date(txn.date)},
      {"merchant_id", txn.merchant_id.value},
      {"description", txn.description},
      {"category", txn.category},
      {"card", "****" + txn.card_last4},
      {"status", std::string{domain::to_string(txn.status)}},
      {"scores",
       {{"amount", candidate.amount_score},
        {"date", candidate.date_score},
        {"merchant", candidate.merchant_score},
        {"composite", candidate.composite_score}}},
  };
  if (txn.location.has_value()) {
    j["location"] = txn.location.value();
  }
  return j;
}

json turn_json(const disambiguation::TurnResult& turn) {
  json j;
  j["outcome"] = std::string{domain::to_string(turn.result.outcome)};
  j["candidates"] = json::array();
  for (const auto& candidate : turn.result.candidates) {
    j["candidates"].push_back(candidate_json(candidate));
  }
  if (turn.result.best.has_value()) {
    j["best"] = candidate_json(turn.result.best.value());
  }
  if (turn.clarification.has_value()) {
    json options = json::array();
    for (const auto& option : turn.clarification->options) {
      options.push_back({{"rank", option.rank},
                         {"transaction_id", option.candidate.transaction.id.value}});
    }
    j["clarification"] = {{"query_fingerprint", turn.clarification->query_fingerprint},
                          {"options", options}};
  }
  return j;
}

json dispute_json(const domain::Dispute& dispute) {
  json j = {
      {"dispute_id", dispute.id.value},
      {"transaction_id", dispute.transaction_id.value},
      {"user_id", dispute.user_id.value},
      {"created_at", dispute.created_at},
      {"complaint", dispute.complaint},
      {"status", std::string{domain::to_string(dispute.status)}},
  };
  if (dispute.resolution_notes.has_value()) {
    j["resolution_notes"] = dispute.resolution_notes.value();
  }
  return j;
}

json merchant_json(const domain::Merchant& merchant) {
  json j = {
      {"merchant_id", merchant.id.value},
      {"name", merchant.canonical_name},
      {"aliases", merchant.aliases},
      {"category", merchant.category},
      {"description", merchant.description},
  };
  if (merchant.address.has_value()) {
    j["address"] = merchant.address.value();
  }
  if (merchant.phone.has_value()) {
    j["phone"] = merchant.phone.value();
  }
  if (merchant.website.has_value()) {
    j["website"] = merchant.website.value();
  }
  if (merchant.parent_company.has_value()) {
    j["parent_company"] = merchant.parent_company.value();
  }
  return j;
}

}  // namespace ftr::server::handlers
