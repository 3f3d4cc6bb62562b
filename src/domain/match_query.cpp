#include "ftr/domain/match_query.h"

#include "ftr/core/normalization.h"

#include <utility>

namespace ftr::domain {

MatchQuery normalize_query(const MatchQuery& query) {
  MatchQuery normalized = query;

  if (normalized.merchant_text.has_value()) {
    std::string text = core::trim(*normalized.merchant_text);
    if (text.empty()) {
      normalized.merchant_text.reset();
    } else {
      normalized.merchant_text = std::move(text);
    }
  }

  if (normalized.transaction_id.has_value()) {
    std::string id = core::trim(normalized.transaction_id->value);
    if (id.empty()) {
      normalized.transaction_id.reset();
    } else {
      normalized.transaction_id = core::TransactionId{std::move(id)};
    }
  }

  return normalized;
}

core::Result<bool, core::Error> validate_query(const MatchQuery& query) {
  using R = core::Result<bool, core::Error>;

  if (!query.has_any_field()) {
    return R::err(core::make_error(
        core::ErrorKind::kInvalidQuery,
        "query must specify at least one of amount, date, merchant_text, transaction_id"));
  }

  if (query.amount.has_value()) {
    if (query.amount->minor_units < 0) {
      return R::err(
          core::make_error(core::ErrorKind::kInvalidQuery, "amount must not be negative"));
    }
    if (query.amount->currency.size() != 3) {
      return R::err(core::make_error(core::ErrorKind::kInvalidQuery,
                                     "amount currency must be a 3-letter code"));
    }
  }

  if (query.date.has_value() && !query.date->ok()) {
    return R::err(core::make_error(core::ErrorKind::kInvalidQuery, "date is not a valid date"));
  }

  if (query.transaction_id.has_value() && query.transaction_id->value.empty()) {
    return R::err(
        core::make_error(core::ErrorKind::kInvalidQuery, "transaction_id must not be empty"));
  }

  return R::ok(true);
}

std::string query_fingerprint(const MatchQuery& query) {
  std::string fp;
  fp += "amount=";
  if (query.amount.has_value()) {
    fp += core::format_money(*query.amount);
  }
  fp += "|date=";
  if (query.date.has_value()) {
    fp += core::format_iso_date(*query.date);
  }
  fp += "|merchant=";
  if (query.merchant_text.has_value()) {
    fp += core::normalize_name_key(*query.merchant_text);
  }
  fp += "|txn=";
  if (query.transaction_id.has_value()) {
    fp += query.transaction_id->value;
  }
  return fp;
}

}  // namespace ftr::domain
