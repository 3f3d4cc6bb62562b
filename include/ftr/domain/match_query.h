#pragma once

#include "ftr/core/calendar.h"
#include "ftr/core/error.h"
#include "ftr/core/ids.h"
#include "ftr/core/money.h"
#include "ftr/core/result.h"

#include <optional>
#include <string>

namespace ftr::domain {

// MatchQuery is the structured, already-sanitized description of the transaction the user
// does not recognize. It is built by the conversational layer, one per resolution attempt.
// Precondition: at least one field is present.
struct MatchQuery {
  std::optional<core::Money> amount;
  std::optional<core::CalendarDate> date;
  std::optional<std::string> merchant_text;
  std::optional<core::TransactionId> transaction_id;

  [[nodiscard]] bool has_any_field() const {
    return amount.has_value() || date.has_value() || merchant_text.has_value() ||
           transaction_id.has_value();
  }
};

// normalize_query trims merchant_text and transaction_id, dropping them when blank.
[[nodiscard]] MatchQuery normalize_query(const MatchQuery& query);

// validate_query rejects a query before any scoring or storage access:
// - no field populated
// - negative amount or a currency code that is not 3 letters
// - an impossible calendar date
// - an empty transaction id
// Errors are ErrorKind::kInvalidQuery.
[[nodiscard]] core::Result<bool, core::Error> validate_query(const MatchQuery& query);

// query_fingerprint is a stable textual identity of a query, recorded on pending
// disambiguation state so an answer can be tied back to the question that produced it.
[[nodiscard]] std::string query_fingerprint(const MatchQuery& query);

}  // namespace ftr::domain
