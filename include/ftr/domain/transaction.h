#pragma once

#include "ftr/core/calendar.h"
#include "ftr/core/error.h"
#include "ftr/core/ids.h"
#include "ftr/core/money.h"
#include "ftr/core/result.h"

#include <optional>
#include <string>
#include <string_view>

namespace ftr::domain {

enum class TransactionStatus {
  kPending,
  kPosted,
  kRefunded,
};

[[nodiscard]] std::string_view to_string(TransactionStatus status);
[[nodiscard]] std::optional<TransactionStatus> parse_transaction_status(std::string_view text);

// Transaction is an immutable snapshot record owned by external storage.
// The engine only reads user-scoped snapshots of it.
struct Transaction {
  core::TransactionId id;
  core::UserId user_id;
  core::Money amount;
  core::CalendarDate date;
  core::MerchantId merchant_id;
  TransactionStatus status{TransactionStatus::kPosted};
  std::string description;
  std::string category;
  std::string card_last4;
  std::optional<std::string> location;

  // validate checks record invariants: non-empty ids, valid date, 3-letter currency.
  [[nodiscard]] core::Result<bool, core::Error> validate() const;
};

}  // namespace ftr::domain
