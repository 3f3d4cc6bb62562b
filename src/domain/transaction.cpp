#include "ftr/domain/transaction.h"

namespace ftr::domain {

std::string_view to_string(const TransactionStatus status) {
  switch (status) {
    case TransactionStatus::kPending:
      return "pending";
    case TransactionStatus::kPosted:
      return "posted";
    case TransactionStatus::kRefunded:
      return "refunded";
  }
  return "posted";
}

std::optional<TransactionStatus> parse_transaction_status(const std::string_view text) {
  if (text == "pending") {
    return TransactionStatus::kPending;
  }
  if (text == "posted") {
    return TransactionStatus::kPosted;
  }
  if (text == "refunded") {
    return TransactionStatus::kRefunded;
  }
  return std::nullopt;
}

core::Result<bool, core::Error> Transaction::validate() const {
  using R = core::Result<bool, core::Error>;

  if (id.value.empty()) {
    return R::err(core::make_error(core::ErrorKind::kStorage, "transaction id must not be empty"));
  }
  if (user_id.value.empty()) {
    return R::err(core::make_error(core::ErrorKind::kStorage,
                                   "transaction " + id.value + ": user_id must not be empty"));
  }
  if (merchant_id.value.empty()) {
    return R::err(core::make_error(core::ErrorKind::kStorage,
                                   "transaction " + id.value + ": merchant_id must not be empty"));
  }
  if (!date.ok()) {
    return R::err(
        core::make_error(core::ErrorKind::kStorage, "transaction " + id.value + ": invalid date"));
  }
  if (amount.currency.size() != 3) {
    return R::err(core::make_error(core::ErrorKind::kStorage,
                                   "transaction " + id.value + ": currency must be 3 letters"));
  }
  return R::ok(true);
}

}  // namespace ftr::domain
