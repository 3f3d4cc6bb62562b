#include "ftr/storage/sqlite/sqlite_repositories.h"

#include <sqlite3.h>

namespace ftr::storage::sqlite {

namespace {

constexpr const char* kSelectColumns =
    "SELECT transaction_id, user_id, amount_minor, currency, txn_date, merchant_id, status,"
    "       description, category, card_last4, location FROM transactions";

// read_row returns nullopt for a row whose date or status no longer parses.
std::optional<domain::Transaction> read_row(const PreparedStatement& stmt) {
  const auto date = core::parse_iso_date(stmt.column_text(4));
  const auto status = domain::parse_transaction_status(stmt.column_text(6));
  if (!date.has_value() || !status.has_value()) {
    return std::nullopt;
  }

  domain::Transaction txn;
  txn.id = core::TransactionId{stmt.column_text(0)};
  txn.user_id = core::UserId{stmt.column_text(1)};
  txn.amount = core::Money{stmt.column_int64(2), stmt.column_text(3)};
  txn.date = *date;
  txn.merchant_id = core::MerchantId{stmt.column_text(5)};
  txn.status = *status;
  txn.description = stmt.column_text(7);
  txn.category = stmt.column_text(8);
  txn.card_last4 = stmt.column_text(9);
  if (!stmt.column_is_null(10)) {
    txn.location = stmt.column_text(10);
  }
  return txn;
}

}  // namespace

SqliteTransactionRepository::SqliteTransactionRepository(std::shared_ptr<SqliteDb> db)
    : db_(std::move(db)) {}

core::Result<bool, core::Error> SqliteTransactionRepository::upsert(
    const domain::Transaction& txn) {
  using R = core::Result<bool, core::Error>;

  if (auto valid = txn.validate(); !valid.has_value()) {
    return valid;
  }

  const char* sql = R"(
    INSERT INTO transactions (transaction_id, user_id, amount_minor, currency, txn_date,
                              merchant_id, status, description, category, card_last4, location)
    VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
    ON CONFLICT(transaction_id) DO UPDATE SET
      user_id = excluded.user_id,
      amount_minor = excluded.amount_minor,
      currency = excluded.currency,
      txn_date = excluded.txn_date,
      merchant_id = excluded.merchant_id,
      status = excluded.status,
      description = excluded.description,
      category = excluded.category,
      card_last4 = excluded.card_last4,
      location = excluded.location
  )";

  std::lock_guard<std::mutex> lock(db_->mutex());
  PreparedStatement stmt(db_->connection(), sql);
  if (!stmt.is_valid()) {
    return R::err(core::make_error(core::ErrorKind::kStorage, stmt.error()));
  }

  stmt.bind_text(1, txn.id.value);
  stmt.bind_text(2, txn.user_id.value);
  stmt.bind_int64(3, txn.amount.minor_units);
  stmt.bind_text(4, txn.amount.currency);
  stmt.bind_text(5, core::format_iso_date(txn.date));
  stmt.bind_text(6, txn.merchant_id.value);
  stmt.bind_text(7, std::string{domain::to_string(txn.status)});
  stmt.bind_text(8, txn.description);
  stmt.bind_text(9, txn.category);
  stmt.bind_text(10, txn.card_last4);
  if (txn.location.has_value()) {
    stmt.bind_text(11, *txn.location);
  } else {
    stmt.bind_null(11);
  }

  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    return R::err(core::make_error(core::ErrorKind::kStorage,
                                   "transaction upsert failed: " + db_->last_error()));
  }
  return R::ok(true);
}

std::optional<domain::Transaction> SqliteTransactionRepository::get(
    const core::TransactionId& id) const {
  std::lock_guard<std::mutex> lock(db_->mutex());
  PreparedStatement stmt(db_->connection(),
                         std::string{kSelectColumns} + " WHERE transaction_id = ?");
  if (!stmt.is_valid()) {
    return std::nullopt;
  }

  stmt.bind_text(1, id.value);
  if (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    return read_row(stmt);
  }
  return std::nullopt;
}

std::vector<domain::Transaction> SqliteTransactionRepository::list_for_user(
    const core::UserId& user) const {
  std::lock_guard<std::mutex> lock(db_->mutex());
  PreparedStatement stmt(db_->connection(), std::string{kSelectColumns} +
                                                " WHERE user_id = ? ORDER BY transaction_id");
  if (!stmt.is_valid()) {
    return {};
  }

  stmt.bind_text(1, user.value);
  std::vector<domain::Transaction> result;
  while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    if (auto txn = read_row(stmt)) {
      result.push_back(std::move(*txn));
    }
  }
  return result;
}

}  // namespace ftr::storage::sqlite
