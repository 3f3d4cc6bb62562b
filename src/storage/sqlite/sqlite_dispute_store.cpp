#include "ftr/storage/sqlite/sqlite_repositories.h"

#include <sqlite3.h>

namespace ftr::storage::sqlite {

namespace {

constexpr const char* kSelectColumns =
    "SELECT dispute_id, transaction_id, user_id, created_at, complaint, status,"
    "       resolution_notes FROM disputes";

std::optional<domain::Dispute> read_row(const PreparedStatement& stmt) {
  const auto status = domain::parse_dispute_status(stmt.column_text(5));
  if (!status.has_value()) {
    return std::nullopt;
  }

  domain::Dispute dispute;
  dispute.id = core::DisputeId{stmt.column_text(0)};
  dispute.transaction_id = core::TransactionId{stmt.column_text(1)};
  dispute.user_id = core::UserId{stmt.column_text(2)};
  dispute.created_at = stmt.column_text(3);
  dispute.complaint = stmt.column_text(4);
  dispute.status = *status;
  if (!stmt.column_is_null(6)) {
    dispute.resolution_notes = stmt.column_text(6);
  }
  return dispute;
}

}  // namespace

SqliteDisputeStore::SqliteDisputeStore(std::shared_ptr<SqliteDb> db) : db_(std::move(db)) {}

core::Result<bool, core::Error> SqliteDisputeStore::upsert(const domain::Dispute& dispute) {
  using R = core::Result<bool, core::Error>;

  if (dispute.id.value.empty()) {
    return R::err(core::make_error(core::ErrorKind::kStorage, "dispute id must not be empty"));
  }

  const char* sql = R"(
    INSERT INTO disputes (dispute_id, transaction_id, user_id, created_at, complaint, status,
                          resolution_notes)
    VALUES (?, ?, ?, ?, ?, ?, ?)
    ON CONFLICT(dispute_id) DO UPDATE SET
      status = excluded.status,
      resolution_notes = excluded.resolution_notes
  )";

  std::lock_guard<std::mutex> lock(db_->mutex());
  PreparedStatement stmt(db_->connection(), sql);
  if (!stmt.is_valid()) {
    return R::err(core::make_error(core::ErrorKind::kStorage, stmt.error()));
  }

  stmt.bind_text(1, dispute.id.value);
  stmt.bind_text(2, dispute.transaction_id.value);
  stmt.bind_text(3, dispute.user_id.value);
  stmt.bind_text(4, dispute.created_at);
  stmt.bind_text(5, dispute.complaint);
  stmt.bind_text(6, std::string{domain::to_string(dispute.status)});
  if (dispute.resolution_notes.has_value()) {
    stmt.bind_text(7, *dispute.resolution_notes);
  } else {
    stmt.bind_null(7);
  }

  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    return R::err(core::make_error(core::ErrorKind::kStorage,
                                   "dispute upsert failed: " + db_->last_error()));
  }
  return R::ok(true);
}

std::optional<domain::Dispute> SqliteDisputeStore::get(const core::DisputeId& id) const {
  std::lock_guard<std::mutex> lock(db_->mutex());
  PreparedStatement stmt(db_->connection(), std::string{kSelectColumns} + " WHERE dispute_id = ?");
  if (!stmt.is_valid()) {
    return std::nullopt;
  }

  stmt.bind_text(1, id.value);
  if (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    return read_row(stmt);
  }
  return std::nullopt;
}

std::vector<domain::Dispute> SqliteDisputeStore::list_for_user(const core::UserId& user) const {
  std::lock_guard<std::mutex> lock(db_->mutex());
  PreparedStatement stmt(db_->connection(),
                         std::string{kSelectColumns} +
                             " WHERE user_id = ? ORDER BY created_at DESC, dispute_id DESC");
  if (!stmt.is_valid()) {
    return {};
  }

  stmt.bind_text(1, user.value);
  std::vector<domain::Dispute> result;
  while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    if (auto dispute = read_row(stmt)) {
      result.push_back(std::move(*dispute));
    }
  }
  return result;
}

std::optional<domain::Dispute> SqliteDisputeStore::find_open_for_transaction(
    const core::TransactionId& txn) const {
  std::lock_guard<std::mutex> lock(db_->mutex());
  PreparedStatement stmt(db_->connection(),
                         std::string{kSelectColumns} +
                             " WHERE transaction_id = ? AND status != 'resolved'"
                             " ORDER BY dispute_id LIMIT 1");
  if (!stmt.is_valid()) {
    return std::nullopt;
  }

  stmt.bind_text(1, txn.value);
  if (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    return read_row(stmt);
  }
  return std::nullopt;
}

}  // namespace ftr::storage::sqlite
