#include "ftr/storage/sqlite/sqlite_db.h"

#include <sqlite3.h>

namespace ftr::storage::sqlite {

// Deleter implementations
void SqliteDb::SqliteDeleter::operator()(sqlite3* db) const {
  if (db != nullptr) {
    sqlite3_close(db);
  }
}

void PreparedStatement::StmtDeleter::operator()(sqlite3_stmt* stmt) const {
  if (stmt != nullptr) {
    sqlite3_finalize(stmt);
  }
}

// Embedded schema v1 SQL
constexpr const char* kSchemaV1 = R"(
PRAGMA foreign_keys = ON;

CREATE TABLE IF NOT EXISTS schema_version (
  version INTEGER PRIMARY KEY,
  applied_at TEXT NOT NULL
);

CREATE TABLE IF NOT EXISTS merchants (
  merchant_id TEXT PRIMARY KEY,
  canonical_name TEXT NOT NULL,
  category TEXT NOT NULL,
  description TEXT NOT NULL,
  address TEXT,
  phone TEXT,
  website TEXT,
  parent_company TEXT
);

CREATE TABLE IF NOT EXISTS merchant_aliases (
  merchant_id TEXT NOT NULL,
  idx INTEGER NOT NULL,
  alias TEXT NOT NULL,
  PRIMARY KEY(merchant_id, idx),
  FOREIGN KEY(merchant_id) REFERENCES merchants(merchant_id)
    ON DELETE CASCADE
);

CREATE TABLE IF NOT EXISTS transactions (
  transaction_id TEXT PRIMARY KEY,
  user_id TEXT NOT NULL,
  amount_minor INTEGER NOT NULL,
  currency TEXT NOT NULL,
  txn_date TEXT NOT NULL,
  merchant_id TEXT NOT NULL,
  status TEXT NOT NULL,
  description TEXT NOT NULL,
  category TEXT NOT NULL,
  card_last4 TEXT NOT NULL,
  location TEXT
);

CREATE INDEX IF NOT EXISTS idx_transactions_user ON transactions(user_id);

CREATE TABLE IF NOT EXISTS disputes (
  dispute_id TEXT PRIMARY KEY,
  transaction_id TEXT NOT NULL,
  user_id TEXT NOT NULL,
  created_at TEXT NOT NULL,
  complaint TEXT NOT NULL,
  status TEXT NOT NULL,
  resolution_notes TEXT
);

CREATE INDEX IF NOT EXISTS idx_disputes_user ON disputes(user_id, created_at);
CREATE INDEX IF NOT EXISTS idx_disputes_transaction ON disputes(transaction_id);

CREATE TABLE IF NOT EXISTS audit_events (
  event_id TEXT PRIMARY KEY,
  trace_id TEXT NOT NULL,
  event_type TEXT NOT NULL,
  payload TEXT NOT NULL,
  created_at TEXT NOT NULL,
  entity_ids_json TEXT NOT NULL,
  seq INTEGER NOT NULL
);

CREATE INDEX IF NOT EXISTS idx_audit_events_trace ON audit_events(trace_id, seq);

INSERT OR IGNORE INTO schema_version (version, applied_at)
VALUES (1, datetime('now'));
)";

SqliteDb::SqliteDb(sqlite3* db) : db_(db) {}

core::Result<std::shared_ptr<SqliteDb>, std::string> SqliteDb::open(const std::string& path) {
  sqlite3* db = nullptr;
  int rc = sqlite3_open(path.c_str(), &db);
  if (rc != SQLITE_OK) {
    std::string error = db != nullptr ? sqlite3_errmsg(db) : "out of memory";
    sqlite3_close(db);
    return core::Result<std::shared_ptr<SqliteDb>, std::string>::err("Failed to open database: " +
                                                                     error);
  }

  // Enable foreign keys
  char* err_msg = nullptr;
  rc = sqlite3_exec(db, "PRAGMA foreign_keys = ON;", nullptr, nullptr, &err_msg);
  if (rc != SQLITE_OK) {
    std::string error = err_msg != nullptr ? err_msg : "Unknown error";
    sqlite3_free(err_msg);
    sqlite3_close(db);
    return core::Result<std::shared_ptr<SqliteDb>, std::string>::err(
        "Failed to enable foreign keys: " + error);
  }

  return core::Result<std::shared_ptr<SqliteDb>, std::string>::ok(
      std::shared_ptr<SqliteDb>(new SqliteDb(db)));
}

int SqliteDb::get_schema_version() const {
  PreparedStatement stmt(db_.get(),
                         "SELECT version FROM schema_version ORDER BY version DESC LIMIT 1");
  if (!stmt.is_valid()) {
    return 0;  // Table doesn't exist yet
  }

  if (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    return static_cast<int>(stmt.column_int64(0));
  }
  return 0;
}

core::Result<bool, std::string> SqliteDb::ensure_schema_v1() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (get_schema_version() >= 1) {
    return core::Result<bool, std::string>::ok(true);
  }

  char* err_msg = nullptr;
  int rc = sqlite3_exec(db_.get(), kSchemaV1, nullptr, nullptr, &err_msg);
  if (rc != SQLITE_OK) {
    std::string error = err_msg != nullptr ? err_msg : "Unknown error";
    sqlite3_free(err_msg);
    return core::Result<bool, std::string>::err("Failed to apply schema v1: " + error);
  }

  return core::Result<bool, std::string>::ok(true);
}

core::Result<bool, std::string> SqliteDb::exec(const std::string& sql) {
  char* err_msg = nullptr;
  int rc = sqlite3_exec(db_.get(), sql.c_str(), nullptr, nullptr, &err_msg);
  if (rc != SQLITE_OK) {
    std::string error = err_msg != nullptr ? err_msg : "Unknown error";
    sqlite3_free(err_msg);
    return core::Result<bool, std::string>::err("SQL execution failed: " + error);
  }

  return core::Result<bool, std::string>::ok(true);
}

std::string SqliteDb::last_error() const { return sqlite3_errmsg(db_.get()); }

PreparedStatement::PreparedStatement(sqlite3* db, const std::string& sql) {
  sqlite3_stmt* raw_stmt = nullptr;
  int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &raw_stmt, nullptr);
  if (rc != SQLITE_OK) {
    error_ = sqlite3_errmsg(db);
    sqlite3_finalize(raw_stmt);
  } else {
    stmt_.reset(raw_stmt);
  }
}

void PreparedStatement::bind_text(const int index, const std::string& value) {
  sqlite3_bind_text(stmt_.get(), index, value.c_str(), -1, SQLITE_TRANSIENT);
}

void PreparedStatement::bind_int64(const int index, const long long value) {
  sqlite3_bind_int64(stmt_.get(), index, value);
}

void PreparedStatement::bind_null(const int index) { sqlite3_bind_null(stmt_.get(), index); }

std::string PreparedStatement::column_text(const int column) const {
  const unsigned char* raw = sqlite3_column_text(stmt_.get(), column);
  if (raw == nullptr) {
    return {};
  }
  return reinterpret_cast<const char*>(raw);  // NOLINT
}

long long PreparedStatement::column_int64(const int column) const {
  return sqlite3_column_int64(stmt_.get(), column);
}

bool PreparedStatement::column_is_null(const int column) const {
  return sqlite3_column_type(stmt_.get(), column) == SQLITE_NULL;
}

void PreparedStatement::reset() {
  if (stmt_) {
    sqlite3_reset(stmt_.get());
    sqlite3_clear_bindings(stmt_.get());
  }
}

}  // namespace ftr::storage::sqlite
