#pragma once

#include "ftr/core/result.h"

#include <memory>
#include <mutex>
#include <string>

// Forward declare sqlite3 to avoid exposing SQLite header in public API
struct sqlite3;
struct sqlite3_stmt;

namespace ftr::storage::sqlite {

// SqliteDb manages a SQLite database connection and schema versioning.
// Responsibilities:
// - Open/close database connection
// - Apply the embedded schema
// - Provide prepared statement helpers
// - Enable foreign keys
//
// One connection is shared by the repositories built on it; they hold mutex() for the
// duration of each operation so multi-statement writes never interleave across sessions.
class SqliteDb {
 public:
  // Open or create database at path.
  // If path is ":memory:", creates in-memory database.
  [[nodiscard]] static core::Result<std::shared_ptr<SqliteDb>, std::string> open(
      const std::string& path);

  ~SqliteDb() = default;

  SqliteDb(const SqliteDb&) = delete;
  SqliteDb& operator=(const SqliteDb&) = delete;
  SqliteDb(SqliteDb&&) = delete;
  SqliteDb& operator=(SqliteDb&&) = delete;

  // Get current schema version (0 if no schema applied)
  [[nodiscard]] int get_schema_version() const;

  // Apply schema v1 if not already applied
  [[nodiscard]] core::Result<bool, std::string> ensure_schema_v1();

  // Execute SQL statement (for non-query operations)
  [[nodiscard]] core::Result<bool, std::string> exec(const std::string& sql);

  // Get raw connection (for prepared statements)
  // Should be used only by repository implementations
  [[nodiscard]] sqlite3* connection() const { return db_.get(); }

  [[nodiscard]] std::string last_error() const;

  [[nodiscard]] std::mutex& mutex() const { return mutex_; }

 private:
  struct SqliteDeleter {
    void operator()(sqlite3* db) const;
  };

  explicit SqliteDb(sqlite3* db);

  std::unique_ptr<sqlite3, SqliteDeleter> db_;
  mutable std::mutex mutex_;
};

// RAII wrapper for prepared statements
class PreparedStatement {
 public:
  PreparedStatement(sqlite3* db, const std::string& sql);
  ~PreparedStatement() = default;

  PreparedStatement(const PreparedStatement&) = delete;
  PreparedStatement& operator=(const PreparedStatement&) = delete;
  PreparedStatement(PreparedStatement&&) = delete;
  PreparedStatement& operator=(PreparedStatement&&) = delete;

  [[nodiscard]] bool is_valid() const { return stmt_ != nullptr; }
  [[nodiscard]] std::string error() const { return error_; }
  [[nodiscard]] sqlite3_stmt* get() const { return stmt_.get(); }

  // Binding helpers (1-based parameter index)
  void bind_text(int index, const std::string& value);
  void bind_int64(int index, long long value);
  void bind_null(int index);

  // Column helpers; a NULL text column reads as an empty string.
  [[nodiscard]] std::string column_text(int column) const;
  [[nodiscard]] long long column_int64(int column) const;
  [[nodiscard]] bool column_is_null(int column) const;

  // Reset statement for reuse
  void reset();

 private:
  struct StmtDeleter {
    void operator()(sqlite3_stmt* stmt) const;
  };

  std::unique_ptr<sqlite3_stmt, StmtDeleter> stmt_;
  std::string error_;
};

}  // namespace ftr::storage::sqlite
