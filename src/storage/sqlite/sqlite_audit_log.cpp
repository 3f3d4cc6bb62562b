#include "ftr/storage/sqlite/sqlite_audit_log.h"

#include <nlohmann/json.hpp>

#include <sqlite3.h>

namespace ftr::storage::sqlite {

SqliteAuditLog::SqliteAuditLog(std::shared_ptr<SqliteDb> db) : db_(std::move(db)) {}

long long SqliteAuditLog::next_sequence(const std::string& trace_id) {
  auto it = next_seq_.find(trace_id);
  if (it == next_seq_.end()) {
    // New trace: query DB for existing max sequence
    long long max_seq = -1;
    PreparedStatement stmt(db_->connection(),
                           "SELECT MAX(seq) FROM audit_events WHERE trace_id = ?");
    if (stmt.is_valid()) {
      stmt.bind_text(1, trace_id);
      if (sqlite3_step(stmt.get()) == SQLITE_ROW && !stmt.column_is_null(0)) {
        max_seq = stmt.column_int64(0);
      }
    }
    it = next_seq_.emplace(trace_id, max_seq + 1).first;
  }
  return it->second++;
}

void SqliteAuditLog::append(const AuditEvent& event) {
  // Serialize refs to JSON array
  const nlohmann::json refs_json = event.refs;

  const char* sql = R"(
    INSERT INTO audit_events
      (event_id, trace_id, event_type, payload, created_at, entity_ids_json, seq)
    VALUES (?, ?, ?, ?, ?, ?, ?)
  )";

  std::lock_guard<std::mutex> lock(db_->mutex());
  PreparedStatement stmt(db_->connection(), sql);
  if (!stmt.is_valid()) {
    return;
  }

  stmt.bind_text(1, event.event_id);
  stmt.bind_text(2, event.trace_id);
  stmt.bind_text(3, event.event_type);
  stmt.bind_text(4, event.payload);
  stmt.bind_text(5, event.created_at);
  stmt.bind_text(6, refs_json.dump());
  stmt.bind_int64(7, next_sequence(event.trace_id));

  sqlite3_step(stmt.get());
}

std::vector<AuditEvent> SqliteAuditLog::query(const std::string& trace_id) const {
  const std::string base =
      "SELECT event_id, trace_id, event_type, payload, created_at, entity_ids_json"
      "  FROM audit_events";
  const std::string sql = trace_id.empty() ? base + " ORDER BY rowid"
                                           : base + " WHERE trace_id = ? ORDER BY seq";

  std::lock_guard<std::mutex> lock(db_->mutex());
  PreparedStatement stmt(db_->connection(), sql);
  if (!stmt.is_valid()) {
    return {};
  }
  if (!trace_id.empty()) {
    stmt.bind_text(1, trace_id);
  }

  std::vector<AuditEvent> result;
  while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    AuditEvent event;
    event.event_id = stmt.column_text(0);
    event.trace_id = stmt.column_text(1);
    event.event_type = stmt.column_text(2);
    event.payload = stmt.column_text(3);
    event.created_at = stmt.column_text(4);

    // Deserialize refs JSON; a corrupt column yields no refs rather than a throw.
    const auto refs_json = nlohmann::json::parse(stmt.column_text(5), nullptr, false);
    if (refs_json.is_array()) {
      for (const auto& ref : refs_json) {
        if (ref.is_string()) {
          event.refs.push_back(ref.get<std::string>());
        }
      }
    }
    result.push_back(std::move(event));
  }
  return result;
}

std::vector<std::string> SqliteAuditLog::list_trace_ids() const {
  std::lock_guard<std::mutex> lock(db_->mutex());
  PreparedStatement stmt(db_->connection(),
                         "SELECT DISTINCT trace_id FROM audit_events ORDER BY trace_id");
  if (!stmt.is_valid()) {
    return {};
  }

  std::vector<std::string> ids;
  while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    ids.push_back(stmt.column_text(0));
  }
  return ids;
}

}  // namespace ftr::storage::sqlite
