#pragma once

#include "ftr/storage/audit_log.h"
#include "ftr/storage/sqlite/sqlite_db.h"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace ftr::storage::sqlite {

// SqliteAuditLog persists audit events. Events of one trace keep their append order through
// a per-trace sequence number, resumed from the database when a trace is first seen.
class SqliteAuditLog final : public IAuditLog {
 public:
  explicit SqliteAuditLog(std::shared_ptr<SqliteDb> db);

  void append(const AuditEvent& event) override;
  [[nodiscard]] std::vector<AuditEvent> query(const std::string& trace_id) const override;
  [[nodiscard]] std::vector<std::string> list_trace_ids() const override;

 private:
  std::shared_ptr<SqliteDb> db_;
  std::map<std::string, long long> next_seq_;  // guarded by db_->mutex()

  // next_sequence returns the seq for a new event of trace_id. Caller holds the db mutex.
  long long next_sequence(const std::string& trace_id);
};

}  // namespace ftr::storage::sqlite
