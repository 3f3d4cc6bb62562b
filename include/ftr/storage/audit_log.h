#pragma once

#include "ftr/storage/audit_event.h"

#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace ftr::storage {

// IAuditLog receives events from every concurrent session and provider call, so
// implementations must accept append() from several threads.
class IAuditLog {
 public:
  virtual ~IAuditLog() = default;
  virtual void append(const AuditEvent& event) = 0;
  // query returns the events of one trace in append order; an empty trace_id returns all.
  virtual std::vector<AuditEvent> query(const std::string& trace_id) const = 0;
  [[nodiscard]] virtual std::vector<std::string> list_trace_ids() const = 0;

 protected:
  IAuditLog() = default;
  IAuditLog(const IAuditLog&) = default;
  IAuditLog& operator=(const IAuditLog&) = default;
  IAuditLog(IAuditLog&&) = default;
  IAuditLog& operator=(IAuditLog&&) = default;
};

class InMemoryAuditLog final : public IAuditLog {
 public:
  InMemoryAuditLog() = default;

  void append(const AuditEvent& event) override;
  [[nodiscard]] std::vector<AuditEvent> query(const std::string& trace_id) const override;
  [[nodiscard]] std::vector<std::string> list_trace_ids() const override;

 private:
  mutable std::mutex mutex_;
  std::vector<AuditEvent> events_;
  std::set<std::string> trace_ids_;
};

}  // namespace ftr::storage
