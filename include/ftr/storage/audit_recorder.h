#pragma once

#include "ftr/core/clock.h"
#include "ftr/core/id_generator.h"
#include "ftr/storage/audit_log.h"

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace ftr::storage {

// AuditRecorder stamps events with an id and a timestamp before appending them.
// A recorder without a log is valid and records nothing, which lets components that make
// auditing optional hold one unconditionally.
class AuditRecorder {
 public:
  AuditRecorder(IAuditLog* log, core::IIdGenerator& ids, core::IClock& clock)
      : log_(log), ids_(ids), clock_(clock) {}

  void record(const std::string& trace_id, std::string_view event_type,
              const nlohmann::json& payload, std::vector<std::string> refs = {}) const;

  [[nodiscard]] bool enabled() const { return log_ != nullptr; }

 private:
  IAuditLog* log_;
  core::IIdGenerator& ids_;
  core::IClock& clock_;
};

}  // namespace ftr::storage
