#include "ftr/storage/audit_recorder.h"

namespace ftr::storage {

void AuditRecorder::record(const std::string& trace_id, const std::string_view event_type,
                           const nlohmann::json& payload, std::vector<std::string> refs) const {
  if (log_ == nullptr) {
    return;
  }
  log_->append(AuditEvent{ids_.next("evt"), trace_id, std::string{event_type}, payload.dump(),
                          clock_.now_iso8601(), std::move(refs)});
}

}  // namespace ftr::storage
