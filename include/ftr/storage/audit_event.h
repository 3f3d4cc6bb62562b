#pragma once

#include <string>
#include <vector>

namespace ftr::storage {

// AuditEvent is one append-only record of something the engine decided or attempted.
// payload is a compact JSON object; it never carries free text typed by the user.
struct AuditEvent {
  std::string event_id;
  std::string trace_id;
  std::string event_type;
  std::string payload;
  std::string created_at;
  std::vector<std::string> refs;  // ids of the records the event is about
};

}  // namespace ftr::storage
