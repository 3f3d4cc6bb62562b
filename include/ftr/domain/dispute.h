#pragma once

#include "ftr/core/ids.h"

#include <optional>
#include <string>
#include <string_view>

namespace ftr::domain {

enum class DisputeStatus {
  kFlagged,
  kUnderReview,
  kResolved,
};

enum class DisputeEvent {
  kStartReview,
  kResolve,
};

[[nodiscard]] std::string_view to_string(DisputeStatus status);
[[nodiscard]] std::optional<DisputeStatus> parse_dispute_status(std::string_view text);

// Dispute is the record handed to storage once a transaction has been identified
// (unique match or user-confirmed selection) and the user asks to contest it.
struct Dispute {
  core::DisputeId id;
  core::TransactionId transaction_id;
  core::UserId user_id;
  std::string created_at;  // ISO 8601 UTC
  std::string complaint;
  DisputeStatus status{DisputeStatus::kFlagged};
  std::optional<std::string> resolution_notes;

  [[nodiscard]] bool is_open() const { return status != DisputeStatus::kResolved; }

  [[nodiscard]] bool can_transition(DisputeEvent event) const;
  [[nodiscard]] bool apply(DisputeEvent event);
};

}  // namespace ftr::domain
