#include "ftr/domain/dispute.h"

namespace ftr::domain {

std::string_view to_string(const DisputeStatus status) {
  switch (status) {
    case DisputeStatus::kFlagged:
      return "flagged";
    case DisputeStatus::kUnderReview:
      return "under_review";
    case DisputeStatus::kResolved:
      return "resolved";
  }
  return "flagged";
}

std::optional<DisputeStatus> parse_dispute_status(const std::string_view text) {
  if (text == "flagged") {
    return DisputeStatus::kFlagged;
  }
  if (text == "under_review") {
    return DisputeStatus::kUnderReview;
  }
  if (text == "resolved") {
    return DisputeStatus::kResolved;
  }
  return std::nullopt;
}

bool Dispute::can_transition(const DisputeEvent event) const {
  switch (status) {
    case DisputeStatus::kFlagged:
      return event == DisputeEvent::kStartReview || event == DisputeEvent::kResolve;
    case DisputeStatus::kUnderReview:
      return event == DisputeEvent::kResolve;
    case DisputeStatus::kResolved:
      return false;
  }
  return false;
}

bool Dispute::apply(const DisputeEvent event) {
  if (!can_transition(event)) {
    return false;
  }

  switch (event) {
    case DisputeEvent::kStartReview:
      status = DisputeStatus::kUnderReview;
      return true;
    case DisputeEvent::kResolve:
      status = DisputeStatus::kResolved;
      return true;
  }
  return false;
}

}  // namespace ftr::domain
