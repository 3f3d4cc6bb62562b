#include "ftr/domain/match_result.h"

namespace ftr::domain {

std::string_view to_string(const MatchOutcome outcome) {
  switch (outcome) {
    case MatchOutcome::kUnique:
      return "unique";
    case MatchOutcome::kAmbiguous:
      return "ambiguous";
    case MatchOutcome::kEmpty:
      return "empty";
  }
  return "empty";
}

}  // namespace ftr::domain
