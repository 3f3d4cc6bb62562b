#pragma once

#include "ftr/domain/transaction.h"

#include <optional>
#include <string_view>
#include <vector>

namespace ftr::domain {

enum class MatchOutcome {
  kUnique,     // one clear winner
  kAmbiguous,  // several candidates within epsilon of the best
  kEmpty,      // nothing cleared the acceptance threshold
};

[[nodiscard]] std::string_view to_string(MatchOutcome outcome);

// MatchCandidate is derived per query and never persisted.
// A dimension that the query did not constrain carries its neutral score of 1.0 and does not
// contribute to composite_score.
struct MatchCandidate {
  Transaction transaction;
  double amount_score{1.0};
  double date_score{1.0};
  double merchant_score{1.0};
  double composite_score{0.0};
};

struct MatchResult {
  MatchOutcome outcome{MatchOutcome::kEmpty};
  std::vector<MatchCandidate> candidates;  // ordered best first
  std::optional<MatchCandidate> best;
};

}  // namespace ftr::domain
