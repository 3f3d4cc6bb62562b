#pragma once

#include "ftr/core/error.h"
#include "ftr/core/ids.h"
#include "ftr/core/result.h"
#include "ftr/domain/match_query.h"
#include "ftr/domain/match_result.h"
#include "ftr/domain/transaction.h"
#include "ftr/matching/merchant_resolver.h"
#include "ftr/matching/scorer.h"

#include <cstddef>
#include <optional>
#include <vector>

namespace ftr::matching {

// RankerConfig holds every matching tunable.
struct RankerConfig {
  ToleranceConfig tolerance;
  ScoreWeights weights;
  double acceptance_threshold{0.5};  // candidates scoring below this are discarded
  double ambiguity_epsilon{0.05};    // rank 1 must lead rank 2 by more than this to be unique
  std::size_t max_candidates{5};
};

[[nodiscard]] core::Result<bool, core::Error> validate_ranker_config(const RankerConfig& config);

// Ranker scores a user's transactions against a query and classifies the outcome.
// rank() is const and touches no shared state, so one Ranker serves all sessions concurrently.
class Ranker {
 public:
  explicit Ranker(RankerConfig config = RankerConfig{});

  // rank evaluates query against the transactions of `user` in snapshot.
  // Returns kInvalidQuery for a query that fails validate_query.
  // With transaction_id set the lookup is direct and scoring is skipped entirely.
  [[nodiscard]] core::Result<domain::MatchResult, core::Error> rank(
      const domain::MatchQuery& query, const core::UserId& user,
      const std::vector<domain::Transaction>& snapshot, const MerchantResolver& merchants) const;

  // rank_within re-ranks a previously narrowed candidate set (a refined clarification
  // answer). Only transactions already in `pending` can appear in the result.
  [[nodiscard]] core::Result<domain::MatchResult, core::Error> rank_within(
      const domain::MatchQuery& query, const std::vector<domain::MatchCandidate>& pending,
      const MerchantResolver& merchants) const;

  [[nodiscard]] const RankerConfig& config() const { return config_; }

 private:
  RankerConfig config_;

  [[nodiscard]] std::optional<domain::MatchCandidate> score_transaction(
      const domain::MatchQuery& query, const ActiveWeights& weights,
      const domain::Transaction& txn, const MerchantResolver& merchants) const;

  [[nodiscard]] domain::MatchResult rank_transactions(
      const domain::MatchQuery& query, const std::vector<const domain::Transaction*>& pool,
      const MerchantResolver& merchants) const;

  [[nodiscard]] domain::MatchResult classify(std::vector<domain::MatchCandidate> survivors) const;
};

// direct_match builds the result of a transaction-id lookup: every dimension reads 1.0.
[[nodiscard]] domain::MatchResult direct_match(const domain::Transaction& txn);

}  // namespace ftr::matching
