#include "ftr/matching/ranker.h"

#include <algorithm>
#include <utility>

namespace ftr::matching {

namespace {

// Composite descending, then more recent date, then ascending id.
bool candidate_before(const domain::MatchCandidate& a, const domain::MatchCandidate& b) {
  if (a.composite_score != b.composite_score) {
    return a.composite_score > b.composite_score;
  }
  const auto a_days = std::chrono::sys_days{a.transaction.date};
  const auto b_days = std::chrono::sys_days{b.transaction.date};
  if (a_days != b_days) {
    return a_days > b_days;
  }
  return a.transaction.id.value < b.transaction.id.value;
}

domain::MatchResult empty_result() { return domain::MatchResult{}; }

}  // namespace

core::Result<bool, core::Error> validate_ranker_config(const RankerConfig& config) {
  using R = core::Result<bool, core::Error>;

  if (auto tolerance = validate_tolerance(config.tolerance); !tolerance.has_value()) {
    return tolerance;
  }
  if (auto weights = validate_weights(config.weights); !weights.has_value()) {
    return weights;
  }
  if (!(config.acceptance_threshold >= 0.0 && config.acceptance_threshold <= 1.0)) {
    return R::err(core::make_error(core::ErrorKind::kInvalidConfig,
                                   "acceptance_threshold must be within [0, 1]"));
  }
  if (!(config.ambiguity_epsilon >= 0.0 && config.ambiguity_epsilon < 1.0)) {
    return R::err(core::make_error(core::ErrorKind::kInvalidConfig,
                                   "ambiguity_epsilon must be within [0, 1)"));
  }
  if (config.max_candidates == 0) {
    return R::err(
        core::make_error(core::ErrorKind::kInvalidConfig, "max_candidates must be >= 1"));
  }
  return R::ok(true);
}

domain::MatchResult direct_match(const domain::Transaction& txn) {
  domain::MatchCandidate candidate;
  candidate.transaction = txn;
  candidate.composite_score = 1.0;

  domain::MatchResult result;
  result.outcome = domain::MatchOutcome::kUnique;
  result.candidates.push_back(candidate);
  result.best = candidate;
  return result;
}

Ranker::Ranker(RankerConfig config) : config_(std::move(config)) {}

std::optional<domain::MatchCandidate> Ranker::score_transaction(
    const domain::MatchQuery& query, const ActiveWeights& weights,
    const domain::Transaction& txn, const MerchantResolver& merchants) const {
  domain::MatchCandidate candidate;
  candidate.transaction = txn;

  if (query.amount.has_value()) {
    candidate.amount_score =
        score_amount(*query.amount, txn.amount, config_.tolerance.amount_tolerance_percent);
  }
  if (query.date.has_value()) {
    candidate.date_score =
        score_date(*query.date, txn.date, config_.tolerance.date_tolerance_days);
  }
  candidate.merchant_score = score_merchant(query.merchant_text, merchants.find(txn.merchant_id));

  candidate.composite_score = composite_score(weights, candidate.amount_score,
                                              candidate.date_score, candidate.merchant_score);
  if (candidate.composite_score < config_.acceptance_threshold) {
    return std::nullopt;
  }
  return candidate;
}

domain::MatchResult Ranker::classify(std::vector<domain::MatchCandidate> survivors) const {
  if (survivors.empty()) {
    return empty_result();
  }

  std::sort(survivors.begin(), survivors.end(), candidate_before);
  if (survivors.size() > config_.max_candidates) {
    survivors.resize(config_.max_candidates);
  }

  domain::MatchResult result;
  result.best = survivors.front();
  if (survivors.size() == 1 ||
      survivors[0].composite_score - survivors[1].composite_score > config_.ambiguity_epsilon) {
    result.outcome = domain::MatchOutcome::kUnique;
  } else {
    result.outcome = domain::MatchOutcome::kAmbiguous;
  }
  result.candidates = std::move(survivors);
  return result;
}

domain::MatchResult Ranker::rank_transactions(const domain::MatchQuery& query,
                                              const std::vector<const domain::Transaction*>& pool,
                                              const MerchantResolver& merchants) const {
  const ActiveWeights weights =
      ActiveWeights::for_dimensions(config_.weights, query.amount.has_value(),
                                    query.date.has_value(), query.merchant_text.has_value());
  if (weights.empty()) {
    return empty_result();
  }

  std::vector<domain::MatchCandidate> survivors;
  for (const auto* txn : pool) {
    if (auto candidate = score_transaction(query, weights, *txn, merchants)) {
      survivors.push_back(std::move(*candidate));
    }
  }
  return classify(std::move(survivors));
}

core::Result<domain::MatchResult, core::Error> Ranker::rank(
    const domain::MatchQuery& query, const core::UserId& user,
    const std::vector<domain::Transaction>& snapshot, const MerchantResolver& merchants) const {
  using R = core::Result<domain::MatchResult, core::Error>;

  const domain::MatchQuery normalized = domain::normalize_query(query);
  if (auto valid = domain::validate_query(normalized); !valid.has_value()) {
    return R::err(valid.error());
  }

  if (normalized.transaction_id.has_value()) {
    for (const auto& txn : snapshot) {
      if (txn.user_id == user && txn.id == *normalized.transaction_id) {
        return R::ok(direct_match(txn));
      }
    }
    return R::ok(empty_result());
  }

  std::vector<const domain::Transaction*> pool;
  pool.reserve(snapshot.size());
  for (const auto& txn : snapshot) {
    if (txn.user_id == user) {
      pool.push_back(&txn);
    }
  }
  return R::ok(rank_transactions(normalized, pool, merchants));
}

core::Result<domain::MatchResult, core::Error> Ranker::rank_within(
    const domain::MatchQuery& query, const std::vector<domain::MatchCandidate>& pending,
    const MerchantResolver& merchants) const {
  using R = core::Result<domain::MatchResult, core::Error>;

  const domain::MatchQuery normalized = domain::normalize_query(query);
  if (auto valid = domain::validate_query(normalized); !valid.has_value()) {
    return R::err(valid.error());
  }

  if (normalized.transaction_id.has_value()) {
    for (const auto& candidate : pending) {
      if (candidate.transaction.id == *normalized.transaction_id) {
        return R::ok(direct_match(candidate.transaction));
      }
    }
    return R::ok(empty_result());
  }

  std::vector<const domain::Transaction*> pool;
  pool.reserve(pending.size());
  for (const auto& candidate : pending) {
    pool.push_back(&candidate.transaction);
  }
  return R::ok(rank_transactions(normalized, pool, merchants));
}

}  // namespace ftr::matching
