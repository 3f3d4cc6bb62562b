#include "ftr/disambiguation/disambiguation_session.h"

#include <algorithm>
#include <utility>

namespace ftr::disambiguation {

namespace {

domain::MatchResult selected(const domain::MatchCandidate& candidate) {
  domain::MatchResult result;
  result.outcome = domain::MatchOutcome::kUnique;
  result.candidates.push_back(candidate);
  result.best = candidate;
  return result;
}

}  // namespace

core::Result<bool, core::Error> validate_policy(const DisambiguationPolicy& policy) {
  using R = core::Result<bool, core::Error>;

  if (policy.max_pending_turns < 1) {
    return R::err(
        core::make_error(core::ErrorKind::kInvalidConfig, "max_pending_turns must be >= 1"));
  }
  if (policy.max_age.count() <= 0) {
    return R::err(core::make_error(core::ErrorKind::kInvalidConfig,
                                   "pending clarification max_age must be positive"));
  }
  return R::ok(true);
}

std::string_view to_string(const SessionState state) {
  switch (state) {
    case SessionState::kIdle:
      return "idle";
    case SessionState::kAwaitingClarification:
      return "awaiting_clarification";
  }
  return "idle";
}

ClarificationRequest build_clarification(const PendingDisambiguation& pending) {
  ClarificationRequest request;
  request.query_fingerprint = pending.query_fingerprint;
  request.options.reserve(pending.candidates.size());
  for (std::size_t i = 0; i < pending.candidates.size(); ++i) {
    request.options.push_back(ClarificationOption{i + 1, pending.candidates[i]});
  }
  return request;
}

DisambiguationSession::DisambiguationSession(core::SessionId id, DisambiguationPolicy policy)
    : id_(std::move(id)), policy_(policy) {}

SessionState DisambiguationSession::state() const {
  return pending_.has_value() ? SessionState::kAwaitingClarification : SessionState::kIdle;
}

bool DisambiguationSession::expire_if_stale(const core::Instant now) {
  if (!pending_.has_value()) {
    return false;
  }
  if (now - pending_->created_at > policy_.max_age) {
    pending_.reset();
    return true;
  }
  return false;
}

bool DisambiguationSession::note_turn(const core::Instant now) {
  if (expire_if_stale(now)) {
    return true;
  }
  if (!pending_.has_value()) {
    return false;
  }
  --pending_->turns_remaining;
  if (pending_->turns_remaining <= 0) {
    pending_.reset();
    return true;
  }
  return false;
}

TurnResult DisambiguationSession::settle(const std::string& fingerprint,
                                         domain::MatchResult result, const core::Instant now) {
  TurnResult turn;
  if (result.outcome == domain::MatchOutcome::kAmbiguous) {
    pending_ = PendingDisambiguation{fingerprint, result.candidates, now,
                                     policy_.max_pending_turns};
    turn.clarification = build_clarification(*pending_);
  } else {
    pending_.reset();
  }
  turn.result = std::move(result);
  return turn;
}

TurnResult DisambiguationSession::accept_result(const domain::MatchQuery& query,
                                                domain::MatchResult result,
                                                const core::Instant now) {
  pending_.reset();
  return settle(domain::query_fingerprint(domain::normalize_query(query)), std::move(result),
                now);
}

core::Result<TurnResult, core::Error> DisambiguationSession::answer(
    const ClarificationAnswer& answer, const matching::Ranker& ranker,
    const matching::MerchantResolver& merchants, const core::Instant now) {
  using R = core::Result<TurnResult, core::Error>;

  expire_if_stale(now);
  if (!pending_.has_value()) {
    return R::err(core::make_error(core::ErrorKind::kStaleReference,
                                   "no clarification is pending for session " + id_.value));
  }
  if (answer.in_reply_to.has_value() && *answer.in_reply_to != pending_->query_fingerprint) {
    return R::err(core::make_error(core::ErrorKind::kStaleReference,
                                   "answer refers to a clarification that is no longer pending"));
  }

  const auto& candidates = pending_->candidates;

  if (const auto* by_rank = std::get_if<SelectRank>(&answer.selection)) {
    if (by_rank->rank < 1 || by_rank->rank > candidates.size()) {
      return R::err(core::make_error(
          core::ErrorKind::kInvalidQuery,
          "rank must be between 1 and " + std::to_string(candidates.size())));
    }
    TurnResult turn;
    turn.result = selected(candidates[by_rank->rank - 1]);
    pending_.reset();
    return R::ok(std::move(turn));
  }

  if (const auto* by_id = std::get_if<SelectTransaction>(&answer.selection)) {
    const auto it = std::find_if(candidates.begin(), candidates.end(),
                                 [by_id](const domain::MatchCandidate& candidate) {
                                   return candidate.transaction.id == by_id->transaction_id;
                                 });
    if (it == candidates.end()) {
      return R::err(core::make_error(core::ErrorKind::kInvalidQuery,
                                     "transaction " + by_id->transaction_id.value +
                                         " is not among the pending candidates"));
    }
    TurnResult turn;
    turn.result = selected(*it);
    pending_.reset();
    return R::ok(std::move(turn));
  }

  const auto& refined = std::get<RefineQuery>(answer.selection).query;
  auto ranked = ranker.rank_within(refined, candidates, merchants);
  if (!ranked.has_value()) {
    return R::err(ranked.error());
  }
  return R::ok(settle(domain::query_fingerprint(domain::normalize_query(refined)),
                      std::move(ranked).value(), now));
}

}  // namespace ftr::disambiguation
