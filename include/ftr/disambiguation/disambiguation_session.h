#pragma once

#include "ftr/core/clock.h"
#include "ftr/core/error.h"
#include "ftr/core/ids.h"
#include "ftr/core/result.h"
#include "ftr/domain/match_query.h"
#include "ftr/domain/match_result.h"
#include "ftr/matching/merchant_resolver.h"
#include "ftr/matching/ranker.h"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace ftr::disambiguation {

// DisambiguationPolicy bounds the lifetime of pending clarification state.
struct DisambiguationPolicy {
  int max_pending_turns{1};             // further turns a clarification survives
  std::chrono::seconds max_age{600};    // wall-time bound, independent of turns
};

[[nodiscard]] core::Result<bool, core::Error> validate_policy(const DisambiguationPolicy& policy);

enum class SessionState {
  kIdle,
  kAwaitingClarification,
};

[[nodiscard]] std::string_view to_string(SessionState state);

// PendingDisambiguation is the candidate set a session is waiting on the user to choose from.
// Owned exclusively by its session; never shared or persisted.
struct PendingDisambiguation {
  std::string query_fingerprint;
  std::vector<domain::MatchCandidate> candidates;  // stored order defines the ranks
  core::Instant created_at;
  int turns_remaining{1};
};

// ClarificationOption is one line of the question put to the user.
// rank is the stable short reference (1-based) the user may answer with.
struct ClarificationOption {
  std::size_t rank{0};
  domain::MatchCandidate candidate;
};

struct ClarificationRequest {
  std::string query_fingerprint;
  std::vector<ClarificationOption> options;
};

// Selections a user can give while a clarification is pending.
struct SelectTransaction {
  core::TransactionId transaction_id;
};
struct SelectRank {
  std::size_t rank{0};  // 1-based
};
struct RefineQuery {
  domain::MatchQuery query;
};
using Selection = std::variant<SelectTransaction, SelectRank, RefineQuery>;

// ClarificationAnswer optionally names the question it answers; an answer to any question
// other than the one pending is stale.
struct ClarificationAnswer {
  Selection selection;
  std::optional<std::string> in_reply_to;
};

// TurnResult is what a session hands back to the conversational layer after a turn.
// clarification is set exactly when the session is left awaiting an answer.
struct TurnResult {
  domain::MatchResult result;
  std::optional<ClarificationRequest> clarification;
};

// DisambiguationSession is the per-session state machine
//   idle -> awaiting_clarification -> idle.
// It is not thread-safe; SessionRegistry serializes the turns of one session.
class DisambiguationSession {
 public:
  explicit DisambiguationSession(core::SessionId id,
                                 DisambiguationPolicy policy = DisambiguationPolicy{});

  [[nodiscard]] const core::SessionId& id() const { return id_; }
  [[nodiscard]] SessionState state() const;
  [[nodiscard]] const std::optional<PendingDisambiguation>& pending() const { return pending_; }

  // accept_result records the ranker's answer to a fresh query. Any pending state from an
  // earlier query is discarded first; an ambiguous result becomes the new pending state.
  TurnResult accept_result(const domain::MatchQuery& query, domain::MatchResult result,
                           core::Instant now);

  // answer resolves a clarification answer against the pending candidates.
  // Errors:
  // - kStaleReference: nothing pending (never asked, already answered, or expired), or
  //   in_reply_to names a different question
  // - kInvalidQuery: rank out of range, a transaction id not among the candidates, or a
  //   malformed refined query; pending state is kept so the user can answer again
  [[nodiscard]] core::Result<TurnResult, core::Error> answer(
      const ClarificationAnswer& answer, const matching::Ranker& ranker,
      const matching::MerchantResolver& merchants, core::Instant now);

  // note_turn records a turn that neither asked nor answered (an unrelated message).
  // Returns true when this turn expired the pending clarification.
  bool note_turn(core::Instant now);

  // expire_if_stale drops pending state older than the policy allows.
  // Returns true when state was dropped.
  bool expire_if_stale(core::Instant now);

  // reset returns the session to idle unconditionally.
  void reset() { pending_.reset(); }

 private:
  core::SessionId id_;
  DisambiguationPolicy policy_;
  std::optional<PendingDisambiguation> pending_;

  TurnResult settle(const std::string& fingerprint, domain::MatchResult result,
                    core::Instant now);
};

// build_clarification numbers the pending candidates 1..n in stored order.
[[nodiscard]] ClarificationRequest build_clarification(const PendingDisambiguation& pending);

}  // namespace ftr::disambiguation
