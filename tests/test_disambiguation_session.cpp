#include "ftr/core/calendar.h"
#include "ftr/disambiguation/disambiguation_session.h"
#include "ftr/matching/merchant_resolver.h"
#include "ftr/matching/ranker.h"

#include <catch2/catch_test_macros.hpp>

#include <chrono>

using namespace ftr;
using disambiguation::ClarificationAnswer;
using disambiguation::DisambiguationSession;
using disambiguation::SessionState;

namespace {

const core::UserId kUser{"user_001"};
const core::Instant kStart{};

domain::Transaction txn(const std::string& id, const std::int64_t cents, const std::string& date,
                        const std::string& merchant_id) {
  domain::Transaction t;
  t.id = core::TransactionId{id};
  t.user_id = kUser;
  t.amount = core::Money{cents, "USD"};
  t.date = core::parse_iso_date(date).value();
  t.merchant_id = core::MerchantId{merchant_id};
  return t;
}

struct Fixture {
  matching::Ranker ranker;
  matching::MerchantResolver merchants{{
      domain::Merchant{.id = core::MerchantId{"m-coffee"}, .canonical_name = "Coffee Palace"},
      domain::Merchant{.id = core::MerchantId{"m-tea"}, .canonical_name = "Tea House"},
  }};
  std::vector<domain::Transaction> snapshot{
      txn("txn-a", 1500, "2024-01-10", "m-coffee"),
      txn("txn-b", 1500, "2024-01-12", "m-tea"),
      txn("txn-c", 4200, "2024-01-12", "m-tea"),
  };

  domain::MatchQuery query(const std::int64_t cents) const {
    domain::MatchQuery q;
    q.amount = core::Money{cents, "USD"};
    return q;
  }

  disambiguation::TurnResult ask(DisambiguationSession& session, const std::int64_t cents,
                                 const core::Instant now = kStart) const {
    const auto q = query(cents);
    auto ranked = ranker.rank(q, kUser, snapshot, merchants);
    return session.accept_result(q, std::move(ranked).value(), now);
  }
};

}  // namespace

TEST_CASE("Session: ambiguous result moves to awaiting with ranked options",
          "[disambiguation][session]") {
  Fixture f;
  DisambiguationSession session(core::SessionId{"s-1"});
  CHECK(session.state() == SessionState::kIdle);

  const auto turn = f.ask(session, 1500);
  CHECK(turn.result.outcome == domain::MatchOutcome::kAmbiguous);
  REQUIRE(turn.clarification.has_value());
  REQUIRE(turn.clarification->options.size() == 2);
  CHECK(turn.clarification->options[0].rank == 1);
  CHECK(turn.clarification->options[0].candidate.transaction.id.value == "txn-b");
  CHECK(turn.clarification->options[1].rank == 2);
  CHECK(turn.clarification->query_fingerprint == session.pending()->query_fingerprint);
  CHECK(session.state() == SessionState::kAwaitingClarification);
  CHECK(disambiguation::to_string(session.state()) == "awaiting_clarification");
}

TEST_CASE("Session: unique result stays idle", "[disambiguation][session]") {
  Fixture f;
  DisambiguationSession session(core::SessionId{"s-1"});

  const auto turn = f.ask(session, 4200);
  CHECK(turn.result.outcome == domain::MatchOutcome::kUnique);
  CHECK_FALSE(turn.clarification.has_value());
  CHECK(session.state() == SessionState::kIdle);
}

TEST_CASE("Session: answering by rank selects and returns to idle", "[disambiguation][answer]") {
  Fixture f;
  DisambiguationSession session(core::SessionId{"s-1"});
  f.ask(session, 1500);

  const auto answered = session.answer(ClarificationAnswer{disambiguation::SelectRank{2}, {}},
                                       f.ranker, f.merchants, kStart);
  REQUIRE(answered.has_value());
  CHECK(answered.value().result.outcome == domain::MatchOutcome::kUnique);
  CHECK(answered.value().result.best->transaction.id.value == "txn-a");
  CHECK_FALSE(answered.value().clarification.has_value());
  CHECK(session.state() == SessionState::kIdle);
}

TEST_CASE("Session: answering by transaction id", "[disambiguation][answer]") {
  Fixture f;
  DisambiguationSession session(core::SessionId{"s-1"});
  f.ask(session, 1500);

  const auto answered = session.answer(
      ClarificationAnswer{disambiguation::SelectTransaction{core::TransactionId{"txn-a"}}, {}},
      f.ranker, f.merchants, kStart);
  REQUIRE(answered.has_value());
  CHECK(answered.value().result.best->transaction.id.value == "txn-a");
}

TEST_CASE("Session: out-of-range selections keep the question open", "[disambiguation][answer]") {
  Fixture f;
  DisambiguationSession session(core::SessionId{"s-1"});
  f.ask(session, 1500);

  const auto zero = session.answer(ClarificationAnswer{disambiguation::SelectRank{0}, {}},
                                   f.ranker, f.merchants, kStart);
  REQUIRE_FALSE(zero.has_value());
  CHECK(zero.error().kind == core::ErrorKind::kInvalidQuery);

  const auto too_high = session.answer(ClarificationAnswer{disambiguation::SelectRank{3}, {}},
                                       f.ranker, f.merchants, kStart);
  REQUIRE_FALSE(too_high.has_value());
  CHECK(too_high.error().kind == core::ErrorKind::kInvalidQuery);

  // txn-c exists but was never offered.
  const auto foreign = session.answer(
      ClarificationAnswer{disambiguation::SelectTransaction{core::TransactionId{"txn-c"}}, {}},
      f.ranker, f.merchants, kStart);
  REQUIRE_FALSE(foreign.has_value());
  CHECK(foreign.error().kind == core::ErrorKind::kInvalidQuery);

  CHECK(session.state() == SessionState::kAwaitingClarification);
}

TEST_CASE("Session: refining narrows to a unique candidate", "[disambiguation][refine]") {
  Fixture f;
  DisambiguationSession session(core::SessionId{"s-1"});
  f.ask(session, 1500);

  domain::MatchQuery refine;
  refine.merchant_text = "coffee palace";
  const auto answered = session.answer(
      ClarificationAnswer{disambiguation::RefineQuery{refine}, {}}, f.ranker, f.merchants, kStart);
  REQUIRE(answered.has_value());
  CHECK(answered.value().result.outcome == domain::MatchOutcome::kUnique);
  CHECK(answered.value().result.best->transaction.id.value == "txn-a");
  CHECK(session.state() == SessionState::kIdle);
}

TEST_CASE("Session: a refinement that is still ambiguous asks again", "[disambiguation][refine]") {
  Fixture f;
  DisambiguationSession session(core::SessionId{"s-1"});
  const auto first = f.ask(session, 1500);

  domain::MatchQuery refine;
  refine.amount = core::Money{1500, "USD"};
  refine.date = core::parse_iso_date("2024-01-11");
  const auto answered = session.answer(
      ClarificationAnswer{disambiguation::RefineQuery{refine}, {}}, f.ranker, f.merchants, kStart);
  REQUIRE(answered.has_value());
  CHECK(answered.value().result.outcome == domain::MatchOutcome::kAmbiguous);
  REQUIRE(answered.value().clarification.has_value());
  CHECK(answered.value().clarification->query_fingerprint !=
        first.clarification->query_fingerprint);
  CHECK(session.state() == SessionState::kAwaitingClarification);
}

TEST_CASE("Session: answer with nothing pending is stale", "[disambiguation][stale]") {
  Fixture f;
  DisambiguationSession session(core::SessionId{"s-1"});

  const auto answered = session.answer(ClarificationAnswer{disambiguation::SelectRank{1}, {}},
                                       f.ranker, f.merchants, kStart);
  REQUIRE_FALSE(answered.has_value());
  CHECK(answered.error().kind == core::ErrorKind::kStaleReference);
}

TEST_CASE("Session: answer to a superseded question is stale", "[disambiguation][stale]") {
  Fixture f;
  DisambiguationSession session(core::SessionId{"s-1"});
  const auto first = f.ask(session, 1500);
  const std::string old_fingerprint = first.clarification->query_fingerprint;

  // A new, different ambiguous query replaces the pending question.
  f.snapshot.push_back(txn("txn-d", 4200, "2024-01-13", "m-coffee"));
  f.ask(session, 4200);
  REQUIRE(session.state() == SessionState::kAwaitingClarification);
  CHECK(session.pending()->query_fingerprint != old_fingerprint);

  const auto answered = session.answer(
      ClarificationAnswer{disambiguation::SelectRank{1}, old_fingerprint}, f.ranker, f.merchants,
      kStart);
  REQUIRE_FALSE(answered.has_value());
  CHECK(answered.error().kind == core::ErrorKind::kStaleReference);
  CHECK(session.state() == SessionState::kAwaitingClarification);
}

TEST_CASE("Session: pending state expires after max_age", "[disambiguation][expiry]") {
  Fixture f;
  DisambiguationSession session(core::SessionId{"s-1"},
                                {.max_pending_turns = 1, .max_age = std::chrono::seconds(600)});
  f.ask(session, 1500);

  CHECK_FALSE(session.expire_if_stale(kStart + std::chrono::seconds(600)));
  CHECK(session.state() == SessionState::kAwaitingClarification);

  const auto answered = session.answer(ClarificationAnswer{disambiguation::SelectRank{1}, {}},
                                       f.ranker, f.merchants,
                                       kStart + std::chrono::seconds(601));
  REQUIRE_FALSE(answered.has_value());
  CHECK(answered.error().kind == core::ErrorKind::kStaleReference);
  CHECK(session.state() == SessionState::kIdle);
}

TEST_CASE("Session: an unrelated turn expires the pending question", "[disambiguation][expiry]") {
  Fixture f;

  SECTION("default policy allows one turn") {
    DisambiguationSession session(core::SessionId{"s-1"});
    f.ask(session, 1500);
    CHECK(session.note_turn(kStart));
    CHECK(session.state() == SessionState::kIdle);
    CHECK_FALSE(session.note_turn(kStart));
  }

  SECTION("a longer policy survives extra turns") {
    DisambiguationSession session(core::SessionId{"s-1"}, {.max_pending_turns = 3});
    f.ask(session, 1500);
    CHECK_FALSE(session.note_turn(kStart));
    CHECK_FALSE(session.note_turn(kStart));
    CHECK(session.state() == SessionState::kAwaitingClarification);
    CHECK(session.note_turn(kStart));
    CHECK(session.state() == SessionState::kIdle);
  }
}

TEST_CASE("Session: reset drops pending state", "[disambiguation][session]") {
  Fixture f;
  DisambiguationSession session(core::SessionId{"s-1"});
  f.ask(session, 1500);
  session.reset();
  CHECK(session.state() == SessionState::kIdle);
  CHECK_FALSE(session.pending().has_value());
}

TEST_CASE("validate_policy rejects non-positive bounds", "[disambiguation][config]") {
  CHECK(disambiguation::validate_policy({}).has_value());
  CHECK_FALSE(disambiguation::validate_policy({.max_pending_turns = 0}).has_value());
  CHECK_FALSE(
      disambiguation::validate_policy({.max_age = std::chrono::seconds(0)}).has_value());
}
