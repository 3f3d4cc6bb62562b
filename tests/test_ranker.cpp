#include "ftr/core/calendar.h"
#include "ftr/core/money.h"
#include "ftr/domain/match_query.h"
#include "ftr/matching/merchant_resolver.h"
#include "ftr/matching/ranker.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <algorithm>

using namespace ftr;
using Catch::Matchers::WithinAbs;

namespace {

const core::UserId kUser{"user_001"};

domain::Transaction txn(const std::string& id, const std::int64_t cents, const std::string& date,
                        const std::string& merchant_id, const std::string& user = "user_001") {
  domain::Transaction t;
  t.id = core::TransactionId{id};
  t.user_id = core::UserId{user};
  t.amount = core::Money{cents, "USD"};
  t.date = core::parse_iso_date(date).value();
  t.merchant_id = core::MerchantId{merchant_id};
  return t;
}

matching::MerchantResolver catalog() {
  return matching::MerchantResolver({
      domain::Merchant{.id = core::MerchantId{"m-coffee"}, .canonical_name = "Coffee Palace"},
      domain::Merchant{.id = core::MerchantId{"m-tea"},
                       .canonical_name = "Tea House",
                       .aliases = {"TEAHSE"}},
  });
}

domain::MatchQuery amount_query(const std::int64_t cents) {
  domain::MatchQuery query;
  query.amount = core::Money{cents, "USD"};
  return query;
}

}  // namespace

TEST_CASE("Ranker: amount plus merchant picks the unique Coffee Palace charge",
          "[ranker][scenario]") {
  const std::vector<domain::Transaction> snapshot{
      txn("txn-001", 4850, "2024-01-15", "m-coffee"),
      txn("txn-002", 4900, "2024-01-15", "m-tea"),
  };
  domain::MatchQuery query = amount_query(5000);
  query.merchant_text = "Coffee Palace";

  const matching::Ranker ranker;
  const auto result = ranker.rank(query, kUser, snapshot, catalog());
  REQUIRE(result.has_value());
  CHECK(result.value().outcome == domain::MatchOutcome::kUnique);
  REQUIRE(result.value().candidates.size() == 1);

  const auto& best = result.value().best.value();
  CHECK(best.transaction.id.value == "txn-001");
  CHECK_THAT(best.amount_score, WithinAbs(0.7, 1e-9));
  CHECK(best.merchant_score == 1.0);
  CHECK(best.date_score == 1.0);
  CHECK_THAT(best.composite_score, WithinAbs(0.15 / 0.85 * 0.7 + 0.70 / 0.85, 1e-9));
  CHECK(best.composite_score > 0.94);
}

TEST_CASE("Ranker: two equal amounts are ambiguous, most recent first", "[ranker][scenario]") {
  const std::vector<domain::Transaction> snapshot{
      txn("txn-a", 1500, "2024-01-10", "m-coffee"),
      txn("txn-b", 1500, "2024-01-12", "m-tea"),
  };

  const matching::Ranker ranker;
  const auto result = ranker.rank(amount_query(1500), kUser, snapshot, catalog());
  REQUIRE(result.has_value());
  CHECK(result.value().outcome == domain::MatchOutcome::kAmbiguous);
  REQUIRE(result.value().candidates.size() == 2);
  CHECK(result.value().candidates[0].transaction.id.value == "txn-b");
  CHECK(result.value().candidates[1].transaction.id.value == "txn-a");
  CHECK(result.value().best->transaction.id.value == "txn-b");
}

TEST_CASE("Ranker: the epsilon gap decides unique versus ambiguous", "[ranker][epsilon]") {
  const matching::Ranker ranker;

  SECTION("gap wider than epsilon is unique with runner-up kept") {
    // 14.70 against 15.00 at 10%: 1 - 0.30 / 1.50 = 0.8
    const std::vector<domain::Transaction> snapshot{
        txn("txn-a", 1500, "2024-01-10", "m-coffee"),
        txn("txn-b", 1470, "2024-01-12", "m-coffee"),
    };
    const auto result = ranker.rank(amount_query(1500), kUser, snapshot, catalog());
    REQUIRE(result.has_value());
    CHECK(result.value().outcome == domain::MatchOutcome::kUnique);
    REQUIRE(result.value().candidates.size() == 2);
    CHECK(result.value().best->transaction.id.value == "txn-a");
  }

  SECTION("gap within epsilon is ambiguous") {
    // 14.95 against 15.00: 1 - 0.05 / 1.50 = 0.9667
    const std::vector<domain::Transaction> snapshot{
        txn("txn-a", 1500, "2024-01-10", "m-coffee"),
        txn("txn-b", 1495, "2024-01-12", "m-coffee"),
    };
    const auto result = ranker.rank(amount_query(1500), kUser, snapshot, catalog());
    REQUIRE(result.has_value());
    CHECK(result.value().outcome == domain::MatchOutcome::kAmbiguous);
    CHECK(result.value().candidates[0].transaction.id.value == "txn-a");
  }
}

TEST_CASE("Ranker: equal score and date fall back to ascending id", "[ranker][tie_break]") {
  const std::vector<domain::Transaction> snapshot{
      txn("txn-2", 1500, "2024-01-10", "m-coffee"),
      txn("txn-3", 1500, "2024-01-10", "m-coffee"),
      txn("txn-1", 1500, "2024-01-10", "m-coffee"),
  };

  const matching::Ranker ranker;
  const auto result = ranker.rank(amount_query(1500), kUser, snapshot, catalog());
  REQUIRE(result.has_value());
  REQUIRE(result.value().candidates.size() == 3);
  CHECK(result.value().candidates[0].transaction.id.value == "txn-1");
  CHECK(result.value().candidates[1].transaction.id.value == "txn-2");
  CHECK(result.value().candidates[2].transaction.id.value == "txn-3");
}

TEST_CASE("Ranker: ranking is deterministic across snapshot order", "[ranker][determinism]") {
  std::vector<domain::Transaction> snapshot{
      txn("txn-1", 1500, "2024-01-10", "m-coffee"),
      txn("txn-2", 1490, "2024-01-11", "m-tea"),
      txn("txn-3", 1510, "2024-01-09", "m-coffee"),
  };
  const matching::Ranker ranker;
  const auto forward = ranker.rank(amount_query(1500), kUser, snapshot, catalog());
  std::reverse(snapshot.begin(), snapshot.end());
  const auto backward = ranker.rank(amount_query(1500), kUser, snapshot, catalog());

  REQUIRE(forward.has_value());
  REQUIRE(backward.has_value());
  REQUIRE(forward.value().candidates.size() == backward.value().candidates.size());
  for (std::size_t i = 0; i < forward.value().candidates.size(); ++i) {
    CHECK(forward.value().candidates[i].transaction.id ==
          backward.value().candidates[i].transaction.id);
  }
}

TEST_CASE("Ranker: nothing above threshold is an empty outcome", "[ranker][empty]") {
  const std::vector<domain::Transaction> snapshot{
      txn("txn-1", 1500, "2024-01-10", "m-coffee"),
  };
  domain::MatchQuery query = amount_query(1500);
  query.merchant_text = "Unknown Diner";

  const matching::Ranker ranker;
  const auto result = ranker.rank(query, kUser, snapshot, catalog());
  REQUIRE(result.has_value());
  CHECK(result.value().outcome == domain::MatchOutcome::kEmpty);
  CHECK(result.value().candidates.empty());
  CHECK_FALSE(result.value().best.has_value());
}

TEST_CASE("Ranker: other users' transactions are never candidates", "[ranker][scope]") {
  const std::vector<domain::Transaction> snapshot{
      txn("txn-mine", 1500, "2024-01-10", "m-coffee"),
      txn("txn-theirs", 1500, "2024-01-11", "m-coffee", "user_002"),
  };

  const matching::Ranker ranker;
  const auto result = ranker.rank(amount_query(1500), kUser, snapshot, catalog());
  REQUIRE(result.has_value());
  CHECK(result.value().outcome == domain::MatchOutcome::kUnique);
  REQUIRE(result.value().candidates.size() == 1);
  CHECK(result.value().candidates[0].transaction.id.value == "txn-mine");
}

TEST_CASE("Ranker: transaction id is a direct lookup", "[ranker][direct]") {
  const std::vector<domain::Transaction> snapshot{
      txn("txn-1", 1500, "2024-01-10", "m-coffee"),
      txn("txn-2", 9900, "2024-02-10", "m-tea", "user_002"),
  };
  const matching::Ranker ranker;

  domain::MatchQuery query;
  query.transaction_id = core::TransactionId{" txn-1 "};
  query.amount = core::Money{1, "USD"};
  const auto hit = ranker.rank(query, kUser, snapshot, catalog());
  REQUIRE(hit.has_value());
  CHECK(hit.value().outcome == domain::MatchOutcome::kUnique);
  CHECK(hit.value().best->transaction.id.value == "txn-1");
  CHECK(hit.value().best->composite_score == 1.0);

  query.transaction_id = core::TransactionId{"txn-2"};
  const auto foreign = ranker.rank(query, kUser, snapshot, catalog());
  REQUIRE(foreign.has_value());
  CHECK(foreign.value().outcome == domain::MatchOutcome::kEmpty);
}

TEST_CASE("Ranker: invalid queries are rejected before scoring", "[ranker][invalid]") {
  const std::vector<domain::Transaction> snapshot{txn("txn-1", 1500, "2024-01-10", "m-coffee")};
  const matching::Ranker ranker;

  const auto empty = ranker.rank(domain::MatchQuery{}, kUser, snapshot, catalog());
  REQUIRE_FALSE(empty.has_value());
  CHECK(empty.error().kind == core::ErrorKind::kInvalidQuery);

  domain::MatchQuery blank;
  blank.merchant_text = "   ";
  const auto blank_result = ranker.rank(blank, kUser, snapshot, catalog());
  REQUIRE_FALSE(blank_result.has_value());
  CHECK(blank_result.error().kind == core::ErrorKind::kInvalidQuery);

  const auto negative = ranker.rank(amount_query(-100), kUser, snapshot, catalog());
  REQUIRE_FALSE(negative.has_value());
  CHECK(negative.error().kind == core::ErrorKind::kInvalidQuery);
}

TEST_CASE("Ranker: candidate list is capped at max_candidates", "[ranker][cap]") {
  std::vector<domain::Transaction> snapshot;
  for (int i = 1; i <= 7; ++i) {
    snapshot.push_back(txn("txn-" + std::to_string(i), 1500, "2024-01-10", "m-coffee"));
  }

  const matching::Ranker ranker;
  const auto result = ranker.rank(amount_query(1500), kUser, snapshot, catalog());
  REQUIRE(result.has_value());
  CHECK(result.value().outcome == domain::MatchOutcome::kAmbiguous);
  CHECK(result.value().candidates.size() == 5);
}

TEST_CASE("Ranker: rank_within narrows the pending candidates", "[ranker][refine]") {
  const std::vector<domain::Transaction> snapshot{
      txn("txn-a", 1500, "2024-01-10", "m-coffee"),
      txn("txn-b", 1500, "2024-01-12", "m-tea"),
      txn("txn-c", 1500, "2024-01-12", "m-coffee", "user_002"),
  };
  const matching::Ranker ranker;
  const auto first = ranker.rank(amount_query(1500), kUser, snapshot, catalog());
  REQUIRE(first.has_value());
  REQUIRE(first.value().outcome == domain::MatchOutcome::kAmbiguous);

  domain::MatchQuery refine;
  refine.merchant_text = "teahse";
  const auto refined = ranker.rank_within(refine, first.value().candidates, catalog());
  REQUIRE(refined.has_value());
  CHECK(refined.value().outcome == domain::MatchOutcome::kUnique);
  CHECK(refined.value().best->transaction.id.value == "txn-b");
}

TEST_CASE("validate_ranker_config rejects out-of-range tunables", "[ranker][config]") {
  CHECK(matching::validate_ranker_config(matching::RankerConfig{}).has_value());

  matching::RankerConfig config;
  config.acceptance_threshold = 1.5;
  CHECK_FALSE(matching::validate_ranker_config(config).has_value());

  config = matching::RankerConfig{};
  config.ambiguity_epsilon = -0.01;
  CHECK_FALSE(matching::validate_ranker_config(config).has_value());

  config = matching::RankerConfig{};
  config.max_candidates = 0;
  const auto result = matching::validate_ranker_config(config);
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().kind == core::ErrorKind::kInvalidConfig);
}
