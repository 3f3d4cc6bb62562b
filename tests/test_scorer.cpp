#include "ftr/core/calendar.h"
#include "ftr/core/money.h"
#include "ftr/domain/merchant.h"
#include "ftr/matching/scorer.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

using namespace ftr;
using Catch::Matchers::WithinAbs;

namespace {

core::Money usd(const std::int64_t minor_units) { return core::Money{minor_units, "USD"}; }

core::CalendarDate date(const std::string& text) { return core::parse_iso_date(text).value(); }

}  // namespace

// ── Amount ──────────────────────────────────────────────────────────────────

TEST_CASE("score_amount: exact amount scores 1.0", "[scorer][amount]") {
  CHECK(matching::score_amount(usd(5000), usd(5000), 10.0) == 1.0);
}

TEST_CASE("score_amount: linear decay inside tolerance", "[scorer][amount]") {
  // 50.00 vs 48.50 at 10%: 1 - 1.50 / 5.00
  CHECK_THAT(matching::score_amount(usd(5000), usd(4850), 10.0), WithinAbs(0.7, 1e-9));
  CHECK_THAT(matching::score_amount(usd(5000), usd(5250), 10.0), WithinAbs(0.5, 1e-9));
}

TEST_CASE("score_amount: exact tolerance boundary stays above zero", "[scorer][amount]") {
  const double on_boundary = matching::score_amount(usd(5000), usd(4500), 10.0);
  CHECK(on_boundary > 0.0);
  CHECK(on_boundary == matching::kMinInToleranceScore);
  CHECK(matching::score_amount(usd(5000), usd(4499), 10.0) == 0.0);
}

TEST_CASE("score_amount: currency mismatch scores 0", "[scorer][amount]") {
  CHECK(matching::score_amount(usd(5000), core::Money{5000, "EUR"}, 10.0) == 0.0);
}

TEST_CASE("score_amount: zero query amount only matches zero", "[scorer][amount]") {
  CHECK(matching::score_amount(usd(0), usd(0), 10.0) == 1.0);
  CHECK(matching::score_amount(usd(0), usd(1), 10.0) == 0.0);
}

// ── Date ────────────────────────────────────────────────────────────────────

TEST_CASE("score_date: decays over the tolerance window", "[scorer][date]") {
  const auto query = date("2024-01-15");
  CHECK(matching::score_date(query, date("2024-01-15"), 3) == 1.0);
  CHECK_THAT(matching::score_date(query, date("2024-01-14"), 3), WithinAbs(2.0 / 3.0, 1e-9));
  CHECK_THAT(matching::score_date(query, date("2024-01-16"), 3), WithinAbs(2.0 / 3.0, 1e-9));
  CHECK(matching::score_date(query, date("2024-01-18"), 3) == matching::kMinInToleranceScore);
  CHECK(matching::score_date(query, date("2024-01-19"), 3) == 0.0);
}

TEST_CASE("score_date: zero tolerance accepts only the same day", "[scorer][date]") {
  const auto query = date("2024-01-15");
  CHECK(matching::score_date(query, date("2024-01-15"), 0) == 1.0);
  CHECK(matching::score_date(query, date("2024-01-16"), 0) == 0.0);
}

// ── Merchant ────────────────────────────────────────────────────────────────

TEST_CASE("score_merchant: exact canonical or alias match", "[scorer][merchant]") {
  domain::Merchant merchant{.id = core::MerchantId{"m-001"},
                            .canonical_name = "Coffee Palace",
                            .aliases = {"CPALACE"}};

  CHECK(matching::score_merchant(std::string("coffee  palace"), &merchant) == 1.0);
  CHECK(matching::score_merchant(std::string("cpalace"), &merchant) == 1.0);
  CHECK(matching::score_merchant(std::string("Coffee"), &merchant) == 0.0);
  CHECK(matching::score_merchant(std::string("Coffee Palace"), nullptr) == 0.0);
  CHECK(matching::score_merchant(std::nullopt, nullptr) == 1.0);
}

// ── Weights ─────────────────────────────────────────────────────────────────

TEST_CASE("ActiveWeights renormalizes over present dimensions", "[scorer][weights]") {
  const matching::ScoreWeights base;

  const auto all = matching::ActiveWeights::for_dimensions(base, true, true, true);
  CHECK_THAT(all.amount, WithinAbs(0.15, 1e-12));
  CHECK_THAT(all.merchant, WithinAbs(0.70, 1e-12));
  CHECK_THAT(all.sum(), WithinAbs(1.0, 1e-12));

  const auto amount_merchant = matching::ActiveWeights::for_dimensions(base, true, false, true);
  CHECK(amount_merchant.date == 0.0);
  CHECK_THAT(amount_merchant.amount, WithinAbs(0.15 / 0.85, 1e-12));
  CHECK_THAT(amount_merchant.merchant, WithinAbs(0.70 / 0.85, 1e-12));

  const auto amount_only = matching::ActiveWeights::for_dimensions(base, true, false, false);
  CHECK(amount_only.amount == 1.0);

  CHECK(matching::ActiveWeights::for_dimensions(base, false, false, false).empty());
}

TEST_CASE("composite_score is the weighted sum", "[scorer][weights]") {
  const auto weights =
      matching::ActiveWeights::for_dimensions(matching::ScoreWeights{}, true, false, true);
  CHECK_THAT(matching::composite_score(weights, 0.7, 1.0, 1.0),
             WithinAbs(0.15 / 0.85 * 0.7 + 0.70 / 0.85, 1e-12));
  CHECK(matching::composite_score(weights, 0.0, 1.0, 0.0) == 0.0);
}

TEST_CASE("validate_tolerance and validate_weights reject bad values", "[scorer][config]") {
  CHECK(matching::validate_tolerance(matching::ToleranceConfig{}).has_value());
  CHECK_FALSE(matching::validate_tolerance({.amount_tolerance_percent = 0.0}).has_value());
  CHECK_FALSE(matching::validate_tolerance({.date_tolerance_days = -1}).has_value());

  CHECK(matching::validate_weights(matching::ScoreWeights{}).has_value());
  const auto negative = matching::validate_weights({.amount = -0.1});
  REQUIRE_FALSE(negative.has_value());
  CHECK(negative.error().kind == core::ErrorKind::kInvalidConfig);
  CHECK_FALSE(matching::validate_weights({.merchant = 0.0}).has_value());
}
