#pragma once

#include "ftr/core/calendar.h"
#include "ftr/core/error.h"
#include "ftr/core/money.h"
#include "ftr/core/result.h"
#include "ftr/domain/merchant.h"

#include <optional>
#include <string>

namespace ftr::matching {

// ToleranceConfig bounds how far a transaction may drift from the query and still score.
struct ToleranceConfig {
  double amount_tolerance_percent{10.0};  // must be > 0
  int date_tolerance_days{3};             // must be >= 0
};

[[nodiscard]] core::Result<bool, core::Error> validate_tolerance(const ToleranceConfig& config);

// ScoreWeights are the base weights of the three dimensions. They need not sum to 1;
// ActiveWeights normalizes them over the dimensions a query actually constrains.
struct ScoreWeights {
  double amount{0.15};
  double date{0.15};
  double merchant{0.70};
};

[[nodiscard]] core::Result<bool, core::Error> validate_weights(const ScoreWeights& weights);

// ActiveWeights is the per-query weight table. A dimension the query leaves out has weight 0
// and its share is redistributed proportionally among the present ones, so the entries of a
// non-empty table always sum to 1.
struct ActiveWeights {
  double amount{0.0};
  double date{0.0};
  double merchant{0.0};

  static ActiveWeights for_dimensions(const ScoreWeights& base, bool has_amount, bool has_date,
                                      bool has_merchant);

  [[nodiscard]] double sum() const { return amount + date + merchant; }
  [[nodiscard]] bool empty() const { return sum() == 0.0; }
};

// Scores inside tolerance never fall below this floor, so a transaction exactly on the
// tolerance boundary is still distinguishable from one outside it.
constexpr double kMinInToleranceScore = 1e-6;

// score_amount: 0 outside tolerance (or on currency mismatch); otherwise
// 1 - |q - a| / (p/100 * max(q, smallest_unit)), clamped to [kMinInToleranceScore, 1].
[[nodiscard]] double score_amount(const core::Money& query_amount, const core::Money& txn_amount,
                                  double tolerance_percent);

// score_date: 0 if more than tolerance_days apart; otherwise 1 - |days| / tolerance_days.
// With a zero tolerance only the same calendar day scores (1.0).
[[nodiscard]] double score_date(const core::CalendarDate& query_date,
                                const core::CalendarDate& txn_date, int tolerance_days);

// score_merchant: 1.0 on a case-insensitive exact match of the canonical name or any alias,
// 0.0 otherwise (including an unknown merchant). No query text is a neutral 1.0.
[[nodiscard]] double score_merchant(const std::optional<std::string>& query_text,
                                    const domain::Merchant* merchant);

// composite_score combines dimension scores with an active weight table; result in [0, 1].
[[nodiscard]] double composite_score(const ActiveWeights& weights, double amount_score,
                                     double date_score, double merchant_score);

}  // namespace ftr::matching
