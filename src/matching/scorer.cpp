#include "ftr/matching/scorer.h"

#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace ftr::matching {

core::Result<bool, core::Error> validate_tolerance(const ToleranceConfig& config) {
  using R = core::Result<bool, core::Error>;

  if (!(config.amount_tolerance_percent > 0.0) || !std::isfinite(config.amount_tolerance_percent)) {
    return R::err(core::make_error(core::ErrorKind::kInvalidConfig,
                                   "amount_tolerance_percent must be a finite value > 0"));
  }
  if (config.date_tolerance_days < 0) {
    return R::err(
        core::make_error(core::ErrorKind::kInvalidConfig, "date_tolerance_days must be >= 0"));
  }
  return R::ok(true);
}

core::Result<bool, core::Error> validate_weights(const ScoreWeights& weights) {
  using R = core::Result<bool, core::Error>;

  if (weights.amount < 0.0 || weights.date < 0.0 || weights.merchant < 0.0) {
    return R::err(
        core::make_error(core::ErrorKind::kInvalidConfig, "score weights must be non-negative"));
  }
  if (weights.amount <= 0.0 || weights.date <= 0.0 || weights.merchant <= 0.0) {
    return R::err(core::make_error(core::ErrorKind::kInvalidConfig,
                                   "every dimension needs a positive weight"));
  }
  return R::ok(true);
}

ActiveWeights ActiveWeights::for_dimensions(const ScoreWeights& base, const bool has_amount,
                                            const bool has_date, const bool has_merchant) {
  ActiveWeights active;
  active.amount = has_amount ? base.amount : 0.0;
  active.date = has_date ? base.date : 0.0;
  active.merchant = has_merchant ? base.merchant : 0.0;

  const double total = active.sum();
  if (total <= 0.0) {
    return ActiveWeights{};
  }
  active.amount /= total;
  active.date /= total;
  active.merchant /= total;
  return active;
}

double score_amount(const core::Money& query_amount, const core::Money& txn_amount,
                    const double tolerance_percent) {
  if (query_amount.currency != txn_amount.currency || tolerance_percent <= 0.0) {
    return 0.0;
  }

  const std::int64_t diff = std::llabs(query_amount.minor_units - txn_amount.minor_units);
  if (diff == 0) {
    return 1.0;
  }

  const std::int64_t base = std::max(query_amount.minor_units, core::kSmallestUnit);
  // Multiply before dividing: 10 * 5000 / 100 is exactly 500, 0.1 * 5000 is not.
  const double allowance = tolerance_percent * static_cast<double>(base) / 100.0;
  const double distance = static_cast<double>(diff);
  if (distance > allowance) {
    return 0.0;
  }

  return std::clamp(1.0 - distance / allowance, kMinInToleranceScore, 1.0);
}

double score_date(const core::CalendarDate& query_date, const core::CalendarDate& txn_date,
                  const int tolerance_days) {
  const int days = std::abs(core::days_between(query_date, txn_date));
  if (days == 0) {
    return 1.0;
  }
  if (tolerance_days <= 0 || days > tolerance_days) {
    return 0.0;
  }

  const double score =
      1.0 - static_cast<double>(days) / static_cast<double>(tolerance_days);
  return std::clamp(score, kMinInToleranceScore, 1.0);
}

double score_merchant(const std::optional<std::string>& query_text,
                      const domain::Merchant* merchant) {
  if (!query_text.has_value()) {
    return 1.0;
  }
  if (merchant == nullptr) {
    return 0.0;
  }
  return merchant->matches_exactly(*query_text) ? 1.0 : 0.0;
}

double composite_score(const ActiveWeights& weights, const double amount_score,
                       const double date_score, const double merchant_score) {
  const double score = weights.amount * amount_score + weights.date * date_score +
                       weights.merchant * merchant_score;
  return std::clamp(score, 0.0, 1.0);
}

}  // namespace ftr::matching
