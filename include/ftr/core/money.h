#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace ftr::core {

// Money is a currency-tagged decimal held as integer minor units (cents for USD/EUR/GBP).
// Integer storage keeps tolerance arithmetic exact at the boundary: 45.00 against a 50.00
// query at 10% is inside tolerance, not a floating-point coin toss.
struct Money {
  std::int64_t minor_units{0};
  std::string currency{"USD"};

  auto operator<=>(const Money&) const = default;
};

// Smallest representable amount (one minor unit).
constexpr std::int64_t kSmallestUnit = 1;

// parse_money reads a plain decimal such as "48.50", "48.5", "48" or "-3.10".
// At most two fractional digits; no thousands separators, signs other than a leading '-',
// or exponents. Returns nullopt for anything else.
[[nodiscard]] std::optional<Money> parse_money(std::string_view text, std::string currency);

// money_from_major converts a major-unit amount (50.0 -> 5000 minor units), rounding
// half away from zero. Returns nullopt for NaN or infinite input.
[[nodiscard]] std::optional<Money> money_from_major(double amount, std::string currency);

// to_major returns the amount in major units (5000 -> 50.0).
[[nodiscard]] double to_major(const Money& money);

// format_money renders "USD 48.50".
[[nodiscard]] std::string format_money(const Money& money);

// format_decimal renders only the number: "48.50".
[[nodiscard]] std::string format_decimal(const Money& money);

}  // namespace ftr::core
