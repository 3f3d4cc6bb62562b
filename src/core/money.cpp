#include "ftr/core/money.h"

#include <cmath>
#include <cstdlib>
#include <limits>

namespace ftr::core {

std::optional<Money> parse_money(const std::string_view text, std::string currency) {
  if (text.empty()) {
    return std::nullopt;
  }

  std::size_t pos = 0;
  bool negative = false;
  if (text[0] == '-') {
    negative = true;
    pos = 1;
  }

  std::int64_t whole = 0;
  std::size_t whole_digits = 0;
  while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
    if (whole > (std::numeric_limits<std::int64_t>::max() / 1000)) {
      return std::nullopt;
    }
    whole = whole * 10 + (text[pos] - '0');
    ++whole_digits;
    ++pos;
  }
  if (whole_digits == 0) {
    return std::nullopt;
  }

  std::int64_t fraction = 0;
  if (pos < text.size()) {
    if (text[pos] != '.') {
      return std::nullopt;
    }
    ++pos;
    std::size_t fraction_digits = 0;
    while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
      if (fraction_digits == 2) {
        return std::nullopt;
      }
      fraction = fraction * 10 + (text[pos] - '0');
      ++fraction_digits;
      ++pos;
    }
    if (fraction_digits == 0 || pos != text.size()) {
      return std::nullopt;
    }
    if (fraction_digits == 1) {
      fraction *= 10;
    }
  }

  std::int64_t minor = whole * 100 + fraction;
  if (negative) {
    minor = -minor;
  }
  return Money{minor, std::move(currency)};
}

std::optional<Money> money_from_major(const double amount, std::string currency) {
  if (!std::isfinite(amount)) {
    return std::nullopt;
  }
  const double scaled = amount * 100.0;
  if (std::fabs(scaled) > static_cast<double>(std::numeric_limits<std::int64_t>::max() / 2)) {
    return std::nullopt;
  }
  return Money{static_cast<std::int64_t>(std::llround(scaled)), std::move(currency)};
}

double to_major(const Money& money) {
  return static_cast<double>(money.minor_units) / 100.0;
}

std::string format_decimal(const Money& money) {
  const std::int64_t abs_units = std::llabs(money.minor_units);
  const std::int64_t cents = abs_units % 100;
  std::string out = money.minor_units < 0 ? "-" : "";
  out += std::to_string(abs_units / 100);
  out += '.';
  if (cents < 10) {
    out += '0';
  }
  out += std::to_string(cents);
  return out;
}

std::string format_money(const Money& money) {
  return money.currency + " " + format_decimal(money);
}

}  // namespace ftr::core
