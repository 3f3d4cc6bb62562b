#include "ftr/core/calendar.h"

#include <iomanip>
#include <sstream>

namespace ftr::core {

namespace {

bool parse_fixed_digits(const std::string_view text, const std::size_t offset,
                        const std::size_t count, int& out) {
  if (offset + count > text.size()) {
    return false;
  }
  int value = 0;
  for (std::size_t i = offset; i < offset + count; ++i) {
    const char ch = text[i];
    if (ch < '0' || ch > '9') {
      return false;
    }
    value = value * 10 + (ch - '0');
  }
  out = value;
  return true;
}

}  // namespace

std::optional<CalendarDate> parse_iso_date(const std::string_view text) {
  // YYYY-MM-DD is exactly 10 characters; anything after must start a time component.
  if (text.size() < 10 || text[4] != '-' || text[7] != '-') {
    return std::nullopt;
  }
  if (text.size() > 10 && text[10] != 'T' && text[10] != ' ') {
    return std::nullopt;
  }

  int y = 0;
  int m = 0;
  int d = 0;
  if (!parse_fixed_digits(text, 0, 4, y) || !parse_fixed_digits(text, 5, 2, m) ||
      !parse_fixed_digits(text, 8, 2, d)) {
    return std::nullopt;
  }

  const CalendarDate date{std::chrono::year{y}, std::chrono::month{static_cast<unsigned>(m)},
                          std::chrono::day{static_cast<unsigned>(d)}};
  if (!date.ok()) {
    return std::nullopt;
  }
  return date;
}

std::string format_iso_date(const CalendarDate& date) {
  std::ostringstream oss;
  oss << std::setfill('0') << std::setw(4) << static_cast<int>(date.year()) << '-'
      << std::setw(2) << static_cast<unsigned>(date.month()) << '-' << std::setw(2)
      << static_cast<unsigned>(date.day());
  return oss.str();
}

int days_between(const CalendarDate& from, const CalendarDate& to) {
  const auto delta = std::chrono::sys_days{to} - std::chrono::sys_days{from};
  return static_cast<int>(delta.count());
}

}  // namespace ftr::core
