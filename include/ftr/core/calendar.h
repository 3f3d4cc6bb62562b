#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace ftr::core {

using CalendarDate = std::chrono::year_month_day;

// parse_iso_date accepts "YYYY-MM-DD" and also a full ISO timestamp
// ("YYYY-MM-DDTHH:MM:SS[...]" or "YYYY-MM-DD HH:MM"), keeping only the calendar date.
// Returns nullopt for malformed or impossible dates (2026-02-30).
[[nodiscard]] std::optional<CalendarDate> parse_iso_date(std::string_view text);

// format_iso_date renders "YYYY-MM-DD".
[[nodiscard]] std::string format_iso_date(const CalendarDate& date);

// days_between returns (to - from) in whole days; negative when to precedes from.
[[nodiscard]] int days_between(const CalendarDate& from, const CalendarDate& to);

}  // namespace ftr::core
