#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace fetters::core {

// Date separators used by the data model:
// sprint and job dates are YYYY-MM-DD, interview stage dates are YYYY/MM/DD.
inline constexpr char kIsoDateSeparator = '-';
inline constexpr char kStageDateSeparator = '/';

struct CalendarDate {
  int year{0};
  int month{0};
  int day{0};

  auto operator<=>(const CalendarDate&) const = default;
};

// Parse a zero-padded YYYY<sep>MM<sep>DD date. Rejects out-of-range months and days
// (leap years honored) and any trailing characters.
[[nodiscard]] std::optional<CalendarDate> parse_date(std::string_view text, char separator);

// Format as zero-padded YYYY<sep>MM<sep>DD.
[[nodiscard]] std::string format_date(const CalendarDate& date, char separator);

// Validate a job creation timestamp: YYYY-MM-DD HH:MM:SS.
[[nodiscard]] bool is_valid_timestamp(std::string_view text);

[[nodiscard]] bool is_leap_year(int year);
[[nodiscard]] int days_in_month(int year, int month);

}  // namespace fetters::core
