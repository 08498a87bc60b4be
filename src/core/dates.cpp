#include "fetters/core/dates.h"

#include <cstdio>

namespace fetters::core {

namespace {

// Parse exactly `width` ASCII digits starting at `pos`.
std::optional<int> parse_digits(std::string_view text, std::size_t pos, std::size_t width) {
  if (pos + width > text.size()) {
    return std::nullopt;
  }
  int value = 0;
  for (std::size_t i = pos; i < pos + width; ++i) {
    const char ch = text[i];
    if (ch < '0' || ch > '9') {
      return std::nullopt;
    }
    value = value * 10 + (ch - '0');
  }
  return value;
}

}  // namespace

bool is_leap_year(int year) {
  return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int days_in_month(int year, int month) {
  switch (month) {
    case 1:
    case 3:
    case 5:
    case 7:
    case 8:
    case 10:
    case 12:
      return 31;
    case 4:
    case 6:
    case 9:
    case 11:
      return 30;
    case 2:
      return is_leap_year(year) ? 29 : 28;
    default:
      return 0;
  }
}

std::optional<CalendarDate> parse_date(std::string_view text, char separator) {
  if (text.size() != 10 || text[4] != separator || text[7] != separator) {
    return std::nullopt;
  }

  const auto year = parse_digits(text, 0, 4);
  const auto month = parse_digits(text, 5, 2);
  const auto day = parse_digits(text, 8, 2);
  if (!year || !month || !day) {
    return std::nullopt;
  }

  if (*month < 1 || *month > 12) {
    return std::nullopt;
  }
  if (*day < 1 || *day > days_in_month(*year, *month)) {
    return std::nullopt;
  }

  return CalendarDate{*year, *month, *day};
}

std::string format_date(const CalendarDate& date, char separator) {
  char buffer[16];
  std::snprintf(buffer, sizeof(buffer), "%04d%c%02d%c%02d", date.year, separator, date.month,
                separator, date.day);
  return std::string{buffer};
}

bool is_valid_timestamp(std::string_view text) {
  if (text.size() != 19 || text[10] != ' ' || text[13] != ':' || text[16] != ':') {
    return false;
  }
  if (!parse_date(text.substr(0, 10), kIsoDateSeparator).has_value()) {
    return false;
  }

  const auto hour = parse_digits(text, 11, 2);
  const auto minute = parse_digits(text, 14, 2);
  const auto second = parse_digits(text, 17, 2);
  return hour && minute && second && *hour < 24 && *minute < 60 && *second < 60;
}

}  // namespace fetters::core
