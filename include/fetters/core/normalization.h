#pragma once

#include <string>
#include <string_view>

namespace fetters::core {

// ASCII-only string helpers. Locale-independent and byte-stable.

// normalize_ascii_upper converts ASCII lowercase (a-z) to uppercase (A-Z).
// Non-ASCII characters are preserved unchanged.
inline std::string normalize_ascii_upper(const std::string_view input) {
  std::string result;
  result.reserve(input.size());

  for (const char ch : input) {
    if (ch >= 'a' && ch <= 'z') {
      constexpr char kCaseOffset = 'a' - 'A';
      result.push_back(static_cast<char>(ch - kCaseOffset));
    } else {
      result.push_back(ch);
    }
  }

  return result;
}

// trim removes leading and trailing whitespace (ASCII space/tab/newline)
inline std::string trim(const std::string_view input) {
  std::size_t start = 0;
  while (start < input.size() && (input[start] == ' ' || input[start] == '\t' ||
                                  input[start] == '\n' || input[start] == '\r')) {
    ++start;
  }

  std::size_t end = input.size();
  while (end > start && (input[end - 1] == ' ' || input[end - 1] == '\t' ||
                         input[end - 1] == '\n' || input[end - 1] == '\r')) {
    --end;
  }

  return std::string{input.substr(start, end - start)};
}

// Escape character used in every LIKE clause built by the storage layer.
inline constexpr char kLikeEscape = '\\';

// like_contains_pattern builds a `%value%` LIKE pattern in which `%`, `_` and the
// escape character itself match literally. Pair with `ESCAPE '\'`.
inline std::string like_contains_pattern(const std::string_view value) {
  std::string pattern;
  pattern.reserve(value.size() + 2);
  pattern.push_back('%');
  for (const char ch : value) {
    if (ch == '%' || ch == '_' || ch == kLikeEscape) {
      pattern.push_back(kLikeEscape);
    }
    pattern.push_back(ch);
  }
  pattern.push_back('%');
  return pattern;
}

}  // namespace fetters::core
