#include "fetters/config/toml.h"

#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <string>

namespace fetters::config {

namespace {

bool is_bare_key_char(char c) {
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_' ||
         c == '-';
}

bool is_digit(char c) { return c >= '0' && c <= '9'; }

bool is_space(char c) { return c == ' ' || c == '\t'; }

// true/false, or a decimal integer with an optional sign and single
// underscores between digits.
bool is_valid_literal(std::string_view text) {
  if (text == "true" || text == "false") {
    return true;
  }
  if (!text.empty() && (text.front() == '+' || text.front() == '-')) {
    text.remove_prefix(1);
  }
  if (text.empty() || !is_digit(text.front()) || !is_digit(text.back())) {
    return false;
  }
  if (text.size() > 1 && text.front() == '0') {
    return false;
  }
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (text[i] == '_') {
      if (!is_digit(text[i + 1]) || !is_digit(text[i - 1])) {
        return false;
      }
    } else if (!is_digit(text[i])) {
      return false;
    }
  }
  return true;
}

void append_utf8(std::string& out, std::uint32_t code_point) {
  if (code_point < 0x80) {
    out += static_cast<char>(code_point);
  } else if (code_point < 0x800) {
    out += static_cast<char>(0xC0 | (code_point >> 6));
    out += static_cast<char>(0x80 | (code_point & 0x3F));
  } else if (code_point < 0x10000) {
    out += static_cast<char>(0xE0 | (code_point >> 12));
    out += static_cast<char>(0x80 | ((code_point >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (code_point & 0x3F));
  } else {
    out += static_cast<char>(0xF0 | (code_point >> 18));
    out += static_cast<char>(0x80 | ((code_point >> 12) & 0x3F));
    out += static_cast<char>(0x80 | ((code_point >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (code_point & 0x3F));
  }
}

// Cursor over a single line. Every parse_* member advances pos_ past what it
// consumed and reports failures through error_.
class LineParser {
 public:
  explicit LineParser(std::string_view line) : line_(line) {}

  void skip_space() {
    while (pos_ < line_.size() && is_space(line_[pos_])) {
      ++pos_;
    }
  }

  [[nodiscard]] bool at_end() const { return pos_ >= line_.size(); }
  [[nodiscard]] char peek() const { return line_[pos_]; }
  void advance() { ++pos_; }

  // Only whitespace or a comment may follow.
  [[nodiscard]] bool finish() {
    skip_space();
    if (!at_end() && peek() != '#') {
      error_ = "unexpected trailing characters";
      return false;
    }
    return true;
  }

  [[nodiscard]] std::optional<std::string> parse_key() {
    if (at_end()) {
      error_ = "missing key";
      return std::nullopt;
    }
    if (peek() == '"') {
      return parse_basic_string();
    }
    if (peek() == '\'') {
      return parse_literal_string();
    }
    const std::size_t start = pos_;
    while (!at_end() && is_bare_key_char(peek())) {
      advance();
    }
    if (pos_ == start) {
      error_ = "invalid key";
      return std::nullopt;
    }
    if (!at_end() && peek() == '.') {
      error_ = "dotted keys are not supported";
      return std::nullopt;
    }
    return std::string{line_.substr(start, pos_ - start)};
  }

  [[nodiscard]] std::optional<TomlValue> parse_value() {
    if (at_end()) {
      error_ = "missing value";
      return std::nullopt;
    }
    if (peek() == '"') {
      auto text = parse_basic_string();
      if (!text.has_value()) {
        return std::nullopt;
      }
      return TomlValue{TomlValue::Kind::kString, std::move(text.value())};
    }
    if (peek() == '\'') {
      auto text = parse_literal_string();
      if (!text.has_value()) {
        return std::nullopt;
      }
      return TomlValue{TomlValue::Kind::kString, std::move(text.value())};
    }

    const std::size_t start = pos_;
    while (!at_end() && !is_space(peek()) && peek() != '#') {
      advance();
    }
    const std::string_view token = line_.substr(start, pos_ - start);
    if (!is_valid_literal(token)) {
      error_ = "unsupported value '" + std::string{token} + "'";
      return std::nullopt;
    }
    return TomlValue{TomlValue::Kind::kLiteral, std::string{token}};
  }

  [[nodiscard]] const std::string& error() const { return error_; }

 private:
  std::optional<std::string> parse_basic_string() {
    if (line_.substr(pos_).starts_with("\"\"\"")) {
      error_ = "multi-line strings are not supported";
      return std::nullopt;
    }
    advance();  // opening quote
    std::string out;
    while (!at_end()) {
      const char c = peek();
      advance();
      if (c == '"') {
        return out;
      }
      if (c != '\\') {
        out += c;
        continue;
      }
      if (at_end()) {
        break;
      }
      const char escape = peek();
      advance();
      switch (escape) {
        case 'b':
          out += '\b';
          break;
        case 't':
          out += '\t';
          break;
        case 'n':
          out += '\n';
          break;
        case 'f':
          out += '\f';
          break;
        case 'r':
          out += '\r';
          break;
        case '"':
          out += '"';
          break;
        case '\\':
          out += '\\';
          break;
        case 'u':
        case 'U': {
          const std::size_t digits = escape == 'u' ? 4 : 8;
          if (pos_ + digits > line_.size()) {
            error_ = "truncated unicode escape";
            return std::nullopt;
          }
          std::uint32_t code_point = 0;
          for (std::size_t i = 0; i < digits; ++i) {
            const char h = peek();
            advance();
            code_point <<= 4;
            if (is_digit(h)) {
              code_point |= static_cast<std::uint32_t>(h - '0');
            } else if (h >= 'a' && h <= 'f') {
              code_point |= static_cast<std::uint32_t>(h - 'a' + 10);
            } else if (h >= 'A' && h <= 'F') {
              code_point |= static_cast<std::uint32_t>(h - 'A' + 10);
            } else {
              error_ = "invalid unicode escape";
              return std::nullopt;
            }
          }
          if (code_point > 0x10FFFF || (code_point >= 0xD800 && code_point <= 0xDFFF)) {
            error_ = "invalid unicode scalar value";
            return std::nullopt;
          }
          append_utf8(out, code_point);
          break;
        }
        default:
          error_ = std::string{"invalid escape sequence \\"} + escape;
          return std::nullopt;
      }
    }
    error_ = "unterminated string";
    return std::nullopt;
  }

  std::optional<std::string> parse_literal_string() {
    if (line_.substr(pos_).starts_with("'''")) {
      error_ = "multi-line strings are not supported";
      return std::nullopt;
    }
    advance();  // opening quote
    const std::size_t close = line_.find('\'', pos_);
    if (close == std::string_view::npos) {
      error_ = "unterminated string";
      return std::nullopt;
    }
    std::string out{line_.substr(pos_, close - pos_)};
    pos_ = close + 1;
    return out;
  }

  std::string_view line_;
  std::size_t pos_{0};
  std::string error_;
};

std::string quote_string(std::string_view value) {
  std::string out = "\"";
  for (const char c : value) {
    switch (c) {
      case '"':
        out += "\\\"";
        break;
      case '\\':
        out += "\\\\";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\t':
        out += "\\t";
        break;
      case '\r':
        out += "\\r";
        break;
      case '\b':
        out += "\\b";
        break;
      case '\f':
        out += "\\f";
        break;
      default:
        if (static_cast<unsigned char>(c) < 0x20 || c == 0x7F) {
          char buffer[8];
          std::snprintf(buffer, sizeof(buffer), "\\u%04X", static_cast<unsigned char>(c));
          out += buffer;
        } else {
          out += c;
        }
    }
  }
  out += '"';
  return out;
}

std::string format_key(std::string_view key) {
  for (const char c : key) {
    if (!is_bare_key_char(c)) {
      return quote_string(key);
    }
  }
  return std::string{key};
}

std::pair<std::string_view, std::string_view> split_path(std::string_view path) {
  const auto dot = path.find('.');
  if (dot == std::string_view::npos) {
    return {std::string_view{}, path};
  }
  return {path.substr(0, dot), path.substr(dot + 1)};
}

core::Error line_error(std::size_t line_number, const std::string& message) {
  return core::make_error(core::ErrorKind::kConfigDeserialize,
                          message + " at line " + std::to_string(line_number));
}

}  // namespace

std::optional<std::string> TomlDocument::get_string(std::string_view path) const {
  const TomlValue* value = find(path);
  if (value == nullptr || value->kind != TomlValue::Kind::kString) {
    return std::nullopt;
  }
  return value->text;
}

const TomlValue* TomlDocument::find(std::string_view path) const {
  const auto [table, key] = split_path(path);
  for (const auto& entry : entries_) {
    if (entry.table == table && entry.key == key) {
      return &entry.value;
    }
  }
  return nullptr;
}

TomlEntry* TomlDocument::find_entry(std::string_view path) {
  const auto [table, key] = split_path(path);
  for (auto& entry : entries_) {
    if (entry.table == table && entry.key == key) {
      return &entry;
    }
  }
  return nullptr;
}

void TomlDocument::set_string(std::string_view path, std::string value) {
  if (TomlEntry* entry = find_entry(path); entry != nullptr) {
    entry->value = TomlValue{TomlValue::Kind::kString, std::move(value)};
    return;
  }
  const auto [table, key] = split_path(path);
  entries_.push_back(TomlEntry{std::string{table}, std::string{key},
                               TomlValue{TomlValue::Kind::kString, std::move(value)}});
}

core::FettersResult<TomlDocument> parse_toml(std::string_view text) {
  using ResultType = core::FettersResult<TomlDocument>;

  TomlDocument document;
  std::string current_table;
  std::vector<std::string> seen_tables;
  std::size_t line_number = 0;

  while (!text.empty()) {
    ++line_number;
    const auto newline = text.find('\n');
    std::string_view line = text.substr(0, newline);
    text = newline == std::string_view::npos ? std::string_view{} : text.substr(newline + 1);
    if (!line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }

    LineParser parser(line);
    parser.skip_space();
    if (parser.at_end() || parser.peek() == '#') {
      continue;
    }

    if (parser.peek() == '[') {
      parser.advance();
      if (!parser.at_end() && parser.peek() == '[') {
        return ResultType::err(line_error(line_number, "arrays of tables are not supported"));
      }
      parser.skip_space();
      auto table = parser.parse_key();
      if (!table.has_value()) {
        return ResultType::err(line_error(line_number, parser.error()));
      }
      parser.skip_space();
      if (parser.at_end() || parser.peek() != ']') {
        return ResultType::err(line_error(line_number, "unterminated table header"));
      }
      parser.advance();
      if (!parser.finish()) {
        return ResultType::err(line_error(line_number, parser.error()));
      }
      for (const auto& seen : seen_tables) {
        if (seen == table.value()) {
          return ResultType::err(
              line_error(line_number, "duplicate table '" + table.value() + "'"));
        }
      }
      seen_tables.push_back(table.value());
      current_table = std::move(table.value());
      continue;
    }

    auto key = parser.parse_key();
    if (!key.has_value()) {
      return ResultType::err(line_error(line_number, parser.error()));
    }
    parser.skip_space();
    if (parser.at_end() || parser.peek() != '=') {
      return ResultType::err(line_error(line_number, "expected '=' after key"));
    }
    parser.advance();
    parser.skip_space();
    auto value = parser.parse_value();
    if (!value.has_value()) {
      return ResultType::err(line_error(line_number, parser.error()));
    }
    if (!parser.finish()) {
      return ResultType::err(line_error(line_number, parser.error()));
    }

    for (const auto& entry : document.entries()) {
      if (entry.table == current_table && entry.key == key.value()) {
        return ResultType::err(line_error(line_number, "duplicate key '" + key.value() + "'"));
      }
    }
    document.add(TomlEntry{current_table, std::move(key.value()), std::move(value.value())});
  }

  return ResultType::ok(std::move(document));
}

core::FettersResult<std::string> serialize_toml(const TomlDocument& document) {
  using ResultType = core::FettersResult<std::string>;

  std::vector<std::string> tables;
  for (const auto& entry : document.entries()) {
    if (entry.key.empty()) {
      return ResultType::err(core::make_error(core::ErrorKind::kConfigSerialize, "empty key"));
    }
    if (entry.value.kind == TomlValue::Kind::kLiteral && !is_valid_literal(entry.value.text)) {
      return ResultType::err(core::make_error(core::ErrorKind::kConfigSerialize,
                                              "invalid value for key '" + entry.key + "'"));
    }
    if (!entry.table.empty() &&
        std::find(tables.begin(), tables.end(), entry.table) == tables.end()) {
      tables.push_back(entry.table);
    }
  }

  const auto write_entry = [](std::string& out, const TomlEntry& entry) {
    out += format_key(entry.key);
    out += " = ";
    out += entry.value.kind == TomlValue::Kind::kString ? quote_string(entry.value.text)
                                                         : entry.value.text;
    out += '\n';
  };

  std::string out;
  for (const auto& entry : document.entries()) {
    if (entry.table.empty()) {
      write_entry(out, entry);
    }
  }
  for (const auto& table : tables) {
    if (!out.empty()) {
      out += '\n';
    }
    out += "[" + format_key(table) + "]\n";
    for (const auto& entry : document.entries()) {
      if (entry.table == table) {
        write_entry(out, entry);
      }
    }
  }

  return ResultType::ok(std::move(out));
}

}  // namespace fetters::config
