#pragma once

#include "fetters/core/error.h"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fetters::config {

// TomlValue keeps strings decoded and every other scalar as its literal text,
// so integers and booleans survive a read/write cycle unchanged.
struct TomlValue {
  enum class Kind {
    kString,
    kLiteral,
  };

  Kind kind{Kind::kString};
  std::string text;

  bool operator==(const TomlValue&) const = default;
};

// One key/value pair. table is empty for root keys.
struct TomlEntry {
  std::string table;
  std::string key;
  TomlValue value;

  bool operator==(const TomlEntry&) const = default;
};

// TomlDocument is the flat subset of TOML used by the config file:
// comments, blank lines, bare or quoted keys, [table] headers, basic and literal
// strings, integers and booleans. Entry order is preserved.
class TomlDocument {
 public:
  // Keys are addressed as "key" at the root or "table.key" inside a table.
  [[nodiscard]] std::optional<std::string> get_string(std::string_view path) const;
  [[nodiscard]] const TomlValue* find(std::string_view path) const;

  // Replace the value in place, or append a new entry.
  void set_string(std::string_view path, std::string value);

  [[nodiscard]] const std::vector<TomlEntry>& entries() const { return entries_; }
  void add(TomlEntry entry) { entries_.push_back(std::move(entry)); }

 private:
  TomlEntry* find_entry(std::string_view path);

  std::vector<TomlEntry> entries_;
};

// Errors are kConfigDeserialize and name the offending line.
[[nodiscard]] core::FettersResult<TomlDocument> parse_toml(std::string_view text);

// Root keys first, then one [table] section per table in order of appearance.
// Fails with kConfigSerialize on an empty key or a literal that is not a valid scalar.
[[nodiscard]] core::FettersResult<std::string> serialize_toml(const TomlDocument& document);

}  // namespace fetters::config
