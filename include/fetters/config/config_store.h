#pragma once

#include "fetters/config/toml.h"
#include "fetters/core/error.h"

#include <filesystem>
#include <string>

namespace fetters::config {

inline constexpr const char* kCurrentSprintKey = "current_sprint_name";

// FettersConfig is the typed view of the config document.
// An empty current_sprint_name means no sprint has been selected yet.
struct FettersConfig {
  std::string current_sprint_name;

  bool operator==(const FettersConfig&) const = default;
};

// IConfigStore reads and writes the user configuration.
class IConfigStore {
 public:
  virtual ~IConfigStore() = default;

  [[nodiscard]] virtual core::FettersResult<FettersConfig> load() const = 0;
  [[nodiscard]] virtual core::FettersResult<bool> save(const FettersConfig& config) = 0;
};

// FileConfigStore keeps the config as a TOML file.
// A missing file loads as the default config. save() rewrites only the known
// keys and preserves every other entry already in the file.
class FileConfigStore final : public IConfigStore {
 public:
  explicit FileConfigStore(std::filesystem::path path);

  [[nodiscard]] core::FettersResult<FettersConfig> load() const override;
  [[nodiscard]] core::FettersResult<bool> save(const FettersConfig& config) override;

  // Raw document text; empty when the file does not exist yet.
  [[nodiscard]] core::FettersResult<std::string> read_text() const;

  [[nodiscard]] const std::filesystem::path& path() const { return path_; }

 private:
  [[nodiscard]] core::FettersResult<TomlDocument> load_document() const;

  std::filesystem::path path_;
};

// InMemoryConfigStore holds the config for tests and scripted runs.
class InMemoryConfigStore final : public IConfigStore {
 public:
  InMemoryConfigStore() = default;
  explicit InMemoryConfigStore(FettersConfig config) : config_(std::move(config)) {}

  [[nodiscard]] core::FettersResult<FettersConfig> load() const override;
  [[nodiscard]] core::FettersResult<bool> save(const FettersConfig& config) override;

 private:
  FettersConfig config_;
};

// Typed view of a parsed document.
[[nodiscard]] FettersConfig config_from_document(const TomlDocument& document);

}  // namespace fetters::config
