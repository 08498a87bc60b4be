#pragma once

#include "fetters/core/error.h"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace fetters::config {

// Reads an environment variable; nullopt when unset or empty.
using EnvLookup = std::function<std::optional<std::string>(const char* name)>;

[[nodiscard]] std::optional<std::string> system_env(const char* name);

// Per-user locations of the database and the config document.
struct AppPaths {
  std::filesystem::path data_dir;
  std::filesystem::path config_dir;
  std::filesystem::path database_file;
  std::filesystem::path config_file;
};

// Resolution order:
//   database: $FETTERS_DB, else $XDG_DATA_HOME/fetters/fetters.db,
//             else $HOME/.local/share/fetters/fetters.db
//   config:   $FETTERS_CONFIG, else $XDG_CONFIG_HOME/fetters/fetters.toml,
//             else $HOME/.config/fetters/fetters.toml
// Fails with kApplicationDirUnavailable when a location cannot be derived.
[[nodiscard]] core::FettersResult<AppPaths> resolve_app_paths(const EnvLookup& env = system_env);

// Create the parent directories of both files (kIo on failure).
[[nodiscard]] core::FettersResult<bool> ensure_app_dirs(const AppPaths& paths);

}  // namespace fetters::config
