#include "fetters/config/paths.h"

#include <cstdlib>
#include <system_error>

namespace fetters::config {

namespace {

constexpr const char* kAppDirName = "fetters";
constexpr const char* kDatabaseFileName = "fetters.db";
constexpr const char* kConfigFileName = "fetters.toml";

// $<xdg_var>/fetters, else $HOME/<fallback>/fetters.
std::optional<std::filesystem::path> app_dir(const EnvLookup& env, const char* xdg_var,
                                             const char* home_fallback) {
  if (auto base = env(xdg_var); base.has_value()) {
    return std::filesystem::path{base.value()} / kAppDirName;
  }
  if (auto home = env("HOME"); home.has_value()) {
    return std::filesystem::path{home.value()} / home_fallback / kAppDirName;
  }
  return std::nullopt;
}

core::FettersResult<bool> create_parent(const std::filesystem::path& file) {
  const auto parent = file.parent_path();
  if (parent.empty()) {
    return core::FettersResult<bool>::ok(true);
  }
  std::error_code ec;
  std::filesystem::create_directories(parent, ec);
  if (ec) {
    return core::FettersResult<bool>::err(core::make_error(
        core::ErrorKind::kIo, "cannot create " + parent.string() + ": " + ec.message()));
  }
  return core::FettersResult<bool>::ok(true);
}

}  // namespace

std::optional<std::string> system_env(const char* name) {
  const char* value = std::getenv(name);
  if (value == nullptr || *value == '\0') {
    return std::nullopt;
  }
  return std::string{value};
}

core::FettersResult<AppPaths> resolve_app_paths(const EnvLookup& env) {
  using ResultType = core::FettersResult<AppPaths>;

  AppPaths paths;

  if (auto override_db = env("FETTERS_DB"); override_db.has_value()) {
    paths.database_file = override_db.value();
    paths.data_dir = paths.database_file.parent_path();
  } else {
    auto dir = app_dir(env, "XDG_DATA_HOME", ".local/share");
    if (!dir.has_value()) {
      return ResultType::err(core::make_error(core::ErrorKind::kApplicationDirUnavailable));
    }
    paths.data_dir = dir.value();
    paths.database_file = paths.data_dir / kDatabaseFileName;
  }

  if (auto override_config = env("FETTERS_CONFIG"); override_config.has_value()) {
    paths.config_file = override_config.value();
    paths.config_dir = paths.config_file.parent_path();
  } else {
    auto dir = app_dir(env, "XDG_CONFIG_HOME", ".config");
    if (!dir.has_value()) {
      return ResultType::err(core::make_error(core::ErrorKind::kApplicationDirUnavailable));
    }
    paths.config_dir = dir.value();
    paths.config_file = paths.config_dir / kConfigFileName;
  }

  return ResultType::ok(std::move(paths));
}

core::FettersResult<bool> ensure_app_dirs(const AppPaths& paths) {
  auto data = create_parent(paths.database_file);
  if (!data.has_value()) {
    return data;
  }
  return create_parent(paths.config_file);
}

}  // namespace fetters::config
