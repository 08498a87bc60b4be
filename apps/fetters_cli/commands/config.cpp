#include "config.h"

#include "fetters/config/config_store.h"
#include "fetters/config/paths.h"

#include "config_logic.h"
#include "session.h"
#include <iostream>
#include <string>

int cmd_config(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::string subcommand =
      argc >= 3 ? argv[2] : "";  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  if (argc != 3 || (subcommand != "show" && subcommand != "edit")) {
    std::cerr << "Usage: fetters config show|edit\n";
    return 1;
  }

  auto paths = fetters::config::resolve_app_paths();
  if (!paths.has_value()) {
    return report_error(paths.error());
  }

  fetters::config::FileConfigStore store(paths.value().config_file);
  if (subcommand == "show") {
    return execute_config_show(store, std::cout);
  }

  auto dirs = fetters::config::ensure_app_dirs(paths.value());
  if (!dirs.has_value()) {
    return report_error(dirs.error());
  }
  return execute_config_edit(store, fetters::config::system_env);
}
