#include "config_logic.h"

#include "launcher.h"
#include "session.h"
#include <filesystem>
#include <iostream>
#include <vector>

std::string resolve_editor(const fetters::config::EnvLookup& env) {
  if (auto visual = env("VISUAL")) {
    return visual.value();
  }
  if (auto editor = env("EDITOR")) {
    return editor.value();
  }
  return "vi";
}

int execute_config_show(const fetters::config::FileConfigStore& store, std::ostream& out) {
  auto text = store.read_text();
  if (!text.has_value()) {
    return report_error(text.error());
  }
  if (text.value().empty()) {
    out << "No settings saved yet in " << store.path().string() << "\n";
    return 0;
  }
  out << text.value();
  if (text.value().back() != '\n') {
    out << "\n";
  }
  return 0;
}

int execute_config_edit(fetters::config::FileConfigStore& store,
                        const fetters::config::EnvLookup& env) {
  std::error_code ec;
  if (!std::filesystem::exists(store.path(), ec)) {
    auto saved = store.save(fetters::config::FettersConfig{});
    if (!saved.has_value()) {
      return report_error(saved.error());
    }
  }

  // The editor value may carry arguments ("code -w"), so it goes through the shell.
  const std::string editor = resolve_editor(env);
  auto status = run_process({"/bin/sh", "-c", editor + " \"$1\"", "sh", store.path().string()});
  if (!status.has_value()) {
    return report_error(status.error());
  }
  if (status.value() != 0) {
    std::cerr << editor << " exited with status " << status.value() << "\n";
    return 1;
  }

  // Surface a broken document right away instead of on the next command.
  auto loaded = store.load();
  if (!loaded.has_value()) {
    return report_error(loaded.error());
  }
  return 0;
}
