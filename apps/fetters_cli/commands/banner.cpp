#include "banner.h"

#include "fetters/cli/console.h"

#include "session.h"
#include <iostream>

std::string_view banner_text() {
  return R"(
  __      _   _
 / _| ___| |_| |_ ___ _ __ ___
| |_ / _ \ __| __/ _ \ '__/ __|
|  _|  __/ |_| ||  __/ |  \__ \
|_|  \___|\__|\__\___|_|  |___/

  track your job applications in sprints
)";
}

int cmd_banner(int argc, char* /*argv*/[]) {  // NOLINT(modernize-avoid-c-arrays)
  if (argc != 2) {
    std::cerr << "Usage: fetters banner\n";
    return 1;
  }
  const auto& console = stdout_console();
  console.out << fetters::cli::paint(console, banner_text(), fetters::cli::Color::kCyan, true)
              << "\n";
  return 0;
}
