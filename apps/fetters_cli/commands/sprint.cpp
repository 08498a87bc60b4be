#include "sprint.h"

#include "fetters/app/sprint_commands.h"

#include "session.h"
#include "shared/arg_parser.h"
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

constexpr const char* kSprintUsage =
    "Usage: fetters sprint <subcommand>\n"
    "\n"
    "Subcommands:\n"
    "  current                Display the current sprint name\n"
    "  new [-n <name>]        Create a new sprint and make it current\n"
    "  show-all [--json]      Show all sprints\n"
    "  set                    Set the current sprint\n";

struct SprintCliConfig {
  std::optional<std::string> name;
  bool json{false};
};

template <typename Run>
int with_session(Run run) {
  auto session = Session::open();
  if (!session.has_value()) {
    return report_error(session.error());
  }
  return run(session.value()->context());
}

}  // namespace

int cmd_sprint(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  if (argc < 3) {
    std::cerr << kSprintUsage;
    return 1;
  }
  const std::string subcommand = argv[2];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

  std::vector<fetters::apps::Option<SprintCliConfig>> options;
  if (subcommand == "new") {
    options.push_back({"--name", "-n", fetters::apps::ValueMode::kRequired,
                       "Override the default sprint name (YYYY-MM-DD)",
                       [](SprintCliConfig& c, const std::string& v) {
                         c.name = v;
                         return true;
                       }});
  } else if (subcommand == "show-all") {
    options.push_back({"--json", "", fetters::apps::ValueMode::kNone, "Print the sprints as JSON",
                       [](SprintCliConfig& c, const std::string&) {
                         c.json = true;
                         return true;
                       }});
  } else if (subcommand != "current" && subcommand != "set") {
    std::cerr << "Unknown sprint subcommand: " << subcommand << "\n" << kSprintUsage;
    return 1;
  }

  auto parsed = fetters::apps::parse_options(argc, argv, options, 3);
  if (!parsed.valid || !parsed.positionals.empty()) {
    std::cerr << "Usage: fetters sprint " << subcommand << "\n"
              << fetters::apps::format_options(options);
    return 1;
  }
  const auto& config = parsed.config;

  if (subcommand == "current") {
    return with_session([](fetters::app::CommandContext& ctx) {
      return exit_code(fetters::app::show_current_sprint(ctx));
    });
  }
  if (subcommand == "new") {
    return with_session([&config](fetters::app::CommandContext& ctx) {
      auto sprint = fetters::app::new_sprint(ctx, config.name);
      if (!sprint.has_value()) {
        return report_error(sprint.error());
      }
      return 0;
    });
  }
  if (subcommand == "show-all") {
    return with_session([&config](fetters::app::CommandContext& ctx) {
      return exit_code(fetters::app::show_all_sprints(ctx, config.json));
    });
  }
  return with_session([](fetters::app::CommandContext& ctx) {
    return exit_code(fetters::app::set_current_sprint(ctx));
  });
}
