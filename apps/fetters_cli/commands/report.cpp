#include "report.h"

#include "fetters/app/report_commands.h"

#include "session.h"
#include "shared/arg_parser.h"
#include <iostream>
#include <string>
#include <vector>

int cmd_export(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  using fetters::app::ExportOptions;
  using fetters::apps::ValueMode;

  const std::vector<fetters::apps::Option<ExportOptions>> options = {
      {"--directory", "-d", ValueMode::kRequired,
       "Export to this directory (defaults to the current directory)",
       [](ExportOptions& c, const std::string& v) {
         c.directory = v;
         return true;
       }},
      {"--filename", "-f", ValueMode::kRequired,
       "Name of the exported file ('.xlsx' is appended when missing)",
       [](ExportOptions& c, const std::string& v) {
         c.filename = v;
         return true;
       }},
      {"--sprint", "-s", ValueMode::kRequired, "Sprint to export (defaults to the current sprint)",
       [](ExportOptions& c, const std::string& v) {
         c.sprint = v;
         return true;
       }},
  };
  auto parsed = fetters::apps::parse_options(argc, argv, options, 2);
  if (!parsed.valid || !parsed.positionals.empty()) {
    std::cerr << "Usage: fetters export [options]\n" << fetters::apps::format_options(options);
    return 1;
  }

  auto session = Session::open();
  if (!session.has_value()) {
    return report_error(session.error());
  }
  auto path = fetters::app::export_jobs(session.value()->context(), parsed.config);
  if (!path.has_value()) {
    return report_error(path.error());
  }
  return 0;
}

int cmd_insights(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  struct InsightsCliConfig {
    bool json{false};
  };
  const std::vector<fetters::apps::Option<InsightsCliConfig>> options = {
      {"--json", "", fetters::apps::ValueMode::kNone, "Print the insights as JSON",
       [](InsightsCliConfig& c, const std::string&) {
         c.json = true;
         return true;
       }},
  };
  auto parsed = fetters::apps::parse_options(argc, argv, options, 2);
  if (!parsed.valid || !parsed.positionals.empty()) {
    std::cerr << "Usage: fetters insights [--json]\n";
    return 1;
  }

  auto session = Session::open();
  if (!session.has_value()) {
    return report_error(session.error());
  }
  return exit_code(fetters::app::show_insights(session.value()->context(), parsed.config.json));
}
