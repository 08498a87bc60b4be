#include "job.h"

#include "fetters/app/job_commands.h"

#include "launcher.h"
#include "query_args.h"
#include "session.h"
#include "shared/arg_parser.h"
#include <iostream>
#include <string>
#include <vector>

namespace {

struct ListCliConfig {
  fetters::domain::JobFilter filter;
  bool json{false};
};

std::vector<fetters::apps::Option<ListCliConfig>> list_options() {
  std::vector<fetters::apps::Option<ListCliConfig>> options;
  for (auto& query : query_options()) {
    options.push_back({query.name, query.short_name, query.mode, query.description,
                       [handler = query.handler](ListCliConfig& c, const std::string& v) {
                         return handler(c.filter, v);
                       }});
  }
  options.push_back({"--json", "", fetters::apps::ValueMode::kNone, "Print the jobs as JSON",
                     [](ListCliConfig& c, const std::string&) {
                       c.json = true;
                       return true;
                     }});
  return options;
}

}  // namespace

int cmd_add(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<fetters::apps::Option<int>> options;
  auto parsed = fetters::apps::parse_options(argc, argv, options, 2);
  if (!parsed.valid || parsed.positionals.size() != 1) {
    std::cerr << "Usage: fetters add <company>\n";
    return 1;
  }

  auto session = Session::open();
  if (!session.has_value()) {
    return report_error(session.error());
  }
  return exit_code(fetters::app::add_job(session.value()->context(), parsed.positionals.front()));
}

int cmd_list(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const auto options = list_options();
  auto parsed = fetters::apps::parse_options(argc, argv, options, 2);
  if (!parsed.valid || !parsed.positionals.empty()) {
    std::cerr << "Usage: fetters list [options]\n" << fetters::apps::format_options(options);
    return 1;
  }

  auto session = Session::open();
  if (!session.has_value()) {
    return report_error(session.error());
  }
  return exit_code(fetters::app::list_jobs(session.value()->context(), parsed.config.filter,
                                           parsed.config.json));
}

int cmd_update(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  auto filter = parse_query_args(argc, argv, 2, "fetters update [options]");
  if (!filter.has_value()) {
    return 1;
  }

  auto session = Session::open();
  if (!session.has_value()) {
    return report_error(session.error());
  }
  return exit_code(fetters::app::update_job(session.value()->context(), filter.value()));
}

int cmd_delete(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  auto filter = parse_query_args(argc, argv, 2, "fetters delete [options]");
  if (!filter.has_value()) {
    return 1;
  }

  auto session = Session::open();
  if (!session.has_value()) {
    return report_error(session.error());
  }
  return exit_code(fetters::app::delete_job(session.value()->context(), filter.value()));
}

int cmd_open(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  auto filter = parse_query_args(argc, argv, 2, "fetters open [options]");
  if (!filter.has_value()) {
    return 1;
  }

  auto session = Session::open();
  if (!session.has_value()) {
    return report_error(session.error());
  }
  return exit_code(fetters::app::open_job(session.value()->context(), filter.value(), open_link));
}
