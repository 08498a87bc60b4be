#include "commands/banner.h"
#include "commands/config.h"
#include "commands/job.h"
#include "commands/report.h"
#include "commands/sprint.h"
#include "commands/stage.h"

#include <iostream>
#include <string>

namespace {

constexpr const char* kVersion = "fetters 0.1.0";

constexpr const char* kUsage =
    "Track job applications in sprints.\n"
    "\n"
    "Usage: fetters <command> [options]\n"
    "\n"
    "Commands:\n"
    "  add <company>                      Track a new job application\n"
    "  banner                             Display the ASCII art\n"
    "  config show|edit                   Show or edit the config file\n"
    "  delete [query]                     Delete a tracked job application\n"
    "  export [-d dir] [-f file] [-s sprint]\n"
    "                                     Export a sprint's job applications to XLSX\n"
    "  insights [--json]                  Show job application insights\n"
    "  list [query] [--json]              List job applications\n"
    "  open [query]                       Open the link of a job application\n"
    "  sprint current|new|show-all|set    Manage job sprints\n"
    "  stage add|delete|tree|update [query]\n"
    "                                     Manage interview stages of an application\n"
    "  update [query]                     Update a tracked job application\n"
    "  help                               Print this message\n"
    "\n"
    "Query options:\n"
    "  -c, --company <text>   -l, --link <text>    -n, --notes <text>\n"
    "      --sprint <text>    -s, --status <text>  -t, --title <text>\n"
    "      --stages [N]       jobs with any stages, or exactly N stages\n";

// Usage: fetters <command> [options]
int dispatch(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::string command = argv[1];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

  if (command == "help" || command == "--help" || command == "-h") {
    std::cout << kUsage;
    return 0;
  }
  if (command == "--version" || command == "-V") {
    std::cout << kVersion << "\n";
    return 0;
  }
  if (command == "add") {
    return cmd_add(argc, argv);
  }
  if (command == "banner") {
    return cmd_banner(argc, argv);
  }
  if (command == "config") {
    return cmd_config(argc, argv);
  }
  if (command == "delete") {
    return cmd_delete(argc, argv);
  }
  if (command == "export") {
    return cmd_export(argc, argv);
  }
  if (command == "insights") {
    return cmd_insights(argc, argv);
  }
  if (command == "list") {
    return cmd_list(argc, argv);
  }
  if (command == "open") {
    return cmd_open(argc, argv);
  }
  if (command == "sprint") {
    return cmd_sprint(argc, argv);
  }
  if (command == "stage") {
    return cmd_stage(argc, argv);
  }
  if (command == "update") {
    return cmd_update(argc, argv);
  }

  std::cerr << "Unknown command: " << command << "\n\n" << kUsage;
  return 1;
}

}  // namespace

int main(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  if (argc < 2) {
    std::cerr << kUsage;
    return 1;
  }
  return dispatch(argc, argv);
}
