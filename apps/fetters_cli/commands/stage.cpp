#include "stage.h"

#include "fetters/app/stage_commands.h"

#include "query_args.h"
#include "session.h"
#include <iostream>
#include <string>

namespace {

constexpr const char* kStageUsage =
    "Usage: fetters stage <subcommand> [options]\n"
    "\n"
    "Subcommands:\n"
    "  add       Add a new interview stage to an application\n"
    "  delete    Delete an interview stage from an application\n"
    "  tree      Display the interview stages of an application\n"
    "  update    Update an interview stage of an application\n";

}  // namespace

int cmd_stage(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  if (argc < 3) {
    std::cerr << kStageUsage;
    return 1;
  }
  const std::string subcommand = argv[2];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  if (subcommand != "add" && subcommand != "delete" && subcommand != "tree" &&
      subcommand != "update") {
    std::cerr << "Unknown stage subcommand: " << subcommand << "\n" << kStageUsage;
    return 1;
  }

  const std::string usage = "fetters stage " + subcommand + " [options]";
  auto filter = parse_query_args(argc, argv, 3, usage.c_str());
  if (!filter.has_value()) {
    return 1;
  }

  auto session = Session::open();
  if (!session.has_value()) {
    return report_error(session.error());
  }
  auto& ctx = session.value()->context();

  if (subcommand == "add") {
    return exit_code(fetters::app::add_stage(ctx, filter.value()));
  }
  if (subcommand == "delete") {
    return exit_code(fetters::app::delete_stage(ctx, filter.value()));
  }
  if (subcommand == "update") {
    return exit_code(fetters::app::update_stage(ctx, filter.value()));
  }
  return exit_code(fetters::app::show_stage_tree(ctx, filter.value()));
}
