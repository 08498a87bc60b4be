#include "fetters/app/report_commands.h"

#include "fetters/app/current_sprint.h"
#include "fetters/cli/views.h"
#include "fetters/exporting/projection.h"
#include "fetters/exporting/xlsx_writer.h"

#include <nlohmann/json.hpp>

#include <system_error>

namespace fetters::app {

core::FettersResult<std::filesystem::path> export_jobs(CommandContext& ctx,
                                                       const ExportOptions& options) {
  using ResultType = core::FettersResult<std::filesystem::path>;

  auto current = require_current_sprint(ctx.services.config, ctx.services.sprints);
  if (!current.has_value()) {
    return ResultType::err(current.error());
  }

  // An explicit sprint is matched by name like the list filter; the default
  // is exactly the current sprint.
  domain::JobFilter filter;
  filter.sprint = options.sprint;
  const std::string sprint_label = options.sprint.value_or(current.value().name);

  auto jobs = ctx.services.jobs.list(filter, current.value());
  if (!jobs.has_value()) {
    return ResultType::err(jobs.error());
  }
  if (jobs.value().empty()) {
    return ResultType::err(core::make_error(core::ErrorKind::kNoJobsAvailable, sprint_label));
  }

  std::filesystem::path directory;
  if (options.directory.has_value()) {
    directory = options.directory.value();
  } else {
    std::error_code ec;
    directory = std::filesystem::current_path(ec);
    if (ec) {
      return ResultType::err(core::make_error(core::ErrorKind::kIo, ec.message()));
    }
  }

  const std::filesystem::path path =
      directory / exporting::export_filename(options.filename, ctx.services.clock.today(),
                                             sprint_label);

  auto written =
      exporting::write_xlsx(path, exporting::build_export_sheet(sprint_label, jobs.value()));
  if (!written.has_value()) {
    return ResultType::err(written.error());
  }

  cli::print_success(ctx.console, "Successfully exported all jobs for sprint " + sprint_label +
                                      " to path: " + path.string() + "!");
  return ResultType::ok(path);
}

core::FettersResult<bool> show_insights(CommandContext& ctx, bool json) {
  using ResultType = core::FettersResult<bool>;

  auto current = require_current_sprint(ctx.services.config, ctx.services.sprints);
  if (!current.has_value()) {
    return ResultType::err(current.error());
  }

  auto per_status = ctx.services.jobs.count_per_status(current.value());
  if (!per_status.has_value()) {
    return ResultType::err(per_status.error());
  }
  auto per_sprint = ctx.services.jobs.count_per_sprint(current.value());
  if (!per_sprint.has_value()) {
    return ResultType::err(per_sprint.error());
  }

  if (json) {
    nlohmann::json out;
    out["sprint"] = current.value().name;
    out["per_status"] = nlohmann::json::array();
    for (const auto& row : per_status.value()) {
      out["per_status"].push_back(domain::insight_to_json(row));
    }
    out["per_sprint"] = nlohmann::json::array();
    for (const auto& row : per_sprint.value()) {
      out["per_sprint"].push_back(domain::insight_to_json(row));
    }
    ctx.console.out << out.dump(2) << "\n";
    return ResultType::ok(true);
  }

  if (per_status.value().empty() && per_sprint.value().empty()) {
    cli::print_notice(ctx.console, "No insights yet: sprint " + current.value().name +
                                       " has no job applications.");
    return ResultType::ok(true);
  }

  cli::render_insights(ctx.console, "Jobs per status (Sprint: " + current.value().name + ")",
                       "Status", per_status.value());
  ctx.console.out << "\n";
  cli::render_insights(ctx.console, "Jobs per sprint", "Sprint", per_sprint.value());
  return ResultType::ok(true);
}

}  // namespace fetters::app
