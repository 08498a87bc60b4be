#pragma once

#include "fetters/app/command_context.h"

#include <filesystem>
#include <optional>
#include <string>

namespace fetters::app {

struct ExportOptions {
  std::optional<std::string> directory;  // defaults to the working directory
  std::optional<std::string> filename;   // ".xlsx" appended when missing
  std::optional<std::string> sprint;     // defaults to the current sprint
};

// Write every job of the sprint to an XLSX workbook and return its path.
// kNoJobsAvailable when the sprint has no jobs.
[[nodiscard]] core::FettersResult<std::filesystem::path> export_jobs(CommandContext& ctx,
                                                                     const ExportOptions& options);

// Jobs per status in the current sprint and jobs per sprint, with percentages
// of the current sprint's total and of all jobs.
[[nodiscard]] core::FettersResult<bool> show_insights(CommandContext& ctx, bool json);

}  // namespace fetters::app
