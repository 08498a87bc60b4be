#pragma once

#include "fetters/app/command_context.h"
#include "fetters/domain/job.h"
#include "fetters/domain/sprint.h"

#include <functional>
#include <optional>
#include <string>

namespace fetters::app {

// Opens a link with the platform's default handler.
using LinkOpener = std::function<core::FettersResult<bool>(const std::string& link)>;

// Prompts for title, status, link and notes, previews the new row, and on
// confirmation records the application in the current sprint.
[[nodiscard]] core::FettersResult<bool> add_job(CommandContext& ctx, const std::string& company);

// Prints the matching jobs as a table, or as a JSON array when json is set.
[[nodiscard]] core::FettersResult<bool> list_jobs(CommandContext& ctx,
                                                  const domain::JobFilter& filter, bool json);

// Lists the matching jobs and asks the user to pick one.
// kNoJobsAvailable when nothing matches; nullopt when the prompt is skipped.
[[nodiscard]] core::FettersResult<std::optional<domain::ListedJob>> select_job(
    CommandContext& ctx, const domain::JobFilter& filter, const domain::Sprint& current_sprint);

// Select a job, choose fields to change, prompt each, confirm, write.
[[nodiscard]] core::FettersResult<bool> update_job(CommandContext& ctx,
                                                   const domain::JobFilter& filter);

[[nodiscard]] core::FettersResult<bool> delete_job(CommandContext& ctx,
                                                   const domain::JobFilter& filter);

// Select a job and hand its link to opener. A job without a link is reported, not an error.
[[nodiscard]] core::FettersResult<bool> open_job(CommandContext& ctx,
                                                 const domain::JobFilter& filter,
                                                 const LinkOpener& opener);

}  // namespace fetters::app
