#pragma once

#include "fetters/app/command_context.h"
#include "fetters/domain/job.h"

namespace fetters::app {

// Every stage flow starts by selecting a job from the filtered listing and
// previews the resulting stage tree before asking for confirmation.

// Append a stage numbered max + 1.
[[nodiscard]] core::FettersResult<bool> add_stage(CommandContext& ctx,
                                                  const domain::JobFilter& filter);

// Edit any of name, status, date and notes of one stage.
[[nodiscard]] core::FettersResult<bool> update_stage(CommandContext& ctx,
                                                     const domain::JobFilter& filter);

// Delete one stage and close the gap in the numbering.
[[nodiscard]] core::FettersResult<bool> delete_stage(CommandContext& ctx,
                                                     const domain::JobFilter& filter);

// Print the stage tree of one job. Without a stages filter only jobs that
// have stages are offered.
[[nodiscard]] core::FettersResult<bool> show_stage_tree(CommandContext& ctx,
                                                        domain::JobFilter filter);

}  // namespace fetters::app
