#pragma once

#include "fetters/app/command_context.h"

#include <optional>
#include <string>

namespace fetters::app {

// Print the name of the current sprint.
[[nodiscard]] core::FettersResult<bool> show_current_sprint(CommandContext& ctx);

// Create a sprint starting today (name defaults to today's YYYY-MM-DD) and make
// it current. The previous current sprint gets end_date = today unless it
// already has one. kSprintNameConflict when the name is taken.
[[nodiscard]] core::FettersResult<domain::Sprint> new_sprint(CommandContext& ctx,
                                                             const std::optional<std::string>& name);

// Print every sprint, marking the current one.
[[nodiscard]] core::FettersResult<bool> show_all_sprints(CommandContext& ctx, bool json);

// Choose one of the existing sprints and store it as the current sprint.
[[nodiscard]] core::FettersResult<bool> set_current_sprint(CommandContext& ctx);

}  // namespace fetters::app
