#pragma once

#include "fetters/config/config_store.h"
#include "fetters/core/error.h"
#include "fetters/domain/sprint.h"
#include "fetters/storage/repositories.h"

#include <optional>

namespace fetters::app {

// Message shown when a command needs a current sprint and none is configured.
inline constexpr const char* kNoCurrentSprintMessage =
    "No current sprint is set! Run `fetters sprint new` or `fetters sprint set` first.";

// Resolve the sprint named by current_sprint_name in the config.
// Returns nullopt when the name is empty. A configured name that has no row yet
// creates the sprint (start date today). No other code path creates sprints lazily.
[[nodiscard]] core::FettersResult<std::optional<domain::Sprint>> resolve_current_sprint(
    const config::IConfigStore& config, storage::ISprintRepository& sprints);

// resolve_current_sprint, with the "no current sprint" state turned into an error.
[[nodiscard]] core::FettersResult<domain::Sprint> require_current_sprint(
    const config::IConfigStore& config, storage::ISprintRepository& sprints);

}  // namespace fetters::app
