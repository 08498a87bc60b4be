#include "fetters/app/current_sprint.h"

#include "fetters/core/normalization.h"

namespace fetters::app {

core::FettersResult<std::optional<domain::Sprint>> resolve_current_sprint(
    const config::IConfigStore& config, storage::ISprintRepository& sprints) {
  using ResultType = core::FettersResult<std::optional<domain::Sprint>>;

  auto loaded = config.load();
  if (!loaded.has_value()) {
    return ResultType::err(loaded.error());
  }

  const std::string name = core::trim(loaded.value().current_sprint_name);
  if (name.empty()) {
    return ResultType::ok(std::nullopt);
  }

  auto sprint = sprints.get_or_create_by_name(name);
  if (!sprint.has_value()) {
    return ResultType::err(sprint.error());
  }
  return ResultType::ok(sprint.value());
}

core::FettersResult<domain::Sprint> require_current_sprint(const config::IConfigStore& config,
                                                           storage::ISprintRepository& sprints) {
  using ResultType = core::FettersResult<domain::Sprint>;

  auto resolved = resolve_current_sprint(config, sprints);
  if (!resolved.has_value()) {
    return ResultType::err(resolved.error());
  }
  if (!resolved.value().has_value()) {
    return ResultType::err(core::make_error(core::ErrorKind::kUnknown, kNoCurrentSprintMessage));
  }
  return ResultType::ok(resolved.value().value());
}

}  // namespace fetters::app
