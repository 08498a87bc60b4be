#include "fetters/app/sprint_commands.h"

#include "fetters/app/current_sprint.h"
#include "fetters/cli/views.h"
#include "fetters/core/normalization.h"

#include <nlohmann/json.hpp>

#include <vector>

namespace fetters::app {

namespace {

using BoolResult = core::FettersResult<bool>;

core::FettersResult<bool> save_current_sprint_name(CommandContext& ctx, const std::string& name) {
  auto loaded = ctx.services.config.load();
  if (!loaded.has_value()) {
    return BoolResult::err(loaded.error());
  }
  config::FettersConfig updated = loaded.value();
  updated.current_sprint_name = name;
  return ctx.services.config.save(updated);
}

}  // namespace

core::FettersResult<bool> show_current_sprint(CommandContext& ctx) {
  auto current = require_current_sprint(ctx.services.config, ctx.services.sprints);
  if (!current.has_value()) {
    return BoolResult::err(current.error());
  }

  ctx.console.out << "Current sprint: "
                  << cli::paint(ctx.console, current.value().name, cli::Color::kCyan, true) << "\n";
  return BoolResult::ok(true);
}

core::FettersResult<domain::Sprint> new_sprint(CommandContext& ctx,
                                               const std::optional<std::string>& name) {
  using ResultType = core::FettersResult<domain::Sprint>;

  const std::string today = ctx.services.clock.today();
  const std::string sprint_name = name.has_value() ? core::trim(name.value()) : today;
  if (sprint_name.empty()) {
    return ResultType::err(
        core::make_error(core::ErrorKind::kUnknown, "Sprint name must not be empty."));
  }

  // The previous sprint is looked up directly so a configured but missing
  // sprint is not created only to be closed.
  auto loaded = ctx.services.config.load();
  if (!loaded.has_value()) {
    return ResultType::err(loaded.error());
  }
  const std::string previous_name = core::trim(loaded.value().current_sprint_name);
  std::optional<domain::Sprint> previous;
  if (!previous_name.empty()) {
    auto found = ctx.services.sprints.get_by_name(previous_name);
    if (!found.has_value()) {
      return ResultType::err(found.error());
    }
    previous = found.value();
  }

  std::optional<std::int64_t> previous_id;
  if (previous.has_value()) {
    previous_id = previous->id;
  }
  auto created = ctx.services.sprints.start_next(
      domain::NewSprint{sprint_name, today, std::nullopt, 0}, previous_id);
  if (!created.has_value()) {
    return created;
  }

  auto saved = save_current_sprint_name(ctx, sprint_name);
  if (!saved.has_value()) {
    return ResultType::err(saved.error());
  }

  cli::print_success(ctx.console, "Created new sprint " + sprint_name + " and set it as current!");
  return created;
}

core::FettersResult<bool> show_all_sprints(CommandContext& ctx, bool json) {
  auto sprints = ctx.services.sprints.list_all();
  if (!sprints.has_value()) {
    return BoolResult::err(sprints.error());
  }
  auto loaded = ctx.services.config.load();
  if (!loaded.has_value()) {
    return BoolResult::err(loaded.error());
  }
  const std::string current_name = core::trim(loaded.value().current_sprint_name);

  if (json) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& sprint : sprints.value()) {
      nlohmann::json entry = domain::sprint_to_json(sprint);
      entry["current"] = sprint.name == current_name;
      out.push_back(std::move(entry));
    }
    ctx.console.out << out.dump(2) << "\n";
    return BoolResult::ok(true);
  }

  if (sprints.value().empty()) {
    cli::print_notice(ctx.console, "No sprints tracked yet. Run `fetters sprint new` to start one.");
    return BoolResult::ok(true);
  }
  cli::render_sprints(ctx.console, sprints.value(), current_name);
  return BoolResult::ok(true);
}

core::FettersResult<bool> set_current_sprint(CommandContext& ctx) {
  auto sprints = ctx.services.sprints.list_all();
  if (!sprints.has_value()) {
    return BoolResult::err(sprints.error());
  }
  if (sprints.value().empty()) {
    cli::print_notice(ctx.console, "No sprints tracked yet. Run `fetters sprint new` to start one.");
    return BoolResult::ok(false);
  }

  std::vector<std::string> options;
  for (const auto& sprint : sprints.value()) {
    options.push_back(cli::sprint_choice_label(sprint));
  }
  auto choice = ctx.prompter.select("Select the current sprint:", options);
  if (!choice.has_value()) {
    return BoolResult::err(choice.error());
  }
  if (!choice.value().has_value()) {
    return BoolResult::ok(false);
  }

  const domain::Sprint& selected = sprints.value()[choice.value().value()];
  auto saved = save_current_sprint_name(ctx, selected.name);
  if (!saved.has_value()) {
    return saved;
  }

  cli::print_success(ctx.console, "Set current sprint to " + selected.name + "!");
  return BoolResult::ok(true);
}

}  // namespace fetters::app
