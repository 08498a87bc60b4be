#include "fetters/app/stage_commands.h"

#include "fetters/app/current_sprint.h"
#include "fetters/app/job_commands.h"
#include "fetters/cli/views.h"
#include "fetters/core/dates.h"
#include "fetters/core/normalization.h"

#include <array>
#include <string>
#include <utility>
#include <vector>

namespace fetters::app {

namespace {

using BoolResult = core::FettersResult<bool>;

constexpr const char* kClearAnswer = "-";

enum class StageField {
  kName,
  kStatus,
  kDate,
  kNotes,
};

constexpr std::array<std::pair<StageField, const char*>, 4> kStageFields = {{
    {StageField::kName, "Name"},
    {StageField::kStatus, "Status"},
    {StageField::kDate, "Date"},
    {StageField::kNotes, "Notes"},
}};

// A job chosen for a stage flow together with its stages.
struct StageTarget {
  domain::ListedJob job;
  std::vector<domain::InterviewStage> stages;
};

core::FettersResult<std::optional<StageTarget>> select_stage_target(
    CommandContext& ctx, const domain::JobFilter& filter) {
  using ResultType = core::FettersResult<std::optional<StageTarget>>;

  auto current = require_current_sprint(ctx.services.config, ctx.services.sprints);
  if (!current.has_value()) {
    return ResultType::err(current.error());
  }

  auto selected = select_job(ctx, filter, current.value());
  if (!selected.has_value()) {
    return ResultType::err(selected.error());
  }
  if (!selected.value().has_value()) {
    return ResultType::ok(std::nullopt);
  }

  auto stages = ctx.services.stages.list(selected.value()->id);
  if (!stages.has_value()) {
    return ResultType::err(stages.error());
  }
  return ResultType::ok(StageTarget{selected.value().value(), std::move(stages.value())});
}

// Pick one stage of the target; nullopt when skipped or when the job has none.
core::FettersResult<std::optional<domain::InterviewStage>> select_stage(CommandContext& ctx,
                                                                        const StageTarget& target,
                                                                        const char* message) {
  using ResultType = core::FettersResult<std::optional<domain::InterviewStage>>;

  if (target.stages.empty()) {
    cli::print_notice(ctx.console,
                      "No interview stages tracked for " + target.job.company_name + ".");
    return ResultType::ok(std::nullopt);
  }

  std::vector<std::string> options;
  for (const auto& stage : target.stages) {
    options.push_back(cli::stage_choice_label(stage));
  }
  auto choice = ctx.prompter.select(message, options);
  if (!choice.has_value()) {
    return ResultType::err(choice.error());
  }
  if (!choice.value().has_value()) {
    return ResultType::ok(std::nullopt);
  }
  return ResultType::ok(target.stages[choice.value().value()]);
}

core::FettersResult<std::optional<domain::StageStatus>> prompt_stage_status(CommandContext& ctx,
                                                                            const char* message) {
  using ResultType = core::FettersResult<std::optional<domain::StageStatus>>;

  std::vector<std::string> options;
  for (const auto status : domain::kStageStatuses) {
    options.emplace_back(domain::to_string(status));
  }
  auto choice = ctx.prompter.select(message, options);
  if (!choice.has_value()) {
    return ResultType::err(choice.error());
  }
  if (!choice.value().has_value()) {
    return ResultType::ok(std::nullopt);
  }
  return ResultType::ok(domain::kStageStatuses[choice.value().value()]);
}

// Date prompt answered as a stage date (YYYY/MM/DD).
core::FettersResult<std::optional<std::string>> prompt_stage_date(
    CommandContext& ctx, domain::StageStatus status, const core::CalendarDate& starting_date) {
  using ResultType = core::FettersResult<std::optional<std::string>>;

  auto picked = ctx.prompter.date(std::string{domain::date_prompt(status)}, starting_date);
  if (!picked.has_value()) {
    return ResultType::err(picked.error());
  }
  if (!picked.value().has_value()) {
    return ResultType::ok(std::nullopt);
  }
  return ResultType::ok(core::format_date(picked.value().value(), core::kStageDateSeparator));
}

core::CalendarDate today_date(CommandContext& ctx) {
  return core::parse_date(ctx.services.clock.today(), core::kIsoDateSeparator)
      .value_or(core::CalendarDate{1970, 1, 1});
}

std::optional<std::string> optional_answer(const std::string& answer) {
  std::string trimmed = core::trim(answer);
  if (trimmed.empty()) {
    return std::nullopt;
  }
  return trimmed;
}

// An update answer: the clear token removes the value, anything else is kept trimmed.
std::optional<std::string> updated_answer(const std::string& answer) {
  if (answer == kClearAnswer) {
    return std::nullopt;
  }
  return optional_answer(answer);
}

core::FettersResult<std::optional<bool>> confirm(CommandContext& ctx, const char* message) {
  auto confirmed = ctx.prompter.confirm(message, true);
  if (confirmed.has_value() && confirmed.value().has_value() && !confirmed.value().value()) {
    cli::print_cancelled(ctx.console);
  }
  return confirmed;
}

}  // namespace

core::FettersResult<bool> add_stage(CommandContext& ctx, const domain::JobFilter& filter) {
  auto target = select_stage_target(ctx, filter);
  if (!target.has_value()) {
    return BoolResult::err(target.error());
  }
  if (!target.value().has_value()) {
    return BoolResult::ok(false);
  }
  StageTarget& chosen = target.value().value();

  auto next_number = ctx.services.stages.next_stage_number(chosen.job.id);
  if (!next_number.has_value()) {
    return BoolResult::err(next_number.error());
  }

  auto name = ctx.prompter.text("[OPTIONAL] Enter a name for this stage (e.g. Phone Screen):");
  if (!name.has_value()) {
    return BoolResult::err(name.error());
  }
  if (!name.value().has_value()) {
    return BoolResult::ok(false);
  }

  auto status = prompt_stage_status(ctx, "Select the status for this stage:");
  if (!status.has_value()) {
    return BoolResult::err(status.error());
  }
  if (!status.value().has_value()) {
    return BoolResult::ok(false);
  }

  auto scheduled_date = prompt_stage_date(ctx, status.value().value(), today_date(ctx));
  if (!scheduled_date.has_value()) {
    return BoolResult::err(scheduled_date.error());
  }
  if (!scheduled_date.value().has_value()) {
    return BoolResult::ok(false);
  }

  auto notes = ctx.prompter.text("[OPTIONAL] Enter any notes for this stage:");
  if (!notes.has_value()) {
    return BoolResult::err(notes.error());
  }
  if (!notes.value().has_value()) {
    return BoolResult::ok(false);
  }

  domain::NewInterviewStage stage;
  stage.job_id = chosen.job.id;
  stage.stage_number = next_number.value();
  stage.name = optional_answer(name.value().value());
  stage.status = status.value().value();
  stage.scheduled_date = scheduled_date.value().value();
  stage.notes = optional_answer(notes.value().value());
  stage.created = ctx.services.clock.now_timestamp();

  // Preview row; id 0 never belongs to a stored stage.
  domain::InterviewStage preview{0,
                                 stage.job_id,
                                 stage.stage_number,
                                 stage.name,
                                 stage.status,
                                 stage.scheduled_date,
                                 stage.notes,
                                 stage.created};
  std::vector<domain::InterviewStage> preview_stages = chosen.stages;
  preview_stages.push_back(preview);
  cli::render_stage_tree(ctx.console, chosen.job, preview_stages, preview.id,
                         cli::Highlight::kGreen);

  auto confirmed = confirm(ctx, "Confirm new stage?");
  if (!confirmed.has_value()) {
    return BoolResult::err(confirmed.error());
  }
  if (!confirmed.value().has_value() || !confirmed.value().value()) {
    return BoolResult::ok(false);
  }

  auto added = ctx.services.stages.add(stage);
  if (!added.has_value()) {
    return BoolResult::err(added.error());
  }

  cli::print_success(ctx.console, "Added stage " + std::to_string(stage.stage_number) + " for " +
                                      chosen.job.company_name + "!");
  return BoolResult::ok(true);
}

core::FettersResult<bool> update_stage(CommandContext& ctx, const domain::JobFilter& filter) {
  auto target = select_stage_target(ctx, filter);
  if (!target.has_value()) {
    return BoolResult::err(target.error());
  }
  if (!target.value().has_value()) {
    return BoolResult::ok(false);
  }
  const StageTarget& chosen = target.value().value();

  auto selected = select_stage(ctx, chosen, "Select the stage to update:");
  if (!selected.has_value()) {
    return BoolResult::err(selected.error());
  }
  if (!selected.value().has_value()) {
    return BoolResult::ok(false);
  }
  const domain::InterviewStage& stage = selected.value().value();

  std::vector<std::string> field_names;
  for (const auto& [field, name] : kStageFields) {
    field_names.emplace_back(name);
  }
  auto fields = ctx.prompter.multi_select("Select the fields to update:", field_names);
  if (!fields.has_value()) {
    return BoolResult::err(fields.error());
  }
  if (!fields.value().has_value()) {
    return BoolResult::ok(false);
  }

  domain::InterviewStageUpdate update;
  for (const std::size_t index : fields.value().value()) {
    switch (kStageFields[index].first) {
      case StageField::kName: {
        auto name = ctx.prompter.text("Enter a new name for this stage ('-' to clear):",
                                     stage.name.value_or(""));
        if (!name.has_value()) {
          return BoolResult::err(name.error());
        }
        if (name.value().has_value()) {
          update.name = updated_answer(name.value().value());
        }
        break;
      }
      case StageField::kStatus: {
        auto status = prompt_stage_status(ctx, "Select a new status:");
        if (!status.has_value()) {
          return BoolResult::err(status.error());
        }
        if (status.value().has_value()) {
          update.status = status.value().value();
        }
        break;
      }
      case StageField::kDate: {
        const auto starting_date = core::parse_date(stage.scheduled_date, core::kStageDateSeparator)
                                       .value_or(today_date(ctx));
        // The prompt follows the status the stage will have after this update.
        auto date = prompt_stage_date(ctx, update.status.value_or(stage.status), starting_date);
        if (!date.has_value()) {
          return BoolResult::err(date.error());
        }
        if (date.value().has_value()) {
          update.scheduled_date = date.value().value();
        }
        break;
      }
      case StageField::kNotes: {
        auto notes =
            ctx.prompter.text("Enter new notes for this stage ('-' to clear):",
                             stage.notes.value_or(""));
        if (!notes.has_value()) {
          return BoolResult::err(notes.error());
        }
        if (notes.value().has_value()) {
          update.notes = updated_answer(notes.value().value());
        }
        break;
      }
    }
  }

  if (update.empty()) {
    cli::print_notice(ctx.console, "No changes to apply for " + domain::stage_label(stage) + ".");
    return BoolResult::ok(false);
  }

  std::vector<domain::InterviewStage> preview_stages;
  for (const auto& existing : chosen.stages) {
    preview_stages.push_back(existing.id == stage.id ? domain::apply_update(existing, update)
                                                     : existing);
  }
  cli::render_stage_tree(ctx.console, chosen.job, preview_stages, stage.id,
                         cli::Highlight::kGreen);

  auto confirmed = confirm(ctx, "Confirm updates?");
  if (!confirmed.has_value()) {
    return BoolResult::err(confirmed.error());
  }
  if (!confirmed.value().has_value() || !confirmed.value().value()) {
    return BoolResult::ok(false);
  }

  auto updated = ctx.services.stages.update(stage.id, update);
  if (!updated.has_value()) {
    return BoolResult::err(updated.error());
  }

  cli::print_success(ctx.console, "Updated stage " + std::to_string(stage.stage_number) + " for " +
                                      chosen.job.company_name + "!");
  return BoolResult::ok(true);
}

core::FettersResult<bool> delete_stage(CommandContext& ctx, const domain::JobFilter& filter) {
  auto target = select_stage_target(ctx, filter);
  if (!target.has_value()) {
    return BoolResult::err(target.error());
  }
  if (!target.value().has_value()) {
    return BoolResult::ok(false);
  }
  const StageTarget& chosen = target.value().value();

  auto selected = select_stage(ctx, chosen, "Select the stage to delete:");
  if (!selected.has_value()) {
    return BoolResult::err(selected.error());
  }
  if (!selected.value().has_value()) {
    return BoolResult::ok(false);
  }
  const domain::InterviewStage& stage = selected.value().value();

  cli::render_stage_tree(ctx.console, chosen.job, chosen.stages, stage.id, cli::Highlight::kRed);

  auto confirmed = confirm(ctx, "Confirm deletion?");
  if (!confirmed.has_value()) {
    return BoolResult::err(confirmed.error());
  }
  if (!confirmed.value().has_value() || !confirmed.value().value()) {
    return BoolResult::ok(false);
  }

  auto removed = ctx.services.stages.remove(stage.id);
  if (!removed.has_value()) {
    return BoolResult::err(removed.error());
  }

  cli::print_success(ctx.console, "Deleted stage " + std::to_string(stage.stage_number) +
                                      " from " + chosen.job.company_name + "!");
  return BoolResult::ok(true);
}

core::FettersResult<bool> show_stage_tree(CommandContext& ctx, domain::JobFilter filter) {
  if (!filter.stages.has_value()) {
    filter.stages = 0;
  }

  auto target = select_stage_target(ctx, filter);
  if (!target.has_value()) {
    return BoolResult::err(target.error());
  }
  if (!target.value().has_value()) {
    return BoolResult::ok(false);
  }
  const StageTarget& chosen = target.value().value();

  if (chosen.stages.empty()) {
    cli::print_notice(ctx.console,
                      "No interview stages tracked for " + chosen.job.company_name + ".");
    return BoolResult::ok(true);
  }

  cli::render_stage_tree(ctx.console, chosen.job, chosen.stages);
  return BoolResult::ok(true);
}

}  // namespace fetters::app
