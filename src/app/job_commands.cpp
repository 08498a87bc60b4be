#include "fetters/app/job_commands.h"

#include "fetters/app/current_sprint.h"
#include "fetters/cli/table.h"
#include "fetters/cli/views.h"
#include "fetters/core/normalization.h"

#include <nlohmann/json.hpp>

#include <array>
#include <string>
#include <utility>
#include <vector>

namespace fetters::app {

namespace {

using BoolResult = core::FettersResult<bool>;

constexpr const char* kNewTitleOption = "<Enter a new title>";
constexpr const char* kClearAnswer = "-";

enum class JobField {
  kCompany,
  kTitle,
  kStatus,
  kLink,
  kNotes,
  kSprint,
};

constexpr std::array<std::pair<JobField, const char*>, 6> kJobFields = {{
    {JobField::kCompany, "Company"},
    {JobField::kTitle, "Title"},
    {JobField::kStatus, "Status"},
    {JobField::kLink, "Link"},
    {JobField::kNotes, "Notes"},
    {JobField::kSprint, "Sprint"},
}};

// Empty answers to optional prompts mean "no value".
std::optional<std::string> optional_answer(const std::string& answer) {
  std::string trimmed = core::trim(answer);
  if (trimmed.empty()) {
    return std::nullopt;
  }
  return trimmed;
}

// Pick an existing title or type a new one. New titles are interned.
core::FettersResult<std::optional<domain::Title>> prompt_title(CommandContext& ctx,
                                                               const std::string& initial) {
  using ResultType = core::FettersResult<std::optional<domain::Title>>;

  auto titles = ctx.services.titles.list();
  if (!titles.has_value()) {
    return ResultType::err(titles.error());
  }

  if (!titles.value().empty()) {
    std::vector<std::string> options;
    for (const auto& title : titles.value()) {
      options.push_back(title.name);
    }
    options.emplace_back(kNewTitleOption);

    auto choice = ctx.prompter.select("Select a job title:", options);
    if (!choice.has_value()) {
      return ResultType::err(choice.error());
    }
    if (!choice.value().has_value()) {
      return ResultType::ok(std::nullopt);
    }
    if (choice.value().value() < titles.value().size()) {
      return ResultType::ok(titles.value()[choice.value().value()]);
    }
  }

  auto typed = ctx.prompter.text("Enter the job title:", initial);
  if (!typed.has_value()) {
    return ResultType::err(typed.error());
  }
  if (!typed.value().has_value()) {
    return ResultType::ok(std::nullopt);
  }
  const std::string name = core::trim(typed.value().value());
  if (name.empty()) {
    return ResultType::ok(std::nullopt);
  }

  auto title = ctx.services.titles.get_or_create(name);
  if (!title.has_value()) {
    return ResultType::err(title.error());
  }
  return ResultType::ok(title.value());
}

core::FettersResult<std::optional<domain::Status>> prompt_status(CommandContext& ctx,
                                                                 const char* message) {
  using ResultType = core::FettersResult<std::optional<domain::Status>>;

  auto statuses = ctx.services.statuses.list();
  if (!statuses.has_value()) {
    return ResultType::err(statuses.error());
  }

  std::vector<std::string> options;
  for (const auto& status : statuses.value()) {
    options.push_back(status.name);
  }

  auto choice = ctx.prompter.select(message, options);
  if (!choice.has_value()) {
    return ResultType::err(choice.error());
  }
  if (!choice.value().has_value()) {
    return ResultType::ok(std::nullopt);
  }
  return ResultType::ok(statuses.value()[choice.value().value()]);
}

void render_field_preview(CommandContext& ctx, const std::string& title,
                          const std::vector<std::vector<std::string>>& rows,
                          std::vector<std::string> headers) {
  cli::Table table;
  table.title = title;
  table.headers = std::move(headers);
  table.rows = rows;
  ctx.console.out << "\n";
  cli::render_table(ctx.console, table);
}

std::string display_or_na(const std::optional<std::string>& value) {
  return value.value_or("N/A");
}

}  // namespace

core::FettersResult<bool> add_job(CommandContext& ctx, const std::string& company) {
  const std::string company_name = core::trim(company);
  if (company_name.empty()) {
    return BoolResult::err(
        core::make_error(core::ErrorKind::kUnknown, "Company name must not be empty."));
  }

  auto current = require_current_sprint(ctx.services.config, ctx.services.sprints);
  if (!current.has_value()) {
    return BoolResult::err(current.error());
  }

  auto title = prompt_title(ctx, "");
  if (!title.has_value()) {
    return BoolResult::err(title.error());
  }
  if (!title.value().has_value()) {
    return BoolResult::ok(false);
  }

  auto status = prompt_status(ctx, "Select the application status:");
  if (!status.has_value()) {
    return BoolResult::err(status.error());
  }
  if (!status.value().has_value()) {
    return BoolResult::ok(false);
  }

  auto link = ctx.prompter.text("[OPTIONAL] Enter a link to the job application:");
  if (!link.has_value()) {
    return BoolResult::err(link.error());
  }
  if (!link.value().has_value()) {
    return BoolResult::ok(false);
  }

  auto notes = ctx.prompter.text("[OPTIONAL] Enter any notes for this job application:");
  if (!notes.has_value()) {
    return BoolResult::err(notes.error());
  }
  if (!notes.value().has_value()) {
    return BoolResult::ok(false);
  }

  domain::NewJob job;
  job.company_name = company_name;
  job.created = ctx.services.clock.now_timestamp();
  job.title_id = title.value()->id;
  job.status_id = status.value()->id;
  job.link = optional_answer(link.value().value());
  job.notes = optional_answer(notes.value().value());
  job.sprint_id = current.value().id;

  render_field_preview(ctx, "New job application (Sprint: " + current.value().name + ")",
                       {
                           {"Created", job.created},
                           {"Company", job.company_name},
                           {"Title", title.value()->name},
                           {"Status", status.value()->name},
                           {"Link", display_or_na(job.link)},
                           {"Notes", display_or_na(job.notes)},
                       },
                       {"Field", "Value"});

  auto confirmed = ctx.prompter.confirm("Confirm new job application?", true);
  if (!confirmed.has_value()) {
    return BoolResult::err(confirmed.error());
  }
  if (!confirmed.value().has_value()) {
    return BoolResult::ok(false);
  }
  if (!confirmed.value().value()) {
    cli::print_cancelled(ctx.console);
    return BoolResult::ok(false);
  }

  auto added = ctx.services.jobs.add(job);
  if (!added.has_value()) {
    return BoolResult::err(added.error());
  }

  cli::print_success(ctx.console, "Added a new job application for " + company_name + "!");
  return BoolResult::ok(true);
}

core::FettersResult<bool> list_jobs(CommandContext& ctx, const domain::JobFilter& filter,
                                    bool json) {
  auto current = require_current_sprint(ctx.services.config, ctx.services.sprints);
  if (!current.has_value()) {
    return BoolResult::err(current.error());
  }

  auto jobs = ctx.services.jobs.list(filter, current.value());
  if (!jobs.has_value()) {
    return BoolResult::err(jobs.error());
  }

  if (json) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& job : jobs.value()) {
      out.push_back(domain::listed_job_to_json(job));
    }
    ctx.console.out << out.dump(2) << "\n";
    return BoolResult::ok(true);
  }

  cli::render_jobs(ctx.console, filter.sprint.value_or(current.value().name), jobs.value());
  return BoolResult::ok(true);
}

core::FettersResult<std::optional<domain::ListedJob>> select_job(
    CommandContext& ctx, const domain::JobFilter& filter, const domain::Sprint& current_sprint) {
  using ResultType = core::FettersResult<std::optional<domain::ListedJob>>;

  auto jobs = ctx.services.jobs.list(filter, current_sprint);
  if (!jobs.has_value()) {
    return ResultType::err(jobs.error());
  }

  const std::string sprint_label = filter.sprint.value_or(current_sprint.name);
  if (jobs.value().empty()) {
    return ResultType::err(core::make_error(core::ErrorKind::kNoJobsAvailable, sprint_label));
  }

  cli::render_jobs(ctx.console, sprint_label, jobs.value());

  std::vector<std::string> options;
  for (const auto& job : jobs.value()) {
    options.push_back(cli::job_choice_label(job));
  }
  auto choice = ctx.prompter.select("Select a job application:", options);
  if (!choice.has_value()) {
    return ResultType::err(choice.error());
  }
  if (!choice.value().has_value()) {
    return ResultType::ok(std::nullopt);
  }
  return ResultType::ok(jobs.value()[choice.value().value()]);
}

core::FettersResult<bool> update_job(CommandContext& ctx, const domain::JobFilter& filter) {
  auto current = require_current_sprint(ctx.services.config, ctx.services.sprints);
  if (!current.has_value()) {
    return BoolResult::err(current.error());
  }

  auto selected = select_job(ctx, filter, current.value());
  if (!selected.has_value()) {
    return BoolResult::err(selected.error());
  }
  if (!selected.value().has_value()) {
    return BoolResult::ok(false);
  }
  const domain::ListedJob& listed = selected.value().value();

  auto stored = ctx.services.jobs.get(listed.id);
  if (!stored.has_value()) {
    return BoolResult::err(stored.error());
  }
  auto stored_sprint = ctx.services.sprints.get(stored.value().sprint_id);
  if (!stored_sprint.has_value()) {
    return BoolResult::err(stored_sprint.error());
  }

  std::vector<std::string> field_names;
  for (const auto& [field, name] : kJobFields) {
    field_names.emplace_back(name);
  }
  auto chosen = ctx.prompter.multi_select("Select the fields to update:", field_names);
  if (!chosen.has_value()) {
    return BoolResult::err(chosen.error());
  }
  if (!chosen.value().has_value()) {
    return BoolResult::ok(false);
  }

  domain::JobUpdate update;
  std::vector<std::vector<std::string>> preview;

  for (const std::size_t index : chosen.value().value()) {
    const JobField field = kJobFields[index].first;
    const std::string label = kJobFields[index].second;

    switch (field) {
      case JobField::kCompany: {
        auto answer = ctx.prompter.text("Enter the new company name:", listed.company_name);
        if (!answer.has_value()) {
          return BoolResult::err(answer.error());
        }
        if (!answer.value().has_value()) {
          return BoolResult::ok(false);
        }
        const std::string name = core::trim(answer.value().value());
        if (!name.empty() && name != listed.company_name) {
          update.company_name = name;
          preview.push_back({label, listed.company_name, name});
        }
        break;
      }
      case JobField::kTitle: {
        auto title = prompt_title(ctx, listed.title.value_or(""));
        if (!title.has_value()) {
          return BoolResult::err(title.error());
        }
        if (!title.value().has_value()) {
          return BoolResult::ok(false);
        }
        if (title.value()->id != stored.value().title_id) {
          update.title_id = title.value()->id;
          preview.push_back({label, display_or_na(listed.title), title.value()->name});
        }
        break;
      }
      case JobField::kStatus: {
        auto status = prompt_status(ctx, "Select a new status:");
        if (!status.has_value()) {
          return BoolResult::err(status.error());
        }
        if (!status.value().has_value()) {
          return BoolResult::ok(false);
        }
        if (status.value()->id != stored.value().status_id) {
          update.status_id = status.value()->id;
          preview.push_back({label, display_or_na(listed.status), status.value()->name});
        }
        break;
      }
      case JobField::kLink:
      case JobField::kNotes: {
        const bool is_link = field == JobField::kLink;
        const std::optional<std::string>& existing = is_link ? listed.link : listed.notes;
        const char* message = is_link ? "Enter a new link ('-' to clear):"
                                      : "Enter new notes ('-' to clear):";
        auto answer = ctx.prompter.text(message, existing.value_or(""));
        if (!answer.has_value()) {
          return BoolResult::err(answer.error());
        }
        if (!answer.value().has_value()) {
          return BoolResult::ok(false);
        }
        const std::optional<std::string> value = answer.value().value() == kClearAnswer
                                                     ? std::nullopt
                                                     : optional_answer(answer.value().value());
        if (value != existing) {
          if (is_link) {
            update.link = value;
          } else {
            update.notes = value;
          }
          preview.push_back({label, display_or_na(existing), display_or_na(value)});
        }
        break;
      }
      case JobField::kSprint: {
        auto sprints = ctx.services.sprints.list_all();
        if (!sprints.has_value()) {
          return BoolResult::err(sprints.error());
        }
        std::vector<std::string> options;
        for (const auto& sprint : sprints.value()) {
          options.push_back(cli::sprint_choice_label(sprint));
        }
        auto choice = ctx.prompter.select("Select the sprint for this job application:", options);
        if (!choice.has_value()) {
          return BoolResult::err(choice.error());
        }
        if (!choice.value().has_value()) {
          return BoolResult::ok(false);
        }
        const domain::Sprint& target = sprints.value()[choice.value().value()];
        if (target.id != stored.value().sprint_id) {
          update.sprint_id = target.id;
          preview.push_back({label, stored_sprint.value().name, target.name});
        }
        break;
      }
    }
  }

  if (update.empty()) {
    cli::print_notice(ctx.console, "No changes to apply for " + listed.company_name + ".");
    return BoolResult::ok(false);
  }

  render_field_preview(ctx, "Updates for " + listed.company_name, preview,
                       {"Field", "Current", "New"});

  auto confirmed = ctx.prompter.confirm("Confirm updates?", true);
  if (!confirmed.has_value()) {
    return BoolResult::err(confirmed.error());
  }
  if (!confirmed.value().has_value()) {
    return BoolResult::ok(false);
  }
  if (!confirmed.value().value()) {
    cli::print_cancelled(ctx.console);
    return BoolResult::ok(false);
  }

  auto updated = ctx.services.jobs.update(listed.id, update);
  if (!updated.has_value()) {
    return BoolResult::err(updated.error());
  }

  cli::print_success(ctx.console,
                     "Updated job application for " + updated.value().company_name + "!");
  return BoolResult::ok(true);
}

core::FettersResult<bool> delete_job(CommandContext& ctx, const domain::JobFilter& filter) {
  auto current = require_current_sprint(ctx.services.config, ctx.services.sprints);
  if (!current.has_value()) {
    return BoolResult::err(current.error());
  }

  auto selected = select_job(ctx, filter, current.value());
  if (!selected.has_value()) {
    return BoolResult::err(selected.error());
  }
  if (!selected.value().has_value()) {
    return BoolResult::ok(false);
  }
  const domain::ListedJob& job = selected.value().value();

  std::string message = "Delete the job application for " + job.company_name;
  if (job.stages_count.has_value()) {
    message += " and its " + std::to_string(job.stages_count.value()) + " interview stage(s)";
  }
  message += "?";

  auto confirmed = ctx.prompter.confirm(message, false);
  if (!confirmed.has_value()) {
    return BoolResult::err(confirmed.error());
  }
  if (!confirmed.value().has_value()) {
    return BoolResult::ok(false);
  }
  if (!confirmed.value().value()) {
    cli::print_cancelled(ctx.console);
    return BoolResult::ok(false);
  }

  auto removed = ctx.services.jobs.remove(job.id);
  if (!removed.has_value()) {
    return BoolResult::err(removed.error());
  }

  cli::print_success(ctx.console, "Deleted job application for " + job.company_name + "!");
  return BoolResult::ok(true);
}

core::FettersResult<bool> open_job(CommandContext& ctx, const domain::JobFilter& filter,
                                   const LinkOpener& opener) {
  auto current = require_current_sprint(ctx.services.config, ctx.services.sprints);
  if (!current.has_value()) {
    return BoolResult::err(current.error());
  }

  auto selected = select_job(ctx, filter, current.value());
  if (!selected.has_value()) {
    return BoolResult::err(selected.error());
  }
  if (!selected.value().has_value()) {
    return BoolResult::ok(false);
  }
  const domain::ListedJob& job = selected.value().value();

  if (!job.link.has_value() || job.link->empty()) {
    cli::print_notice(ctx.console, "No link tracked for " + job.company_name + ".");
    return BoolResult::ok(false);
  }

  auto opened = opener(job.link.value());
  if (!opened.has_value()) {
    return opened;
  }
  ctx.console.out << "Opened " << job.link.value() << "\n";
  return BoolResult::ok(true);
}

}  // namespace fetters::app
