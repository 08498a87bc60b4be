#pragma once

#include "fetters/app/command_context.h"
#include "fetters/app/prompter.h"
#include "fetters/app/services.h"
#include "fetters/cli/console.h"
#include "fetters/config/config_store.h"
#include "fetters/core/clock.h"
#include "fetters/storage/sqlite/sqlite_db.h"
#include "fetters/storage/sqlite/sqlite_job_repository.h"
#include "fetters/storage/sqlite/sqlite_sprint_repository.h"
#include "fetters/storage/sqlite/sqlite_stage_repository.h"
#include "fetters/storage/sqlite/sqlite_status_repository.h"
#include "fetters/storage/sqlite/sqlite_title_repository.h"

#include <catch2/catch_test_macros.hpp>

#include <deque>
#include <memory>
#include <optional>
#include <sstream>
#include <string>

namespace fetters::testing {

inline std::shared_ptr<storage::sqlite::SqliteDb> open_migrated_db() {
  auto db = storage::sqlite::SqliteDb::open(":memory:");
  REQUIRE(db.has_value());
  REQUIRE(db.value()->run_migrations().has_value());
  return db.value();
}

// In-memory store with every repository wired up, a fixed clock and an
// in-memory config. Statuses are seeded.
struct StoreFixture {
  std::shared_ptr<storage::sqlite::SqliteDb> db = open_migrated_db();
  core::FixedClock clock{"2025-01-15 09:30:00"};
  config::InMemoryConfigStore config;
  storage::sqlite::SqliteStatusRepository statuses{db};
  storage::sqlite::SqliteTitleRepository titles{db};
  storage::sqlite::SqliteSprintRepository sprints{db, clock};
  storage::sqlite::SqliteJobRepository jobs{db, sprints};
  storage::sqlite::SqliteStageRepository stages{db};
  app::Services services{statuses, titles, sprints, jobs, stages, config, clock};

  StoreFixture() { REQUIRE(statuses.seed().has_value()); }

  domain::Sprint make_sprint(const std::string& name, const std::string& start = "2025-01-15") {
    auto sprint = sprints.add(domain::NewSprint{name, start, std::nullopt, 0});
    REQUIRE(sprint.has_value());
    return sprint.value();
  }

  // Creates the sprint and stores its name as the current sprint.
  domain::Sprint make_current_sprint(const std::string& name) {
    auto sprint = make_sprint(name);
    REQUIRE(config.save(config::FettersConfig{name}).has_value());
    return sprint;
  }

  std::int64_t status_id(const std::string& name) {
    auto status = statuses.get_by_name(name);
    REQUIRE(status.has_value());
    REQUIRE(status.value().has_value());
    return status.value()->id;
  }

  domain::Job make_job(const std::string& company, const domain::Sprint& sprint,
                       const std::string& title = "Software Engineer",
                       const std::string& status = "PENDING",
                       std::optional<std::string> link = std::nullopt,
                       std::optional<std::string> notes = std::nullopt) {
    auto interned = titles.get_or_create(title);
    REQUIRE(interned.has_value());
    domain::NewJob job{company,           clock.now_timestamp(), interned.value().id,
                       status_id(status), std::move(link),       std::move(notes),
                       sprint.id};
    auto added = jobs.add(job);
    REQUIRE(added.has_value());
    return added.value();
  }

  domain::InterviewStage make_stage(std::int64_t job_id, std::optional<std::string> name,
                                    domain::StageStatus status = domain::StageStatus::kScheduled,
                                    const std::string& date = "2025/01/20") {
    auto number = stages.next_stage_number(job_id);
    REQUIRE(number.has_value());
    domain::NewInterviewStage stage{job_id, number.value(), std::move(name), status,
                                    date,   std::nullopt,   clock.now_timestamp()};
    auto added = stages.add(stage);
    REQUIRE(added.has_value());
    return added.value();
  }

  std::int64_t num_jobs(std::int64_t sprint_id) {
    auto sprint = sprints.get(sprint_id);
    REQUIRE(sprint.has_value());
    return sprint.value().num_jobs;
  }
};

// StoreFixture plus a scripted prompter and a captured, uncolored console.
struct CommandFixture : StoreFixture {
  std::ostringstream out;
  cli::Console console{out, false};
  std::unique_ptr<app::ScriptedPrompter> prompter =
      std::make_unique<app::ScriptedPrompter>(std::deque<std::optional<std::string>>{});

  app::CommandContext context(std::deque<std::optional<std::string>> answers) {
    prompter = std::make_unique<app::ScriptedPrompter>(std::move(answers));
    return app::CommandContext{services, *prompter, console};
  }
};

}  // namespace fetters::testing
