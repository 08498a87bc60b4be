#pragma once

#include "fetters/app/command_context.h"
#include "fetters/app/services.h"
#include "fetters/cli/console.h"
#include "fetters/cli/terminal_prompter.h"
#include "fetters/config/config_store.h"
#include "fetters/config/paths.h"
#include "fetters/core/clock.h"
#include "fetters/storage/sqlite/sqlite_db.h"
#include "fetters/storage/sqlite/sqlite_job_repository.h"
#include "fetters/storage/sqlite/sqlite_sprint_repository.h"
#include "fetters/storage/sqlite/sqlite_stage_repository.h"
#include "fetters/storage/sqlite/sqlite_status_repository.h"
#include "fetters/storage/sqlite/sqlite_title_repository.h"

#include <memory>

// Session owns everything one CLI invocation works with: the migrated
// database, the repositories over it, the config file, the terminal prompter
// and the Services / CommandContext views over them.
class Session {
 public:
  // Resolve the app paths, create the directories, open and migrate the
  // database and seed the status catalog.
  [[nodiscard]] static fetters::core::FettersResult<std::unique_ptr<Session>> open();

  ~Session() = default;
  Session(const Session&) = delete;
  Session& operator=(const Session&) = delete;
  Session(Session&&) = delete;
  Session& operator=(Session&&) = delete;

  [[nodiscard]] fetters::app::CommandContext& context() { return context_; }
  [[nodiscard]] const fetters::config::AppPaths& paths() const { return paths_; }

 private:
  Session(fetters::config::AppPaths paths, std::shared_ptr<fetters::storage::sqlite::SqliteDb> db);

  fetters::config::AppPaths paths_;
  std::shared_ptr<fetters::storage::sqlite::SqliteDb> db_;
  fetters::core::SystemClock clock_;
  fetters::config::FileConfigStore config_;
  fetters::storage::sqlite::SqliteStatusRepository statuses_;
  fetters::storage::sqlite::SqliteTitleRepository titles_;
  fetters::storage::sqlite::SqliteSprintRepository sprints_;
  fetters::storage::sqlite::SqliteJobRepository jobs_;
  fetters::storage::sqlite::SqliteStageRepository stages_;
  fetters::app::Services services_;
  fetters::cli::Console console_;
  fetters::cli::TerminalPrompter prompter_;
  fetters::app::CommandContext context_;
};

// Standard streams console, colored when stdout is a terminal.
[[nodiscard]] const fetters::cli::Console& stdout_console();

// Print the error line to stderr and return the exit code for it.
int report_error(const fetters::core::Error& error);

// Exit code for a finished command flow.
int exit_code(const fetters::core::FettersResult<bool>& result);
