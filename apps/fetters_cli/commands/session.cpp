#include "session.h"

#include <cstdlib>
#include <iostream>
#include <string>

namespace {

bool debug_enabled() {
  const auto value = fetters::config::system_env("FETTERS_DEBUG");
  return value.has_value() && value.value() == "1";
}

}  // namespace

fetters::core::FettersResult<std::unique_ptr<Session>> Session::open() {
  using ResultType = fetters::core::FettersResult<std::unique_ptr<Session>>;

  auto paths = fetters::config::resolve_app_paths();
  if (!paths.has_value()) {
    return ResultType::err(paths.error());
  }
  if (debug_enabled()) {
    std::cerr << "[fetters] database: " << paths.value().database_file.string() << "\n";
    std::cerr << "[fetters] config:   " << paths.value().config_file.string() << "\n";
  }

  auto dirs = fetters::config::ensure_app_dirs(paths.value());
  if (!dirs.has_value()) {
    return ResultType::err(dirs.error());
  }

  auto db = fetters::storage::sqlite::SqliteDb::open(paths.value().database_file.string());
  if (!db.has_value()) {
    return ResultType::err(db.error());
  }
  auto migrated = db.value()->run_migrations();
  if (!migrated.has_value()) {
    return ResultType::err(migrated.error());
  }

  std::unique_ptr<Session> session(new Session(paths.value(), db.value()));
  auto seeded = session->statuses_.seed();
  if (!seeded.has_value()) {
    return ResultType::err(seeded.error());
  }
  return ResultType::ok(std::move(session));
}

Session::Session(fetters::config::AppPaths paths,
                 std::shared_ptr<fetters::storage::sqlite::SqliteDb> db)
    : paths_(std::move(paths)),
      db_(std::move(db)),
      config_(paths_.config_file),
      statuses_(db_),
      titles_(db_),
      sprints_(db_, clock_),
      jobs_(db_, sprints_),
      stages_(db_),
      services_(statuses_, titles_, sprints_, jobs_, stages_, config_, clock_),
      console_(stdout_console()),
      prompter_(std::cin, console_),
      context_{services_, prompter_, console_} {}

const fetters::cli::Console& stdout_console() {
  static const fetters::cli::Console console{std::cout, fetters::cli::stdout_supports_color()};
  return console;
}

int report_error(const fetters::core::Error& error) {
  std::cerr << fetters::core::to_string(error) << "\n";
  return 1;
}

int exit_code(const fetters::core::FettersResult<bool>& result) {
  if (!result.has_value()) {
    return report_error(result.error());
  }
  return 0;
}
