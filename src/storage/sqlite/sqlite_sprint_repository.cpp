#include "fetters/storage/sqlite/sqlite_sprint_repository.h"

#include <sqlite3.h>

#include <string>
#include <vector>

namespace fetters::storage::sqlite {

namespace {

constexpr const char* kSprintColumns = "SELECT id, name, start_date, end_date, num_jobs FROM sprints";

bool is_unique_violation(const SqliteDb& db) {
  return sqlite3_extended_errcode(db.connection()) == SQLITE_CONSTRAINT_UNIQUE;
}

core::Error sprint_not_found(std::int64_t id) {
  return core::make_error(core::ErrorKind::kStoreResult,
                          "sprint " + std::to_string(id) + " not found");
}

}  // namespace

SqliteSprintRepository::SqliteSprintRepository(std::shared_ptr<SqliteDb> db, core::IClock& clock)
    : db_(std::move(db)), clock_(clock) {}

core::FettersResult<domain::Sprint> SqliteSprintRepository::add(const domain::NewSprint& sprint) {
  using ResultType = core::FettersResult<domain::Sprint>;

  PreparedStatement stmt(
      db_->connection(),
      "INSERT INTO sprints (name, start_date, end_date, num_jobs) VALUES (?, ?, ?, ?)");
  if (!stmt.is_valid()) {
    return ResultType::err(query_error(*db_, "prepare sprint insert"));
  }

  bind_text(stmt.get(), 1, sprint.name);
  bind_text(stmt.get(), 2, sprint.start_date);
  bind_optional_text(stmt.get(), 3, sprint.end_date);
  bind_int64(stmt.get(), 4, sprint.num_jobs);

  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    if (is_unique_violation(*db_)) {
      return ResultType::err(core::make_error(core::ErrorKind::kSprintNameConflict, sprint.name));
    }
    return ResultType::err(query_error(*db_, "insert sprint"));
  }

  return get(db_->last_insert_rowid());
}

core::FettersResult<domain::Sprint> SqliteSprintRepository::get_or_create_by_name(
    const std::string& name) {
  using ResultType = core::FettersResult<domain::Sprint>;

  auto existing = get_by_name(name);
  if (!existing.has_value()) {
    return ResultType::err(existing.error());
  }
  if (existing.value().has_value()) {
    return ResultType::ok(existing.value().value());
  }

  return add(domain::NewSprint{name, clock_.today(), std::nullopt, 0});
}

core::FettersResult<domain::Sprint> SqliteSprintRepository::get(std::int64_t id) const {
  using ResultType = core::FettersResult<domain::Sprint>;

  PreparedStatement stmt(db_->connection(), std::string{kSprintColumns} + " WHERE id = ?");
  if (!stmt.is_valid()) {
    return ResultType::err(query_error(*db_, "get sprint"));
  }
  bind_int64(stmt.get(), 1, id);

  const int rc = sqlite3_step(stmt.get());
  if (rc == SQLITE_ROW) {
    return ResultType::ok(row_to_sprint(stmt.get()));
  }
  if (rc == SQLITE_DONE) {
    return ResultType::err(sprint_not_found(id));
  }
  return ResultType::err(query_error(*db_, "get sprint"));
}

core::FettersResult<std::optional<domain::Sprint>> SqliteSprintRepository::get_by_name(
    const std::string& name) const {
  using ResultType = core::FettersResult<std::optional<domain::Sprint>>;

  PreparedStatement stmt(db_->connection(), std::string{kSprintColumns} + " WHERE name = ?");
  if (!stmt.is_valid()) {
    return ResultType::err(query_error(*db_, "get sprint by name"));
  }
  bind_text(stmt.get(), 1, name);

  const int rc = sqlite3_step(stmt.get());
  if (rc == SQLITE_ROW) {
    return ResultType::ok(row_to_sprint(stmt.get()));
  }
  if (rc == SQLITE_DONE) {
    return ResultType::ok(std::nullopt);
  }
  return ResultType::err(query_error(*db_, "get sprint by name"));
}

core::FettersResult<domain::Sprint> SqliteSprintRepository::update(
    std::int64_t id, const domain::SprintUpdate& changes) {
  using ResultType = core::FettersResult<domain::Sprint>;

  if (changes.empty()) {
    return get(id);
  }

  std::vector<std::string> assignments;
  if (changes.name.has_value()) {
    assignments.emplace_back("name = ?");
  }
  if (changes.start_date.has_value()) {
    assignments.emplace_back("start_date = ?");
  }
  if (changes.end_date.has_value()) {
    assignments.emplace_back("end_date = ?");
  }

  std::string sql = "UPDATE sprints SET ";
  for (std::size_t i = 0; i < assignments.size(); ++i) {
    if (i > 0) {
      sql += ", ";
    }
    sql += assignments[i];
  }
  sql += " WHERE id = ?";

  PreparedStatement stmt(db_->connection(), sql);
  if (!stmt.is_valid()) {
    return ResultType::err(query_error(*db_, "prepare sprint update"));
  }

  int index = 1;
  if (changes.name.has_value()) {
    bind_text(stmt.get(), index++, changes.name.value());
  }
  if (changes.start_date.has_value()) {
    bind_text(stmt.get(), index++, changes.start_date.value());
  }
  if (changes.end_date.has_value()) {
    bind_optional_text(stmt.get(), index++, changes.end_date.value());
  }
  bind_int64(stmt.get(), index, id);

  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    if (is_unique_violation(*db_) && changes.name.has_value()) {
      return ResultType::err(
          core::make_error(core::ErrorKind::kSprintNameConflict, changes.name.value()));
    }
    return ResultType::err(query_error(*db_, "update sprint"));
  }
  if (db_->changes() == 0) {
    return ResultType::err(sprint_not_found(id));
  }

  return get(id);
}

core::FettersResult<std::vector<domain::Sprint>> SqliteSprintRepository::list_all() const {
  using ResultType = core::FettersResult<std::vector<domain::Sprint>>;

  PreparedStatement stmt(db_->connection(), std::string{kSprintColumns} + " ORDER BY id");
  if (!stmt.is_valid()) {
    return ResultType::err(query_error(*db_, "list sprints"));
  }

  std::vector<domain::Sprint> result;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
    result.push_back(row_to_sprint(stmt.get()));
  }
  if (rc != SQLITE_DONE) {
    return ResultType::err(query_error(*db_, "list sprints"));
  }

  return ResultType::ok(std::move(result));
}

core::FettersResult<domain::Sprint> SqliteSprintRepository::start_next(
    const domain::NewSprint& sprint, std::optional<std::int64_t> previous_id) {
  using ResultType = core::FettersResult<domain::Sprint>;

  Transaction tx(*db_);
  if (!tx.started().has_value()) {
    return ResultType::err(tx.started().error());
  }

  if (previous_id.has_value()) {
    auto previous = get(previous_id.value());
    if (!previous.has_value()) {
      return previous;
    }
    if (!previous.value().end_date.has_value()) {
      domain::SprintUpdate close;
      close.end_date = std::optional<std::string>{sprint.start_date};
      auto closed = update(previous_id.value(), close);
      if (!closed.has_value()) {
        return closed;
      }
    }
  }

  auto created = add(sprint);
  if (!created.has_value()) {
    return created;
  }

  auto commit_result = tx.commit();
  if (!commit_result.has_value()) {
    return ResultType::err(commit_result.error());
  }
  return created;
}

core::FettersResult<bool> SqliteSprintRepository::increment(std::int64_t id) {
  return adjust_num_jobs(id, "UPDATE sprints SET num_jobs = num_jobs + 1 WHERE id = ?");
}

core::FettersResult<bool> SqliteSprintRepository::decrement(std::int64_t id) {
  // Floor at zero: the CHECK constraint would otherwise reject the write.
  return adjust_num_jobs(id, "UPDATE sprints SET num_jobs = MAX(num_jobs - 1, 0) WHERE id = ?");
}

core::FettersResult<bool> SqliteSprintRepository::adjust_num_jobs(std::int64_t id,
                                                                  const char* sql) {
  using ResultType = core::FettersResult<bool>;

  PreparedStatement stmt(db_->connection(), sql);
  if (!stmt.is_valid()) {
    return ResultType::err(query_error(*db_, "prepare sprint counter update"));
  }
  bind_int64(stmt.get(), 1, id);

  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    return ResultType::err(query_error(*db_, "update sprint counter"));
  }
  if (db_->changes() == 0) {
    return ResultType::err(sprint_not_found(id));
  }
  return ResultType::ok(true);
}

domain::Sprint SqliteSprintRepository::row_to_sprint(sqlite3_stmt* stmt) const {
  domain::Sprint sprint;
  sprint.id = column_int64(stmt, 0);
  sprint.name = column_text(stmt, 1);
  sprint.start_date = column_text(stmt, 2);
  sprint.end_date = column_optional_text(stmt, 3);
  sprint.num_jobs = column_int64(stmt, 4);
  return sprint;
}

}  // namespace fetters::storage::sqlite
