#include "fetters/storage/sqlite/sqlite_stage_repository.h"

#include <sqlite3.h>

#include <string>
#include <vector>

namespace fetters::storage::sqlite {

namespace {

constexpr const char* kStageColumns =
    "SELECT id, job_id, stage_number, name, status, scheduled_date, notes, created "
    "FROM interview_stages";

core::Error stage_not_found(std::int64_t id) {
  return core::make_error(core::ErrorKind::kStoreResult,
                          "interview stage " + std::to_string(id) + " not found");
}

}  // namespace

SqliteStageRepository::SqliteStageRepository(std::shared_ptr<SqliteDb> db) : db_(std::move(db)) {}

core::FettersResult<domain::InterviewStage> SqliteStageRepository::add(
    const domain::NewInterviewStage& stage) {
  using ResultType = core::FettersResult<domain::InterviewStage>;

  PreparedStatement stmt(db_->connection(), R"(
    INSERT INTO interview_stages
      (job_id, stage_number, name, status, scheduled_date, notes, created)
    VALUES (?, ?, ?, ?, ?, ?, ?)
  )");
  if (!stmt.is_valid()) {
    return ResultType::err(query_error(*db_, "prepare stage insert"));
  }

  bind_int64(stmt.get(), 1, stage.job_id);
  bind_int64(stmt.get(), 2, stage.stage_number);
  bind_optional_text(stmt.get(), 3, stage.name);
  bind_text(stmt.get(), 4, std::string{domain::to_string(stage.status)});
  bind_text(stmt.get(), 5, stage.scheduled_date);
  bind_optional_text(stmt.get(), 6, stage.notes);
  bind_text(stmt.get(), 7, stage.created);

  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    return ResultType::err(query_error(*db_, "insert interview stage"));
  }

  return get(db_->last_insert_rowid());
}

core::FettersResult<std::int64_t> SqliteStageRepository::next_stage_number(
    std::int64_t job_id) const {
  using ResultType = core::FettersResult<std::int64_t>;

  PreparedStatement stmt(
      db_->connection(),
      "SELECT COALESCE(MAX(stage_number), 0) + 1 FROM interview_stages WHERE job_id = ?");
  if (!stmt.is_valid()) {
    return ResultType::err(query_error(*db_, "prepare next stage number"));
  }
  bind_int64(stmt.get(), 1, job_id);

  if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
    return ResultType::err(query_error(*db_, "next stage number"));
  }
  return ResultType::ok(column_int64(stmt.get(), 0));
}

core::FettersResult<domain::InterviewStage> SqliteStageRepository::get(std::int64_t id) const {
  using ResultType = core::FettersResult<domain::InterviewStage>;

  PreparedStatement stmt(db_->connection(), std::string{kStageColumns} + " WHERE id = ?");
  if (!stmt.is_valid()) {
    return ResultType::err(query_error(*db_, "get interview stage"));
  }
  bind_int64(stmt.get(), 1, id);

  const int rc = sqlite3_step(stmt.get());
  if (rc == SQLITE_ROW) {
    return ResultType::ok(row_to_stage(stmt.get()));
  }
  if (rc == SQLITE_DONE) {
    return ResultType::err(stage_not_found(id));
  }
  return ResultType::err(query_error(*db_, "get interview stage"));
}

core::FettersResult<std::vector<domain::InterviewStage>> SqliteStageRepository::list(
    std::int64_t job_id) const {
  using ResultType = core::FettersResult<std::vector<domain::InterviewStage>>;

  PreparedStatement stmt(db_->connection(),
                         std::string{kStageColumns} + " WHERE job_id = ? ORDER BY stage_number");
  if (!stmt.is_valid()) {
    return ResultType::err(query_error(*db_, "list interview stages"));
  }
  bind_int64(stmt.get(), 1, job_id);

  std::vector<domain::InterviewStage> stages;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
    stages.push_back(row_to_stage(stmt.get()));
  }
  if (rc != SQLITE_DONE) {
    return ResultType::err(query_error(*db_, "list interview stages"));
  }
  return ResultType::ok(std::move(stages));
}

core::FettersResult<domain::InterviewStage> SqliteStageRepository::update(
    std::int64_t id, const domain::InterviewStageUpdate& changes) {
  using ResultType = core::FettersResult<domain::InterviewStage>;

  if (changes.empty()) {
    return get(id);
  }

  std::string sql = "UPDATE interview_stages SET ";
  bool first = true;
  const auto append = [&sql, &first](const char* assignment) {
    if (!first) {
      sql += ", ";
    }
    sql += assignment;
    first = false;
  };
  if (changes.name.has_value()) {
    append("name = ?");
  }
  if (changes.status.has_value()) {
    append("status = ?");
  }
  if (changes.scheduled_date.has_value()) {
    append("scheduled_date = ?");
  }
  if (changes.notes.has_value()) {
    append("notes = ?");
  }
  sql += " WHERE id = ?";

  PreparedStatement stmt(db_->connection(), sql);
  if (!stmt.is_valid()) {
    return ResultType::err(query_error(*db_, "prepare stage update"));
  }

  int index = 1;
  if (changes.name.has_value()) {
    bind_optional_text(stmt.get(), index++, changes.name.value());
  }
  if (changes.status.has_value()) {
    bind_text(stmt.get(), index++, std::string{domain::to_string(changes.status.value())});
  }
  if (changes.scheduled_date.has_value()) {
    bind_text(stmt.get(), index++, changes.scheduled_date.value());
  }
  if (changes.notes.has_value()) {
    bind_optional_text(stmt.get(), index++, changes.notes.value());
  }
  bind_int64(stmt.get(), index, id);

  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    return ResultType::err(query_error(*db_, "update interview stage"));
  }
  if (db_->changes() == 0) {
    return ResultType::err(stage_not_found(id));
  }

  return get(id);
}

core::FettersResult<domain::InterviewStage> SqliteStageRepository::delete_stage(std::int64_t id) {
  using ResultType = core::FettersResult<domain::InterviewStage>;

  auto existing = get(id);
  if (!existing.has_value()) {
    return existing;
  }

  PreparedStatement stmt(db_->connection(), "DELETE FROM interview_stages WHERE id = ?");
  if (!stmt.is_valid()) {
    return ResultType::err(query_error(*db_, "prepare stage delete"));
  }
  bind_int64(stmt.get(), 1, id);
  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    return ResultType::err(query_error(*db_, "delete interview stage"));
  }

  return existing;
}

core::FettersResult<bool> SqliteStageRepository::renumber(std::int64_t job_id) {
  using ResultType = core::FettersResult<bool>;

  auto stages = list(job_id);
  if (!stages.has_value()) {
    return ResultType::err(stages.error());
  }

  PreparedStatement stmt(db_->connection(),
                         "UPDATE interview_stages SET stage_number = ? WHERE id = ?");
  if (!stmt.is_valid()) {
    return ResultType::err(query_error(*db_, "prepare stage renumber"));
  }

  // Ascending order only ever lowers numbers into freed slots, so the
  // (job_id, stage_number) uniqueness holds after every single write.
  std::int64_t expected = 1;
  for (const auto& stage : stages.value()) {
    if (stage.stage_number != expected) {
      stmt.reset();
      bind_int64(stmt.get(), 1, expected);
      bind_int64(stmt.get(), 2, stage.id);
      if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        return ResultType::err(query_error(*db_, "renumber interview stage"));
      }
    }
    ++expected;
  }

  return ResultType::ok(true);
}

core::FettersResult<domain::InterviewStage> SqliteStageRepository::remove(std::int64_t id) {
  using ResultType = core::FettersResult<domain::InterviewStage>;

  Transaction tx(*db_);
  if (!tx.started().has_value()) {
    return ResultType::err(tx.started().error());
  }

  auto removed = delete_stage(id);
  if (!removed.has_value()) {
    return removed;
  }

  auto renumbered = renumber(removed.value().job_id);
  if (!renumbered.has_value()) {
    return ResultType::err(renumbered.error());
  }

  auto commit_result = tx.commit();
  if (!commit_result.has_value()) {
    return ResultType::err(commit_result.error());
  }
  return removed;
}

domain::InterviewStage SqliteStageRepository::row_to_stage(sqlite3_stmt* stmt) const {
  domain::InterviewStage stage;
  stage.id = column_int64(stmt, 0);
  stage.job_id = column_int64(stmt, 1);
  stage.stage_number = column_int64(stmt, 2);
  stage.name = column_optional_text(stmt, 3);
  // The CHECK constraint limits the column to known statuses.
  stage.status = domain::parse_stage_status(column_text(stmt, 4)).value_or(
      domain::StageStatus::kScheduled);
  stage.scheduled_date = column_text(stmt, 5);
  stage.notes = column_optional_text(stmt, 6);
  stage.created = column_text(stmt, 7);
  return stage;
}

}  // namespace fetters::storage::sqlite
