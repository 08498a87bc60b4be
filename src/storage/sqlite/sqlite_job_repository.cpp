#include "fetters/storage/sqlite/sqlite_job_repository.h"

#include "fetters/core/dates.h"
#include "fetters/core/normalization.h"

#include <sqlite3.h>

#include <algorithm>
#include <string>
#include <vector>

namespace fetters::storage::sqlite {

namespace {

constexpr const char* kJobColumns =
    "SELECT id, created, company_name, title_id, status_id, link, notes, sprint_id FROM jobs";

constexpr const char* kListedJobSelect = R"(
  SELECT jobs.id, jobs.created, jobs.company_name, titles.name, statuses.name,
         NULLIF((SELECT COUNT(*) FROM interview_stages
                 WHERE interview_stages.job_id = jobs.id), 0),
         jobs.link, jobs.notes
  FROM jobs
  LEFT JOIN titles ON jobs.title_id = titles.id
  LEFT JOIN statuses ON jobs.status_id = statuses.id
  LEFT JOIN sprints ON jobs.sprint_id = sprints.id
)";

constexpr const char* kCountPerStatus = R"(
  SELECT statuses.name, COUNT(jobs.id)
  FROM jobs
  JOIN statuses ON jobs.status_id = statuses.id
  WHERE jobs.sprint_id = ?
  GROUP BY statuses.id
  ORDER BY statuses.name
)";

constexpr const char* kCountPerSprint = R"(
  SELECT sprints.name, COUNT(jobs.id)
  FROM sprints
  LEFT JOIN jobs ON jobs.sprint_id = sprints.id
  GROUP BY sprints.id
  ORDER BY sprints.id
)";

core::Error job_not_found(std::int64_t id) {
  return core::make_error(core::ErrorKind::kStoreResult, "job " + std::to_string(id) + " not found");
}

// A WHERE-clause fragment paired with the LIKE pattern bound to it.
struct LikeClause {
  const char* column;
  std::string pattern;
};

bool matches_stage_filter(const domain::ListedJob& job, std::int64_t stages_filter) {
  if (stages_filter == 0) {
    return job.stages_count.has_value();
  }
  return job.stages_count.has_value() && job.stages_count.value() == stages_filter;
}

}  // namespace

SqliteJobRepository::SqliteJobRepository(std::shared_ptr<SqliteDb> db, ISprintRepository& sprints)
    : db_(std::move(db)), sprints_(sprints) {}

core::FettersResult<domain::Job> SqliteJobRepository::add(const domain::NewJob& job) {
  using ResultType = core::FettersResult<domain::Job>;

  if (!core::is_valid_timestamp(job.created)) {
    return ResultType::err(core::make_error(
        core::ErrorKind::kStoreResult,
        "invalid job creation timestamp '" + job.created + "', expected YYYY-MM-DD HH:MM:SS"));
  }

  Transaction tx(*db_);
  if (!tx.started().has_value()) {
    return ResultType::err(tx.started().error());
  }

  PreparedStatement stmt(db_->connection(), R"(
    INSERT INTO jobs (created, company_name, title_id, status_id, link, notes, sprint_id)
    VALUES (?, ?, ?, ?, ?, ?, ?)
  )");
  if (!stmt.is_valid()) {
    return ResultType::err(query_error(*db_, "prepare job insert"));
  }

  bind_text(stmt.get(), 1, job.created);
  bind_text(stmt.get(), 2, job.company_name);
  bind_int64(stmt.get(), 3, job.title_id);
  bind_int64(stmt.get(), 4, job.status_id);
  bind_optional_text(stmt.get(), 5, job.link);
  bind_optional_text(stmt.get(), 6, job.notes);
  bind_int64(stmt.get(), 7, job.sprint_id);

  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    return ResultType::err(query_error(*db_, "insert job"));
  }
  const std::int64_t job_id = db_->last_insert_rowid();

  auto counter_result = sprints_.increment(job.sprint_id);
  if (!counter_result.has_value()) {
    return ResultType::err(counter_result.error());
  }

  auto inserted = get(job_id);
  if (!inserted.has_value()) {
    return inserted;
  }

  auto commit_result = tx.commit();
  if (!commit_result.has_value()) {
    return ResultType::err(commit_result.error());
  }
  return inserted;
}

core::FettersResult<domain::Job> SqliteJobRepository::get(std::int64_t id) const {
  using ResultType = core::FettersResult<domain::Job>;

  PreparedStatement stmt(db_->connection(), std::string{kJobColumns} + " WHERE id = ?");
  if (!stmt.is_valid()) {
    return ResultType::err(query_error(*db_, "get job"));
  }
  bind_int64(stmt.get(), 1, id);

  const int rc = sqlite3_step(stmt.get());
  if (rc == SQLITE_ROW) {
    return ResultType::ok(row_to_job(stmt.get()));
  }
  if (rc == SQLITE_DONE) {
    return ResultType::err(job_not_found(id));
  }
  return ResultType::err(query_error(*db_, "get job"));
}

core::FettersResult<domain::Job> SqliteJobRepository::update(std::int64_t id,
                                                             const domain::JobUpdate& changes) {
  using ResultType = core::FettersResult<domain::Job>;

  Transaction tx(*db_);
  if (!tx.started().has_value()) {
    return ResultType::err(tx.started().error());
  }

  auto existing = get(id);
  if (!existing.has_value() || changes.empty()) {
    return existing;
  }

  std::string sql = "UPDATE jobs SET ";
  bool first = true;
  const auto append = [&sql, &first](const char* assignment) {
    if (!first) {
      sql += ", ";
    }
    sql += assignment;
    first = false;
  };
  if (changes.company_name.has_value()) {
    append("company_name = ?");
  }
  if (changes.title_id.has_value()) {
    append("title_id = ?");
  }
  if (changes.status_id.has_value()) {
    append("status_id = ?");
  }
  if (changes.link.has_value()) {
    append("link = ?");
  }
  if (changes.notes.has_value()) {
    append("notes = ?");
  }
  if (changes.sprint_id.has_value()) {
    append("sprint_id = ?");
  }
  sql += " WHERE id = ?";

  PreparedStatement stmt(db_->connection(), sql);
  if (!stmt.is_valid()) {
    return ResultType::err(query_error(*db_, "prepare job update"));
  }

  int index = 1;
  if (changes.company_name.has_value()) {
    bind_text(stmt.get(), index++, changes.company_name.value());
  }
  if (changes.title_id.has_value()) {
    bind_int64(stmt.get(), index++, changes.title_id.value());
  }
  if (changes.status_id.has_value()) {
    bind_int64(stmt.get(), index++, changes.status_id.value());
  }
  if (changes.link.has_value()) {
    bind_optional_text(stmt.get(), index++, changes.link.value());
  }
  if (changes.notes.has_value()) {
    bind_optional_text(stmt.get(), index++, changes.notes.value());
  }
  if (changes.sprint_id.has_value()) {
    bind_int64(stmt.get(), index++, changes.sprint_id.value());
  }
  bind_int64(stmt.get(), index, id);

  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    return ResultType::err(query_error(*db_, "update job"));
  }

  const std::int64_t old_sprint_id = existing.value().sprint_id;
  if (changes.sprint_id.has_value() && changes.sprint_id.value() != old_sprint_id) {
    auto decrement_result = sprints_.decrement(old_sprint_id);
    if (!decrement_result.has_value()) {
      return ResultType::err(decrement_result.error());
    }
    auto increment_result = sprints_.increment(changes.sprint_id.value());
    if (!increment_result.has_value()) {
      return ResultType::err(increment_result.error());
    }
  }

  auto updated = get(id);
  if (!updated.has_value()) {
    return updated;
  }

  auto commit_result = tx.commit();
  if (!commit_result.has_value()) {
    return ResultType::err(commit_result.error());
  }
  return updated;
}

core::FettersResult<domain::Job> SqliteJobRepository::remove(std::int64_t id) {
  using ResultType = core::FettersResult<domain::Job>;

  Transaction tx(*db_);
  if (!tx.started().has_value()) {
    return ResultType::err(tx.started().error());
  }

  auto existing = get(id);
  if (!existing.has_value()) {
    return existing;
  }

  // Stages go with their job. The foreign key cascades as well; deleting them
  // here keeps databases created without the cascade consistent.
  PreparedStatement stages_stmt(db_->connection(),
                                "DELETE FROM interview_stages WHERE job_id = ?");
  if (!stages_stmt.is_valid()) {
    return ResultType::err(query_error(*db_, "prepare stage cleanup"));
  }
  bind_int64(stages_stmt.get(), 1, id);
  if (sqlite3_step(stages_stmt.get()) != SQLITE_DONE) {
    return ResultType::err(query_error(*db_, "delete job stages"));
  }

  PreparedStatement job_stmt(db_->connection(), "DELETE FROM jobs WHERE id = ?");
  if (!job_stmt.is_valid()) {
    return ResultType::err(query_error(*db_, "prepare job delete"));
  }
  bind_int64(job_stmt.get(), 1, id);
  if (sqlite3_step(job_stmt.get()) != SQLITE_DONE) {
    return ResultType::err(query_error(*db_, "delete job"));
  }

  auto counter_result = sprints_.decrement(existing.value().sprint_id);
  if (!counter_result.has_value()) {
    return ResultType::err(counter_result.error());
  }

  auto commit_result = tx.commit();
  if (!commit_result.has_value()) {
    return ResultType::err(commit_result.error());
  }
  return existing;
}

core::FettersResult<std::vector<domain::ListedJob>> SqliteJobRepository::list(
    const domain::JobFilter& filter, const domain::Sprint& current_sprint) const {
  using ResultType = core::FettersResult<std::vector<domain::ListedJob>>;

  std::vector<LikeClause> like_clauses;
  if (filter.sprint.has_value()) {
    like_clauses.push_back({"sprints.name", core::like_contains_pattern(filter.sprint.value())});
  }
  if (filter.company.has_value()) {
    like_clauses.push_back({"jobs.company_name", core::like_contains_pattern(filter.company.value())});
  }
  if (filter.link.has_value()) {
    like_clauses.push_back({"jobs.link", core::like_contains_pattern(filter.link.value())});
  }
  if (filter.notes.has_value()) {
    like_clauses.push_back({"jobs.notes", core::like_contains_pattern(filter.notes.value())});
  }
  if (filter.status.has_value()) {
    like_clauses.push_back({"statuses.name", core::like_contains_pattern(filter.status.value())});
  }
  if (filter.title.has_value()) {
    like_clauses.push_back({"titles.name", core::like_contains_pattern(filter.title.value())});
  }

  std::string sql = kListedJobSelect;
  // Without an explicit sprint filter only the current sprint is listed.
  sql += filter.sprint.has_value() ? " WHERE 1 = 1" : " WHERE sprints.id = ?";
  for (const auto& clause : like_clauses) {
    sql += " AND ";
    sql += clause.column;
    sql += " LIKE ? ESCAPE '\\'";
  }
  sql += " ORDER BY jobs.id";

  PreparedStatement stmt(db_->connection(), sql);
  if (!stmt.is_valid()) {
    return ResultType::err(query_error(*db_, "prepare job listing"));
  }

  int index = 1;
  if (!filter.sprint.has_value()) {
    bind_int64(stmt.get(), index++, current_sprint.id);
  }
  for (const auto& clause : like_clauses) {
    bind_text(stmt.get(), index++, clause.pattern);
  }

  std::vector<domain::ListedJob> jobs;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
    domain::ListedJob job;
    job.id = column_int64(stmt.get(), 0);
    job.created = column_text(stmt.get(), 1);
    job.company_name = column_text(stmt.get(), 2);
    job.title = column_optional_text(stmt.get(), 3);
    job.status = column_optional_text(stmt.get(), 4);
    job.stages_count = column_optional_int64(stmt.get(), 5);
    job.link = column_optional_text(stmt.get(), 6);
    job.notes = column_optional_text(stmt.get(), 7);
    jobs.push_back(std::move(job));
  }
  if (rc != SQLITE_DONE) {
    return ResultType::err(query_error(*db_, "list jobs"));
  }

  if (filter.stages.has_value()) {
    const std::int64_t stages_filter = filter.stages.value();
    std::erase_if(jobs, [stages_filter](const domain::ListedJob& job) {
      return !matches_stage_filter(job, stages_filter);
    });
  }

  return ResultType::ok(std::move(jobs));
}

core::FettersResult<std::vector<domain::CountAndPercentage>> SqliteJobRepository::count_per_status(
    const domain::Sprint& current_sprint) const {
  using ResultType = core::FettersResult<std::vector<domain::CountAndPercentage>>;

  auto total = count_total_jobs();
  if (!total.has_value()) {
    return ResultType::err(total.error());
  }
  auto sprint_total = count_jobs_in_sprint(current_sprint.id);
  if (!sprint_total.has_value()) {
    return ResultType::err(sprint_total.error());
  }

  auto counts = load_label_counts(kCountPerStatus, current_sprint.id);
  if (!counts.has_value()) {
    return ResultType::err(counts.error());
  }

  return ResultType::ok(
      domain::project_insights(counts.value(), sprint_total.value(), total.value()));
}

core::FettersResult<std::vector<domain::CountAndPercentage>> SqliteJobRepository::count_per_sprint(
    const domain::Sprint& current_sprint) const {
  using ResultType = core::FettersResult<std::vector<domain::CountAndPercentage>>;

  auto total = count_total_jobs();
  if (!total.has_value()) {
    return ResultType::err(total.error());
  }
  auto sprint_total = count_jobs_in_sprint(current_sprint.id);
  if (!sprint_total.has_value()) {
    return ResultType::err(sprint_total.error());
  }

  auto counts = load_label_counts(kCountPerSprint, std::nullopt);
  if (!counts.has_value()) {
    return ResultType::err(counts.error());
  }

  return ResultType::ok(
      domain::project_insights(counts.value(), sprint_total.value(), total.value()));
}

core::FettersResult<std::int64_t> SqliteJobRepository::count_total_jobs() const {
  using ResultType = core::FettersResult<std::int64_t>;

  PreparedStatement stmt(db_->connection(), "SELECT COUNT(*) FROM jobs");
  if (!stmt.is_valid() || sqlite3_step(stmt.get()) != SQLITE_ROW) {
    return ResultType::err(query_error(*db_, "count jobs"));
  }
  return ResultType::ok(column_int64(stmt.get(), 0));
}

core::FettersResult<std::int64_t> SqliteJobRepository::count_jobs_in_sprint(
    std::int64_t sprint_id) const {
  using ResultType = core::FettersResult<std::int64_t>;

  PreparedStatement stmt(db_->connection(), "SELECT COUNT(*) FROM jobs WHERE sprint_id = ?");
  if (!stmt.is_valid()) {
    return ResultType::err(query_error(*db_, "count sprint jobs"));
  }
  bind_int64(stmt.get(), 1, sprint_id);
  if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
    return ResultType::err(query_error(*db_, "count sprint jobs"));
  }
  return ResultType::ok(column_int64(stmt.get(), 0));
}

core::FettersResult<std::vector<domain::LabelCount>> SqliteJobRepository::load_label_counts(
    const std::string& sql, std::optional<std::int64_t> sprint_id) const {
  using ResultType = core::FettersResult<std::vector<domain::LabelCount>>;

  PreparedStatement stmt(db_->connection(), sql);
  if (!stmt.is_valid()) {
    return ResultType::err(query_error(*db_, "prepare insight aggregation"));
  }
  if (sprint_id.has_value()) {
    bind_int64(stmt.get(), 1, sprint_id.value());
  }

  std::vector<domain::LabelCount> counts;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
    counts.push_back(domain::LabelCount{column_text(stmt.get(), 0), column_int64(stmt.get(), 1)});
  }
  if (rc != SQLITE_DONE) {
    return ResultType::err(query_error(*db_, "aggregate jobs"));
  }
  return ResultType::ok(std::move(counts));
}

domain::Job SqliteJobRepository::row_to_job(sqlite3_stmt* stmt) const {
  domain::Job job;
  job.id = column_int64(stmt, 0);
  job.created = column_text(stmt, 1);
  job.company_name = column_text(stmt, 2);
  job.title_id = column_int64(stmt, 3);
  job.status_id = column_int64(stmt, 4);
  job.link = column_optional_text(stmt, 5);
  job.notes = column_optional_text(stmt, 6);
  job.sprint_id = column_int64(stmt, 7);
  return job;
}

}  // namespace fetters::storage::sqlite
