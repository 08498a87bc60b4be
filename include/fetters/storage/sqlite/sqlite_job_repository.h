#pragma once

#include "fetters/storage/repositories.h"
#include "fetters/storage/sqlite/sqlite_db.h"

#include <memory>

// Forward declare sqlite3_stmt to avoid including sqlite3.h in this header.
struct sqlite3_stmt;

namespace fetters::storage::sqlite {

// SqliteJobRepository implements IJobRepository over the jobs table.
//
// Sprint counters: every insert, delete and sprint move issues the matching
// increment/decrement on the sprint repository inside the same transaction, so
// sprints.num_jobs always equals the number of jobs referencing the sprint.
// Both repositories must share the same SqliteDb.
//
// list() joins jobs with titles, statuses and sprints, applies substring filters
// with LIKE (user wildcards escaped), and applies the stages filter in memory.
class SqliteJobRepository final : public IJobRepository {
 public:
  SqliteJobRepository(std::shared_ptr<SqliteDb> db, ISprintRepository& sprints);

  [[nodiscard]] core::FettersResult<domain::Job> add(const domain::NewJob& job) override;
  [[nodiscard]] core::FettersResult<domain::Job> get(std::int64_t id) const override;
  [[nodiscard]] core::FettersResult<domain::Job> update(std::int64_t id,
                                                        const domain::JobUpdate& changes) override;
  [[nodiscard]] core::FettersResult<domain::Job> remove(std::int64_t id) override;

  [[nodiscard]] core::FettersResult<std::vector<domain::ListedJob>> list(
      const domain::JobFilter& filter, const domain::Sprint& current_sprint) const override;

  [[nodiscard]] core::FettersResult<std::vector<domain::CountAndPercentage>> count_per_status(
      const domain::Sprint& current_sprint) const override;
  [[nodiscard]] core::FettersResult<std::vector<domain::CountAndPercentage>> count_per_sprint(
      const domain::Sprint& current_sprint) const override;

 private:
  std::shared_ptr<SqliteDb> db_;
  ISprintRepository& sprints_;

  [[nodiscard]] core::FettersResult<std::int64_t> count_total_jobs() const;
  [[nodiscard]] core::FettersResult<std::int64_t> count_jobs_in_sprint(
      std::int64_t sprint_id) const;
  [[nodiscard]] core::FettersResult<std::vector<domain::LabelCount>> load_label_counts(
      const std::string& sql, std::optional<std::int64_t> sprint_id) const;

  // Column order: id(0), created(1), company_name(2), title_id(3),
  //               status_id(4), link(5), notes(6), sprint_id(7)
  [[nodiscard]] domain::Job row_to_job(sqlite3_stmt* stmt) const;
};

}  // namespace fetters::storage::sqlite
