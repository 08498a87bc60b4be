#pragma once

#include "fetters/storage/repositories.h"
#include "fetters/storage/sqlite/sqlite_db.h"

#include <memory>

// Forward declare sqlite3_stmt to avoid including sqlite3.h in this header.
struct sqlite3_stmt;

namespace fetters::storage::sqlite {

// SqliteStageRepository implements IStageRepository over interview_stages.
// Stage numbers per job stay contiguous from 1: remove() deletes and renumbers
// inside one transaction.
class SqliteStageRepository final : public IStageRepository {
 public:
  explicit SqliteStageRepository(std::shared_ptr<SqliteDb> db);

  [[nodiscard]] core::FettersResult<domain::InterviewStage> add(
      const domain::NewInterviewStage& stage) override;
  [[nodiscard]] core::FettersResult<std::int64_t> next_stage_number(
      std::int64_t job_id) const override;
  [[nodiscard]] core::FettersResult<domain::InterviewStage> get(std::int64_t id) const override;
  [[nodiscard]] core::FettersResult<std::vector<domain::InterviewStage>> list(
      std::int64_t job_id) const override;
  [[nodiscard]] core::FettersResult<domain::InterviewStage> update(
      std::int64_t id, const domain::InterviewStageUpdate& changes) override;
  [[nodiscard]] core::FettersResult<domain::InterviewStage> delete_stage(std::int64_t id) override;
  [[nodiscard]] core::FettersResult<bool> renumber(std::int64_t job_id) override;
  [[nodiscard]] core::FettersResult<domain::InterviewStage> remove(std::int64_t id) override;

 private:
  std::shared_ptr<SqliteDb> db_;

  // Column order: id(0), job_id(1), stage_number(2), name(3), status(4),
  //               scheduled_date(5), notes(6), created(7)
  [[nodiscard]] domain::InterviewStage row_to_stage(sqlite3_stmt* stmt) const;
};

}  // namespace fetters::storage::sqlite
