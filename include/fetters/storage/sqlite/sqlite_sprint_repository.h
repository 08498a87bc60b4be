#pragma once

#include "fetters/core/clock.h"
#include "fetters/storage/repositories.h"
#include "fetters/storage/sqlite/sqlite_db.h"

#include <memory>

// Forward declare sqlite3_stmt to avoid including sqlite3.h in this header.
struct sqlite3_stmt;

namespace fetters::storage::sqlite {

// SqliteSprintRepository implements ISprintRepository over the sprints table.
// The clock supplies start_date for sprints created lazily by name.
// num_jobs is changed only through increment()/decrement().
class SqliteSprintRepository final : public ISprintRepository {
 public:
  SqliteSprintRepository(std::shared_ptr<SqliteDb> db, core::IClock& clock);

  [[nodiscard]] core::FettersResult<domain::Sprint> add(const domain::NewSprint& sprint) override;
  [[nodiscard]] core::FettersResult<domain::Sprint> get_or_create_by_name(
      const std::string& name) override;
  [[nodiscard]] core::FettersResult<domain::Sprint> get(std::int64_t id) const override;
  [[nodiscard]] core::FettersResult<std::optional<domain::Sprint>> get_by_name(
      const std::string& name) const override;
  [[nodiscard]] core::FettersResult<domain::Sprint> update(
      std::int64_t id, const domain::SprintUpdate& changes) override;
  [[nodiscard]] core::FettersResult<std::vector<domain::Sprint>> list_all() const override;
  [[nodiscard]] core::FettersResult<domain::Sprint> start_next(
      const domain::NewSprint& sprint, std::optional<std::int64_t> previous_id) override;

  [[nodiscard]] core::FettersResult<bool> increment(std::int64_t id) override;
  [[nodiscard]] core::FettersResult<bool> decrement(std::int64_t id) override;

 private:
  std::shared_ptr<SqliteDb> db_;
  core::IClock& clock_;

  [[nodiscard]] core::FettersResult<bool> adjust_num_jobs(std::int64_t id, const char* sql);

  // Column order: id(0), name(1), start_date(2), end_date(3), num_jobs(4)
  [[nodiscard]] domain::Sprint row_to_sprint(sqlite3_stmt* stmt) const;
};

}  // namespace fetters::storage::sqlite
