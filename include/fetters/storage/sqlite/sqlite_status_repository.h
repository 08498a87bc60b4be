#pragma once

#include "fetters/storage/repositories.h"
#include "fetters/storage/sqlite/sqlite_db.h"

#include <memory>

namespace fetters::storage::sqlite {

// SqliteStatusRepository implements IStatusRepository over the statuses table.
// Rows are only ever inserted by seed(); there is no update or delete.
class SqliteStatusRepository final : public IStatusRepository {
 public:
  explicit SqliteStatusRepository(std::shared_ptr<SqliteDb> db);

  [[nodiscard]] core::FettersResult<bool> seed() override;
  [[nodiscard]] core::FettersResult<std::vector<domain::Status>> list() const override;
  [[nodiscard]] core::FettersResult<std::optional<domain::Status>> get_by_name(
      const std::string& name) const override;

 private:
  std::shared_ptr<SqliteDb> db_;
};

}  // namespace fetters::storage::sqlite
