#pragma once

#include "fetters/storage/repositories.h"
#include "fetters/storage/sqlite/sqlite_db.h"

#include <memory>

namespace fetters::storage::sqlite {

// SqliteTitleRepository implements ITitleRepository over the titles table.
// get_or_create interns by the UNIQUE name column (INSERT ... ON CONFLICT DO NOTHING).
class SqliteTitleRepository final : public ITitleRepository {
 public:
  explicit SqliteTitleRepository(std::shared_ptr<SqliteDb> db);

  [[nodiscard]] core::FettersResult<domain::Title> get_or_create(const std::string& name) override;
  [[nodiscard]] core::FettersResult<domain::Title> get(std::int64_t id) const override;
  [[nodiscard]] core::FettersResult<std::vector<domain::Title>> list() const override;

 private:
  std::shared_ptr<SqliteDb> db_;
};

}  // namespace fetters::storage::sqlite
