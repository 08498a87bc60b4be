#include "fetters/storage/sqlite/sqlite_status_repository.h"

#include <sqlite3.h>

namespace fetters::storage::sqlite {

SqliteStatusRepository::SqliteStatusRepository(std::shared_ptr<SqliteDb> db)
    : db_(std::move(db)) {}

core::FettersResult<bool> SqliteStatusRepository::seed() {
  using ResultType = core::FettersResult<bool>;

  Transaction tx(*db_);
  if (!tx.started().has_value()) {
    return tx.started();
  }

  for (const std::string_view status : domain::kDefaultStatuses) {
    const std::string name{status};

    auto existing = get_by_name(name);
    if (!existing.has_value()) {
      return ResultType::err(existing.error());
    }
    if (existing.value().has_value()) {
      continue;
    }

    PreparedStatement stmt(db_->connection(), "INSERT INTO statuses (name) VALUES (?)");
    if (!stmt.is_valid()) {
      return ResultType::err(query_error(*db_, "prepare status insert"));
    }
    bind_text(stmt.get(), 1, name);
    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
      return ResultType::err(query_error(*db_, "insert status " + name));
    }
  }

  return tx.commit();
}

core::FettersResult<std::vector<domain::Status>> SqliteStatusRepository::list() const {
  using ResultType = core::FettersResult<std::vector<domain::Status>>;

  PreparedStatement stmt(db_->connection(), "SELECT id, name FROM statuses ORDER BY id");
  if (!stmt.is_valid()) {
    return ResultType::err(query_error(*db_, "list statuses"));
  }

  std::vector<domain::Status> result;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
    result.push_back(domain::Status{column_int64(stmt.get(), 0), column_text(stmt.get(), 1)});
  }
  if (rc != SQLITE_DONE) {
    return ResultType::err(query_error(*db_, "list statuses"));
  }

  return ResultType::ok(std::move(result));
}

core::FettersResult<std::optional<domain::Status>> SqliteStatusRepository::get_by_name(
    const std::string& name) const {
  using ResultType = core::FettersResult<std::optional<domain::Status>>;

  PreparedStatement stmt(db_->connection(), "SELECT id, name FROM statuses WHERE name = ?");
  if (!stmt.is_valid()) {
    return ResultType::err(query_error(*db_, "get status"));
  }
  bind_text(stmt.get(), 1, name);

  const int rc = sqlite3_step(stmt.get());
  if (rc == SQLITE_ROW) {
    return ResultType::ok(domain::Status{column_int64(stmt.get(), 0), column_text(stmt.get(), 1)});
  }
  if (rc != SQLITE_DONE) {
    return ResultType::err(query_error(*db_, "get status"));
  }
  return ResultType::ok(std::nullopt);
}

}  // namespace fetters::storage::sqlite
