#include "fetters/storage/sqlite/sqlite_title_repository.h"

#include <sqlite3.h>

namespace fetters::storage::sqlite {

SqliteTitleRepository::SqliteTitleRepository(std::shared_ptr<SqliteDb> db) : db_(std::move(db)) {}

core::FettersResult<domain::Title> SqliteTitleRepository::get_or_create(const std::string& name) {
  using ResultType = core::FettersResult<domain::Title>;

  Transaction tx(*db_);
  if (!tx.started().has_value()) {
    return ResultType::err(tx.started().error());
  }

  PreparedStatement insert_stmt(db_->connection(),
                                "INSERT INTO titles (name) VALUES (?) ON CONFLICT(name) DO NOTHING");
  if (!insert_stmt.is_valid()) {
    return ResultType::err(query_error(*db_, "prepare title insert"));
  }
  bind_text(insert_stmt.get(), 1, name);
  if (sqlite3_step(insert_stmt.get()) != SQLITE_DONE) {
    return ResultType::err(query_error(*db_, "insert title"));
  }

  PreparedStatement select_stmt(db_->connection(), "SELECT id, name FROM titles WHERE name = ?");
  if (!select_stmt.is_valid()) {
    return ResultType::err(query_error(*db_, "prepare title lookup"));
  }
  bind_text(select_stmt.get(), 1, name);
  if (sqlite3_step(select_stmt.get()) != SQLITE_ROW) {
    return ResultType::err(query_error(*db_, "lookup title"));
  }
  domain::Title title{column_int64(select_stmt.get(), 0), column_text(select_stmt.get(), 1)};

  auto commit_result = tx.commit();
  if (!commit_result.has_value()) {
    return ResultType::err(commit_result.error());
  }
  return ResultType::ok(std::move(title));
}

core::FettersResult<domain::Title> SqliteTitleRepository::get(std::int64_t id) const {
  using ResultType = core::FettersResult<domain::Title>;

  PreparedStatement stmt(db_->connection(), "SELECT id, name FROM titles WHERE id = ?");
  if (!stmt.is_valid()) {
    return ResultType::err(query_error(*db_, "get title"));
  }
  bind_int64(stmt.get(), 1, id);

  const int rc = sqlite3_step(stmt.get());
  if (rc == SQLITE_ROW) {
    return ResultType::ok(domain::Title{column_int64(stmt.get(), 0), column_text(stmt.get(), 1)});
  }
  if (rc == SQLITE_DONE) {
    return ResultType::err(core::make_error(core::ErrorKind::kStoreResult,
                                            "title " + std::to_string(id) + " not found"));
  }
  return ResultType::err(query_error(*db_, "get title"));
}

core::FettersResult<std::vector<domain::Title>> SqliteTitleRepository::list() const {
  using ResultType = core::FettersResult<std::vector<domain::Title>>;

  PreparedStatement stmt(db_->connection(), "SELECT id, name FROM titles ORDER BY name");
  if (!stmt.is_valid()) {
    return ResultType::err(query_error(*db_, "list titles"));
  }

  std::vector<domain::Title> result;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
    result.push_back(domain::Title{column_int64(stmt.get(), 0), column_text(stmt.get(), 1)});
  }
  if (rc != SQLITE_DONE) {
    return ResultType::err(query_error(*db_, "list titles"));
  }

  return ResultType::ok(std::move(result));
}

}  // namespace fetters::storage::sqlite
