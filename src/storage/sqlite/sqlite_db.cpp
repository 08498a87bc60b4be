#include "fetters/storage/sqlite/sqlite_db.h"

#include <sqlite3.h>

#include <array>

namespace fetters::storage::sqlite {

// Deleter implementations
void SqliteDb::SqliteDeleter::operator()(sqlite3* db) const {
  if (db != nullptr) {
    sqlite3_close(db);
  }
}

void PreparedStatement::StmtDeleter::operator()(sqlite3_stmt* stmt) const {
  if (stmt != nullptr) {
    sqlite3_finalize(stmt);
  }
}

namespace {

struct Migration {
  int version;
  const char* name;
  const char* sql;
};

// Embedded schema v1 SQL (core tables)
constexpr const char* kSchemaV1 = R"(
CREATE TABLE IF NOT EXISTS sprints (
  id INTEGER NOT NULL PRIMARY KEY AUTOINCREMENT,
  name TEXT NOT NULL UNIQUE,
  start_date TEXT NOT NULL,
  end_date TEXT,
  num_jobs INTEGER NOT NULL DEFAULT 0 CHECK(num_jobs >= 0)
);

CREATE TABLE IF NOT EXISTS statuses (
  id INTEGER NOT NULL PRIMARY KEY AUTOINCREMENT,
  name TEXT NOT NULL UNIQUE
);

CREATE TABLE IF NOT EXISTS titles (
  id INTEGER NOT NULL PRIMARY KEY AUTOINCREMENT,
  name TEXT NOT NULL UNIQUE
);

CREATE TABLE IF NOT EXISTS jobs (
  id INTEGER NOT NULL PRIMARY KEY AUTOINCREMENT,
  created TEXT NOT NULL,
  company_name TEXT NOT NULL,
  title_id INTEGER NOT NULL,
  status_id INTEGER NOT NULL,
  link TEXT,
  notes TEXT,
  sprint_id INTEGER NOT NULL,
  FOREIGN KEY(title_id) REFERENCES titles(id),
  FOREIGN KEY(status_id) REFERENCES statuses(id),
  FOREIGN KEY(sprint_id) REFERENCES sprints(id)
);

CREATE INDEX IF NOT EXISTS idx_jobs_sprint_id ON jobs(sprint_id);
)";

// Embedded schema v2 SQL (adds interview stage tracking)
constexpr const char* kSchemaV2 = R"(
CREATE TABLE IF NOT EXISTS interview_stages (
  id INTEGER NOT NULL PRIMARY KEY AUTOINCREMENT,
  job_id INTEGER NOT NULL,
  stage_number INTEGER NOT NULL CHECK(stage_number >= 1),
  name TEXT,
  status TEXT NOT NULL DEFAULT 'SCHEDULED'
    CHECK(status IN ('SCHEDULED', 'PASSED', 'REJECTED')),
  scheduled_date TEXT NOT NULL,
  notes TEXT,
  created TEXT NOT NULL,
  FOREIGN KEY(job_id) REFERENCES jobs(id) ON DELETE CASCADE,
  UNIQUE(job_id, stage_number)
);

CREATE INDEX IF NOT EXISTS idx_interview_stages_job_id ON interview_stages(job_id);
)";

constexpr std::array<Migration, 2> kMigrations = {{
    {1, "create_job_tracking", kSchemaV1},
    {2, "add_interview_stage_tracking", kSchemaV2},
}};

constexpr const char* kSchemaVersionTable = R"(
CREATE TABLE IF NOT EXISTS schema_version (
  version INTEGER PRIMARY KEY,
  applied_at TEXT NOT NULL
);
)";

std::string savepoint_name(int depth) {
  return "fetters_sp_" + std::to_string(depth);
}

}  // namespace

SqliteDb::SqliteDb(sqlite3* db) : db_(db) {}

core::FettersResult<std::shared_ptr<SqliteDb>> SqliteDb::open(const std::string& path) {
  using ResultType = core::FettersResult<std::shared_ptr<SqliteDb>>;

  sqlite3* db = nullptr;
  int rc = sqlite3_open_v2(path.c_str(), &db, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
  if (rc != SQLITE_OK) {
    std::string error = db != nullptr ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
    sqlite3_close(db);
    return ResultType::err(core::make_error(core::ErrorKind::kStoreConnection, error));
  }

  // Enable foreign keys
  char* err_msg = nullptr;
  rc = sqlite3_exec(db, "PRAGMA foreign_keys = ON;", nullptr, nullptr, &err_msg);
  if (rc != SQLITE_OK) {
    std::string error = err_msg != nullptr ? err_msg : "Unknown error";
    sqlite3_free(err_msg);
    sqlite3_close(db);
    return ResultType::err(core::make_error(core::ErrorKind::kStoreConnection,
                                            "Failed to enable foreign keys: " + error));
  }

  // Another process holding the write lock is waited on rather than failed immediately.
  sqlite3_busy_timeout(db, 5000);

  return ResultType::ok(std::shared_ptr<SqliteDb>(new SqliteDb(db)));
}

int SqliteDb::get_schema_version() const {
  sqlite3_stmt* stmt = nullptr;
  const char* sql = "SELECT MAX(version) FROM schema_version";
  int rc = sqlite3_prepare_v2(db_.get(), sql, -1, &stmt, nullptr);
  if (rc != SQLITE_OK) {
    return 0;  // Table doesn't exist yet
  }

  int version = 0;
  if (sqlite3_step(stmt) == SQLITE_ROW && sqlite3_column_type(stmt, 0) != SQLITE_NULL) {
    version = sqlite3_column_int(stmt, 0);
  }

  sqlite3_finalize(stmt);
  return version;
}

int SqliteDb::latest_schema_version() {
  return kMigrations.back().version;
}

core::FettersResult<bool> SqliteDb::run_migrations() {
  using ResultType = core::FettersResult<bool>;

  auto table_result = exec(kSchemaVersionTable);
  if (!table_result.has_value()) {
    return ResultType::err(
        core::make_error(core::ErrorKind::kMigration, table_result.error().message));
  }

  for (const Migration& migration : kMigrations) {
    if (get_schema_version() >= migration.version) {
      continue;
    }

    Transaction tx(*this);
    if (!tx.started().has_value()) {
      return ResultType::err(
          core::make_error(core::ErrorKind::kMigration, tx.started().error().message));
    }

    auto apply_result = exec(migration.sql);
    if (!apply_result.has_value()) {
      return ResultType::err(core::make_error(
          core::ErrorKind::kMigration,
          "v" + std::to_string(migration.version) + " " + migration.name + ": " +
              apply_result.error().message));
    }

    auto record_result =
        exec("INSERT OR IGNORE INTO schema_version (version, applied_at) VALUES (" +
             std::to_string(migration.version) + ", datetime('now'))");
    if (!record_result.has_value()) {
      return ResultType::err(
          core::make_error(core::ErrorKind::kMigration, record_result.error().message));
    }

    auto commit_result = tx.commit();
    if (!commit_result.has_value()) {
      return ResultType::err(
          core::make_error(core::ErrorKind::kMigration, commit_result.error().message));
    }
  }

  return ResultType::ok(true);
}

core::FettersResult<bool> SqliteDb::exec(const std::string& sql) {
  char* err_msg = nullptr;
  int rc = sqlite3_exec(db_.get(), sql.c_str(), nullptr, nullptr, &err_msg);
  if (rc != SQLITE_OK) {
    std::string error = err_msg != nullptr ? err_msg : "Unknown error";
    sqlite3_free(err_msg);
    return core::FettersResult<bool>::err(
        core::make_error(core::ErrorKind::kStoreResult, "SQL execution failed: " + error));
  }

  return core::FettersResult<bool>::ok(true);
}

core::FettersResult<bool> SqliteDb::begin() {
  auto result = exec("SAVEPOINT " + savepoint_name(depth_));
  if (result.has_value()) {
    ++depth_;
  }
  return result;
}

core::FettersResult<bool> SqliteDb::commit() {
  if (depth_ == 0) {
    return core::FettersResult<bool>::err(
        core::make_error(core::ErrorKind::kStoreResult, "commit without an open transaction"));
  }
  auto result = exec("RELEASE " + savepoint_name(depth_ - 1));
  if (result.has_value()) {
    --depth_;
  }
  return result;
}

core::FettersResult<bool> SqliteDb::rollback() {
  if (depth_ == 0) {
    return core::FettersResult<bool>::err(
        core::make_error(core::ErrorKind::kStoreResult, "rollback without an open transaction"));
  }
  const std::string name = savepoint_name(depth_ - 1);
  auto result = exec("ROLLBACK TO " + name + "; RELEASE " + name);
  --depth_;
  return result;
}

std::string SqliteDb::last_error() const {
  return sqlite3_errmsg(db_.get());
}

std::int64_t SqliteDb::last_insert_rowid() const {
  return sqlite3_last_insert_rowid(db_.get());
}

int SqliteDb::changes() const {
  return sqlite3_changes(db_.get());
}

Transaction::Transaction(SqliteDb& db) : db_(db), started_(db.begin()) {}

Transaction::~Transaction() {
  if (!finished_ && started_.has_value()) {
    // Nothing to report from a destructor; the caller already has the original error.
    static_cast<void>(db_.rollback());
  }
}

core::FettersResult<bool> Transaction::commit() {
  if (!started_.has_value()) {
    return started_;
  }
  auto result = db_.commit();
  if (result.has_value()) {
    finished_ = true;
  }
  return result;
}

PreparedStatement::PreparedStatement(sqlite3* db, const std::string& sql) {
  sqlite3_stmt* raw_stmt = nullptr;
  int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &raw_stmt, nullptr);
  if (rc != SQLITE_OK) {
    error_ = sqlite3_errmsg(db);
    stmt_ = nullptr;
  } else {
    stmt_.reset(raw_stmt);
  }
}

void PreparedStatement::reset() {
  if (stmt_) {
    sqlite3_reset(stmt_.get());
    sqlite3_clear_bindings(stmt_.get());
  }
}

void bind_text(sqlite3_stmt* stmt, int index, const std::string& value) {
  sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
}

void bind_optional_text(sqlite3_stmt* stmt, int index, const std::optional<std::string>& value) {
  if (value.has_value()) {
    sqlite3_bind_text(stmt, index, value.value().c_str(), -1, SQLITE_TRANSIENT);
  } else {
    sqlite3_bind_null(stmt, index);
  }
}

void bind_int64(sqlite3_stmt* stmt, int index, std::int64_t value) {
  sqlite3_bind_int64(stmt, index, value);
}

std::string column_text(sqlite3_stmt* stmt, int column) {
  const unsigned char* text = sqlite3_column_text(stmt, column);
  if (text == nullptr) {
    return {};
  }
  return reinterpret_cast<const char*>(text);  // NOLINT
}

std::optional<std::string> column_optional_text(sqlite3_stmt* stmt, int column) {
  if (sqlite3_column_type(stmt, column) == SQLITE_NULL) {
    return std::nullopt;
  }
  return column_text(stmt, column);
}

std::int64_t column_int64(sqlite3_stmt* stmt, int column) {
  return sqlite3_column_int64(stmt, column);
}

std::optional<std::int64_t> column_optional_int64(sqlite3_stmt* stmt, int column) {
  if (sqlite3_column_type(stmt, column) == SQLITE_NULL) {
    return std::nullopt;
  }
  return sqlite3_column_int64(stmt, column);
}

core::Error query_error(const SqliteDb& db, const std::string& context) {
  return core::make_error(core::ErrorKind::kStoreResult, context + ": " + db.last_error());
}

}  // namespace fetters::storage::sqlite
