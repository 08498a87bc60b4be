#pragma once

#include "fetters/core/error.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

// Forward declare sqlite3 to avoid exposing SQLite header in public API
struct sqlite3;
struct sqlite3_stmt;

namespace fetters::storage::sqlite {

// SqliteDb manages a SQLite database connection and schema versioning.
// Responsibilities:
// - Open/close database connection
// - Apply the ordered migration list (schema_version table)
// - Transactions, nestable through SAVEPOINTs
// - Enable foreign keys
//
// Design principles:
// - RAII: connection managed via unique_ptr with custom deleter
// - Explicit error handling via Result<T, Error>
// - One connection per instance, owned by a single command invocation
class SqliteDb {
 public:
  // Open or create database at path.
  // If path is ":memory:", creates in-memory database.
  [[nodiscard]] static core::FettersResult<std::shared_ptr<SqliteDb>> open(const std::string& path);

  ~SqliteDb() = default;

  // Disable copy/move (unique ownership)
  SqliteDb(const SqliteDb&) = delete;
  SqliteDb& operator=(const SqliteDb&) = delete;
  SqliteDb(SqliteDb&&) = delete;
  SqliteDb& operator=(SqliteDb&&) = delete;

  // Get current schema version (0 if no schema applied)
  [[nodiscard]] int get_schema_version() const;

  // Highest schema version known to this build.
  [[nodiscard]] static int latest_schema_version();

  // Apply every migration newer than the current schema version, in order.
  // Each migration runs in its own transaction. Idempotent.
  [[nodiscard]] core::FettersResult<bool> run_migrations();

  // Execute SQL statement (for non-query operations)
  [[nodiscard]] core::FettersResult<bool> exec(const std::string& sql);

  // Transaction control. Calls nest: the outermost begin() opens the transaction
  // and inner calls create savepoints inside it.
  [[nodiscard]] core::FettersResult<bool> begin();
  [[nodiscard]] core::FettersResult<bool> commit();
  [[nodiscard]] core::FettersResult<bool> rollback();

  [[nodiscard]] int transaction_depth() const { return depth_; }

  // Most recent error message reported by SQLite on this connection.
  [[nodiscard]] std::string last_error() const;

  // Rowid of the most recent successful INSERT.
  [[nodiscard]] std::int64_t last_insert_rowid() const;

  // Rows modified by the most recent INSERT/UPDATE/DELETE.
  [[nodiscard]] int changes() const;

  // Get raw connection (for prepared statements)
  // Should be used only by repository implementations
  [[nodiscard]] sqlite3* connection() const { return db_.get(); }

 private:
  struct SqliteDeleter {
    void operator()(sqlite3* db) const;
  };

  explicit SqliteDb(sqlite3* db);

  std::unique_ptr<sqlite3, SqliteDeleter> db_;
  int depth_{0};
};

// Transaction is an RAII guard over SqliteDb::begin/commit/rollback.
// The destructor rolls back unless commit() succeeded.
class Transaction {
 public:
  explicit Transaction(SqliteDb& db);
  ~Transaction();

  Transaction(const Transaction&) = delete;
  Transaction& operator=(const Transaction&) = delete;
  Transaction(Transaction&&) = delete;
  Transaction& operator=(Transaction&&) = delete;

  // Result of the begin() issued by the constructor.
  [[nodiscard]] const core::FettersResult<bool>& started() const { return started_; }

  [[nodiscard]] core::FettersResult<bool> commit();

 private:
  SqliteDb& db_;
  core::FettersResult<bool> started_;
  bool finished_{false};
};

// RAII wrapper for prepared statements
class PreparedStatement {
 public:
  PreparedStatement(sqlite3* db, const std::string& sql);
  ~PreparedStatement() = default;

  PreparedStatement(const PreparedStatement&) = delete;
  PreparedStatement& operator=(const PreparedStatement&) = delete;
  PreparedStatement(PreparedStatement&&) = delete;
  PreparedStatement& operator=(PreparedStatement&&) = delete;

  // Returns true if statement was prepared successfully
  [[nodiscard]] bool is_valid() const { return stmt_ != nullptr; }

  // Get error message if preparation failed
  [[nodiscard]] std::string error() const { return error_; }

  // Get raw statement (for binding/stepping)
  [[nodiscard]] sqlite3_stmt* get() const { return stmt_.get(); }

  // Reset statement for reuse
  void reset();

 private:
  struct StmtDeleter {
    void operator()(sqlite3_stmt* stmt) const;
  };

  std::unique_ptr<sqlite3_stmt, StmtDeleter> stmt_;
  std::string error_;
};

// Binding and column helpers shared by the repositories.
// Indices follow SQLite conventions: parameters are 1-based, columns 0-based.
void bind_text(sqlite3_stmt* stmt, int index, const std::string& value);
void bind_optional_text(sqlite3_stmt* stmt, int index, const std::optional<std::string>& value);
void bind_int64(sqlite3_stmt* stmt, int index, std::int64_t value);

[[nodiscard]] std::string column_text(sqlite3_stmt* stmt, int column);
[[nodiscard]] std::optional<std::string> column_optional_text(sqlite3_stmt* stmt, int column);
[[nodiscard]] std::int64_t column_int64(sqlite3_stmt* stmt, int column);
[[nodiscard]] std::optional<std::int64_t> column_optional_int64(sqlite3_stmt* stmt, int column);

// Error for a failed statement prepare/step on this connection (kStoreResult).
[[nodiscard]] core::Error query_error(const SqliteDb& db, const std::string& context);

}  // namespace fetters::storage::sqlite
