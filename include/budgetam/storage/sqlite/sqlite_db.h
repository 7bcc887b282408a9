#pragma once

#include "budgetam/core/result.h"

#include <memory>
#include <optional>
#include <string>

// Forward declare sqlite3 to avoid exposing SQLite header in public API
struct sqlite3;
struct sqlite3_stmt;

namespace budgetam::storage::sqlite {

// SqliteDb owns one SQLite connection with foreign keys enabled, and applies the
// dataset schema (datasets, records, validation_reports). Errors come back as
// Result<T, std::string>. A connection is not shared across threads.
class SqliteDb {
 public:
  // Open or create database at path. ":memory:" creates an in-memory database.
  [[nodiscard]] static core::Result<std::shared_ptr<SqliteDb>, std::string> open(
      const std::string& path);

  ~SqliteDb() = default;

  SqliteDb(const SqliteDb&) = delete;
  SqliteDb& operator=(const SqliteDb&) = delete;
  SqliteDb(SqliteDb&&) = delete;
  SqliteDb& operator=(SqliteDb&&) = delete;

  // 0 until ensure_schema_v1() has run
  [[nodiscard]] int get_schema_version() const;

  [[nodiscard]] core::Result<bool, std::string> ensure_schema_v1();

  [[nodiscard]] core::Result<bool, std::string> exec(const std::string& sql);

  // Message of the most recent failed call on this connection
  [[nodiscard]] std::string last_error() const;

  [[nodiscard]] sqlite3* connection() const { return db_.get(); }

 private:
  struct SqliteDeleter {
    void operator()(sqlite3* db) const;
  };

  explicit SqliteDb(sqlite3* db);

  std::unique_ptr<sqlite3, SqliteDeleter> db_;
};

// Transaction wraps BEGIN / COMMIT on one connection. A transaction that was begun
// and neither committed nor rolled back is rolled back by the destructor.
class Transaction {
 public:
  explicit Transaction(SqliteDb& db) : db_(db) {}
  ~Transaction();

  Transaction(const Transaction&) = delete;
  Transaction& operator=(const Transaction&) = delete;
  Transaction(Transaction&&) = delete;
  Transaction& operator=(Transaction&&) = delete;

  [[nodiscard]] core::Result<bool, std::string> begin();
  [[nodiscard]] core::Result<bool, std::string> commit();

  // Roll back and return error, extended with the rollback failure if there is one.
  [[nodiscard]] core::Result<bool, std::string> rollback(const std::string& error);

 private:
  SqliteDb& db_;
  bool open_{false};
};

// Prepared statement with typed binds (1-based) and column reads (0-based).
// Text is bound as a transient copy.
class PreparedStatement {
 public:
  PreparedStatement(sqlite3* db, const std::string& sql);
  ~PreparedStatement() = default;

  PreparedStatement(const PreparedStatement&) = delete;
  PreparedStatement& operator=(const PreparedStatement&) = delete;
  PreparedStatement(PreparedStatement&&) = delete;
  PreparedStatement& operator=(PreparedStatement&&) = delete;

  [[nodiscard]] bool is_valid() const { return stmt_ != nullptr; }
  [[nodiscard]] std::string error() const { return error_; }
  [[nodiscard]] sqlite3_stmt* get() const { return stmt_.get(); }

  void bind_text(int index, const std::string& value);
  void bind_int(int index, int value);
  void bind_optional_int(int index, const std::optional<int>& value);

  // sqlite3_step result code (SQLITE_ROW, SQLITE_DONE or an error)
  [[nodiscard]] int step();

  // Empty string for NULL
  [[nodiscard]] std::string column_text(int column) const;
  [[nodiscard]] int column_int(int column) const;
  [[nodiscard]] long long column_int64(int column) const;
  [[nodiscard]] std::optional<int> column_optional_int(int column) const;

  // Reset statement and clear bindings for reuse
  void reset();

 private:
  struct StmtDeleter {
    void operator()(sqlite3_stmt* stmt) const;
  };

  std::unique_ptr<sqlite3_stmt, StmtDeleter> stmt_;
  std::string error_;
};

}  // namespace budgetam::storage::sqlite
