#include "budgetam/storage/sqlite/sqlite_db.h"

#include <sqlite3.h>

namespace budgetam::storage::sqlite {

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

// Embedded schema v1 SQL
constexpr const char* kSchemaV1 = R"(
PRAGMA foreign_keys = ON;

CREATE TABLE IF NOT EXISTS schema_version (
  version INTEGER PRIMARY KEY,
  applied_at TEXT NOT NULL
);

CREATE TABLE IF NOT EXISTS datasets (
  dataset_id TEXT PRIMARY KEY,
  year INTEGER NOT NULL,
  source_type TEXT NOT NULL,
  source_path TEXT NOT NULL,
  fingerprint TEXT NOT NULL,
  overall_json TEXT NOT NULL,
  created_at TEXT NOT NULL
);

CREATE TABLE IF NOT EXISTS records (
  dataset_id TEXT NOT NULL,
  ordinal INTEGER NOT NULL,
  state_body TEXT NOT NULL,
  program_code INTEGER NOT NULL,
  program_code_ext INTEGER,
  program_name TEXT NOT NULL,
  program_goal TEXT NOT NULL,
  program_result_desc TEXT NOT NULL,
  subprogram_code INTEGER,
  subprogram_name TEXT NOT NULL,
  subprogram_desc TEXT NOT NULL,
  subprogram_type TEXT NOT NULL,
  amounts_json TEXT NOT NULL,
  PRIMARY KEY(dataset_id, ordinal),
  FOREIGN KEY(dataset_id) REFERENCES datasets(dataset_id)
    ON DELETE CASCADE
);

CREATE INDEX IF NOT EXISTS idx_records_program ON records(dataset_id, state_body, program_code);

CREATE TABLE IF NOT EXISTS validation_reports (
  report_id INTEGER PRIMARY KEY AUTOINCREMENT,
  dataset_id TEXT NOT NULL,
  report_json TEXT NOT NULL,
  created_at TEXT NOT NULL,
  FOREIGN KEY(dataset_id) REFERENCES datasets(dataset_id)
    ON DELETE CASCADE
);

INSERT OR IGNORE INTO schema_version (version, applied_at)
VALUES (1, datetime('now'));
)";

SqliteDb::SqliteDb(sqlite3* db) : db_(db) {}

core::Result<std::shared_ptr<SqliteDb>, std::string> SqliteDb::open(const std::string& path) {
  sqlite3* db = nullptr;
  int rc = sqlite3_open(path.c_str(), &db);
  if (rc != SQLITE_OK) {
    std::string error = db != nullptr ? sqlite3_errmsg(db) : "out of memory";
    sqlite3_close(db);
    return core::Result<std::shared_ptr<SqliteDb>, std::string>::err("Failed to open database: " +
                                                                     error);
  }

  char* err_msg = nullptr;
  rc = sqlite3_exec(db, "PRAGMA foreign_keys = ON;", nullptr, nullptr, &err_msg);
  if (rc != SQLITE_OK) {
    std::string error = err_msg != nullptr ? err_msg : "Unknown error";
    sqlite3_free(err_msg);
    sqlite3_close(db);
    return core::Result<std::shared_ptr<SqliteDb>, std::string>::err(
        "Failed to enable foreign keys: " + error);
  }

  return core::Result<std::shared_ptr<SqliteDb>, std::string>::ok(
      std::shared_ptr<SqliteDb>(new SqliteDb(db)));
}

int SqliteDb::get_schema_version() const {
  PreparedStatement stmt(db_.get(),
                         "SELECT version FROM schema_version ORDER BY version DESC LIMIT 1");
  if (!stmt.is_valid()) {
    return 0;  // Table doesn't exist yet
  }

  int version = 0;
  if (stmt.step() == SQLITE_ROW) {
    version = stmt.column_int(0);
  }
  return version;
}

core::Result<bool, std::string> SqliteDb::ensure_schema_v1() {
  if (get_schema_version() >= 1) {
    return core::Result<bool, std::string>::ok(true);
  }

  char* err_msg = nullptr;
  const int rc = sqlite3_exec(db_.get(), kSchemaV1, nullptr, nullptr, &err_msg);
  if (rc != SQLITE_OK) {
    std::string error = err_msg != nullptr ? err_msg : "Unknown error";
    sqlite3_free(err_msg);
    return core::Result<bool, std::string>::err("Failed to apply schema v1: " + error);
  }

  return core::Result<bool, std::string>::ok(true);
}

core::Result<bool, std::string> SqliteDb::exec(const std::string& sql) {
  char* err_msg = nullptr;
  const int rc = sqlite3_exec(db_.get(), sql.c_str(), nullptr, nullptr, &err_msg);
  if (rc != SQLITE_OK) {
    std::string error = err_msg != nullptr ? err_msg : "Unknown error";
    sqlite3_free(err_msg);
    return core::Result<bool, std::string>::err("SQL execution failed: " + error);
  }

  return core::Result<bool, std::string>::ok(true);
}

std::string SqliteDb::last_error() const {
  return sqlite3_errmsg(db_.get());
}

Transaction::~Transaction() {
  if (open_) {
    // A destructor cannot report; the unfinished work is discarded.
    sqlite3_exec(db_.connection(), "ROLLBACK", nullptr, nullptr, nullptr);
  }
}

core::Result<bool, std::string> Transaction::begin() {
  auto begun = db_.exec("BEGIN TRANSACTION");
  if (begun.has_value()) {
    open_ = true;
  }
  return begun;
}

core::Result<bool, std::string> Transaction::commit() {
  auto committed = db_.exec("COMMIT");
  if (!committed.has_value()) {
    return rollback(committed.error());
  }
  open_ = false;
  return committed;
}

core::Result<bool, std::string> Transaction::rollback(const std::string& error) {
  if (!open_) {
    return core::Result<bool, std::string>::err(error);
  }
  open_ = false;
  auto rolled_back = db_.exec("ROLLBACK");
  if (!rolled_back.has_value()) {
    return core::Result<bool, std::string>::err(error + " (" + rolled_back.error() + ")");
  }
  return core::Result<bool, std::string>::err(error);
}

PreparedStatement::PreparedStatement(sqlite3* db, const std::string& sql) {
  sqlite3_stmt* raw_stmt = nullptr;
  const int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &raw_stmt, nullptr);
  if (rc != SQLITE_OK) {
    error_ = sqlite3_errmsg(db);
    sqlite3_finalize(raw_stmt);
  } else {
    stmt_.reset(raw_stmt);
  }
}

void PreparedStatement::bind_text(const int index, const std::string& value) {
  sqlite3_bind_text(stmt_.get(), index, value.c_str(), static_cast<int>(value.size()),
                    SQLITE_TRANSIENT);
}

void PreparedStatement::bind_int(const int index, const int value) {
  sqlite3_bind_int(stmt_.get(), index, value);
}

void PreparedStatement::bind_optional_int(const int index, const std::optional<int>& value) {
  if (value.has_value()) {
    sqlite3_bind_int(stmt_.get(), index, *value);
  } else {
    sqlite3_bind_null(stmt_.get(), index);
  }
}

int PreparedStatement::step() {
  return sqlite3_step(stmt_.get());
}

std::string PreparedStatement::column_text(const int column) const {
  const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt_.get(), column));
  if (text == nullptr) {
    return {};
  }
  return std::string(text, static_cast<std::size_t>(sqlite3_column_bytes(stmt_.get(), column)));
}

int PreparedStatement::column_int(const int column) const {
  return sqlite3_column_int(stmt_.get(), column);
}

long long PreparedStatement::column_int64(const int column) const {
  return sqlite3_column_int64(stmt_.get(), column);
}

std::optional<int> PreparedStatement::column_optional_int(const int column) const {
  if (sqlite3_column_type(stmt_.get(), column) == SQLITE_NULL) {
    return std::nullopt;
  }
  return sqlite3_column_int(stmt_.get(), column);
}

void PreparedStatement::reset() {
  if (stmt_) {
    sqlite3_reset(stmt_.get());
    sqlite3_clear_bindings(stmt_.get());
  }
}

}  // namespace budgetam::storage::sqlite
