#include "budgetam/storage/sqlite/sqlite_dataset_store.h"

#include <sqlite3.h>

#include <utility>

namespace budgetam::storage::sqlite {

namespace {

nlohmann::json record_amounts_json(const domain::FlattenedRecord& record) {
  nlohmann::json j;
  j["state_body"] = domain::amounts_to_json(record.state_body_amounts);
  j["program"] = domain::amounts_to_json(record.program_amounts);
  j["subprogram"] = domain::amounts_to_json(record.subprogram_amounts);
  return j;
}

domain::LevelAmounts amounts_or_empty(const nlohmann::json& j, const char* key,
                                      const domain::SourceKind kind) {
  if (!j.contains(key)) {
    return domain::make_amounts(kind);
  }
  return domain::amounts_from_json(j.at(key), kind);
}

}  // namespace

SqliteDatasetStore::SqliteDatasetStore(std::shared_ptr<SqliteDb> db) : db_(std::move(db)) {}

core::Result<bool, std::string> SqliteDatasetStore::save(const StoredDataset& dataset) {
  Transaction tx(*db_);
  auto begun = tx.begin();
  if (!begun.has_value()) {
    return begun;
  }

  // Upsert the dataset row; REPLACE would cascade-delete stored reports.
  PreparedStatement upsert(db_->connection(), R"(
    INSERT INTO datasets (dataset_id, year, source_type, source_path, fingerprint,
                          overall_json, created_at)
    VALUES (?, ?, ?, ?, ?, ?, ?)
    ON CONFLICT(dataset_id) DO UPDATE SET
      year = excluded.year,
      source_type = excluded.source_type,
      source_path = excluded.source_path,
      fingerprint = excluded.fingerprint,
      overall_json = excluded.overall_json,
      created_at = excluded.created_at
  )");
  if (!upsert.is_valid()) {
    return tx.rollback("Failed to prepare dataset upsert: " + upsert.error());
  }

  upsert.bind_text(1, dataset.dataset_id);
  upsert.bind_int(2, dataset.year);
  upsert.bind_text(3, domain::source_type_to_string(dataset.source_type));
  upsert.bind_text(4, dataset.source_path);
  upsert.bind_text(5, dataset.fingerprint);
  upsert.bind_text(6, domain::json_text(domain::overall_to_json(dataset.overall)));
  upsert.bind_text(7, dataset.created_at);

  if (upsert.step() != SQLITE_DONE) {
    return tx.rollback("Failed to save dataset " + dataset.dataset_id + ": " +
                       db_->last_error());
  }

  PreparedStatement clear(db_->connection(), "DELETE FROM records WHERE dataset_id = ?");
  if (!clear.is_valid()) {
    return tx.rollback("Failed to prepare record delete: " + clear.error());
  }
  clear.bind_text(1, dataset.dataset_id);
  if (clear.step() != SQLITE_DONE) {
    return tx.rollback("Failed to clear records of " + dataset.dataset_id + ": " +
                       db_->last_error());
  }

  PreparedStatement insert(db_->connection(), R"(
    INSERT INTO records (dataset_id, ordinal, state_body, program_code, program_code_ext,
                         program_name, program_goal, program_result_desc, subprogram_code,
                         subprogram_name, subprogram_desc, subprogram_type, amounts_json)
    VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
  )");
  if (!insert.is_valid()) {
    return tx.rollback("Failed to prepare record insert: " + insert.error());
  }

  int ordinal = 0;
  for (const auto& record : dataset.records) {
    insert.reset();
    insert.bind_text(1, dataset.dataset_id);
    insert.bind_int(2, ordinal);
    insert.bind_text(3, record.state_body);
    insert.bind_int(4, record.program_code);
    insert.bind_optional_int(5, record.program_code_ext);
    insert.bind_text(6, record.program_name);
    insert.bind_text(7, record.program_goal);
    insert.bind_text(8, record.program_result_desc);
    insert.bind_optional_int(9, record.subprogram_code);
    insert.bind_text(10, record.subprogram_name);
    insert.bind_text(11, record.subprogram_desc);
    insert.bind_text(12, record.subprogram_type);
    insert.bind_text(13, domain::json_text(record_amounts_json(record)));

    if (insert.step() != SQLITE_DONE) {
      return tx.rollback("Failed to insert record " + std::to_string(ordinal) + " of " +
                         dataset.dataset_id + ": " + db_->last_error());
    }
    ++ordinal;
  }

  return tx.commit();
}

core::Result<std::optional<StoredDataset>, std::string> SqliteDatasetStore::load(
    const std::string& dataset_id) const {
  using LoadResult = core::Result<std::optional<StoredDataset>, std::string>;

  PreparedStatement stmt(db_->connection(), R"(
    SELECT dataset_id, year, source_type, source_path, fingerprint, overall_json, created_at
    FROM datasets WHERE dataset_id = ?
  )");
  if (!stmt.is_valid()) {
    return LoadResult::err("Failed to prepare dataset query: " + stmt.error());
  }
  stmt.bind_text(1, dataset_id);

  const int rc = stmt.step();
  if (rc == SQLITE_DONE) {
    return LoadResult::ok(std::nullopt);
  }
  if (rc != SQLITE_ROW) {
    return LoadResult::err("Failed to read dataset " + dataset_id + ": " + db_->last_error());
  }

  StoredDataset dataset;
  dataset.dataset_id = stmt.column_text(0);
  dataset.year = stmt.column_int(1);

  const std::string type_text = stmt.column_text(2);
  const auto type = domain::source_type_from_string(type_text);
  if (!type.has_value()) {
    return LoadResult::err("Dataset " + dataset_id + " has unknown source type '" + type_text +
                           "'");
  }
  dataset.source_type = *type;
  dataset.source_path = stmt.column_text(3);
  dataset.fingerprint = stmt.column_text(4);
  dataset.created_at = stmt.column_text(6);

  const domain::SourceKind kind = domain::source_kind_of(dataset.source_type);
  try {
    dataset.overall = domain::overall_from_json(nlohmann::json::parse(stmt.column_text(5)),
                                                kind);
  } catch (const nlohmann::json::exception& e) {
    return LoadResult::err("Dataset " + dataset_id + " has malformed overall totals: " +
                           e.what());
  }

  auto records = load_records(dataset_id, kind);
  if (!records.has_value()) {
    return LoadResult::err(records.error());
  }
  dataset.records = std::move(records.value());

  return LoadResult::ok(std::move(dataset));
}

core::Result<std::vector<domain::FlattenedRecord>, std::string> SqliteDatasetStore::load_records(
    const std::string& dataset_id, const domain::SourceKind kind) const {
  using RecordsResult = core::Result<std::vector<domain::FlattenedRecord>, std::string>;

  PreparedStatement stmt(db_->connection(), R"(
    SELECT state_body, program_code, program_code_ext, program_name, program_goal,
           program_result_desc, subprogram_code, subprogram_name, subprogram_desc,
           subprogram_type, amounts_json
    FROM records WHERE dataset_id = ? ORDER BY ordinal ASC
  )");
  if (!stmt.is_valid()) {
    return RecordsResult::err("Failed to prepare record query: " + stmt.error());
  }
  stmt.bind_text(1, dataset_id);

  std::vector<domain::FlattenedRecord> records;
  int rc = SQLITE_ROW;
  while ((rc = stmt.step()) == SQLITE_ROW) {
    domain::FlattenedRecord record;
    record.state_body = stmt.column_text(0);
    record.program_code = stmt.column_int(1);
    record.program_code_ext = stmt.column_optional_int(2);
    record.program_name = stmt.column_text(3);
    record.program_goal = stmt.column_text(4);
    record.program_result_desc = stmt.column_text(5);
    record.subprogram_code = stmt.column_optional_int(6);
    record.subprogram_name = stmt.column_text(7);
    record.subprogram_desc = stmt.column_text(8);
    record.subprogram_type = stmt.column_text(9);

    try {
      const auto amounts = nlohmann::json::parse(stmt.column_text(10));
      record.state_body_amounts = amounts_or_empty(amounts, "state_body", kind);
      record.program_amounts = amounts_or_empty(amounts, "program", kind);
      record.subprogram_amounts = amounts_or_empty(amounts, "subprogram", kind);
    } catch (const nlohmann::json::exception& e) {
      return RecordsResult::err("Record " + std::to_string(records.size()) + " of " + dataset_id +
                                " has malformed amounts: " + e.what());
    }
    records.push_back(std::move(record));
  }
  if (rc != SQLITE_DONE) {
    return RecordsResult::err("Failed to read records of " + dataset_id + ": " +
                              db_->last_error());
  }

  return RecordsResult::ok(std::move(records));
}

core::Result<std::vector<DatasetSummary>, std::string> SqliteDatasetStore::list() const {
  using ListResult = core::Result<std::vector<DatasetSummary>, std::string>;

  PreparedStatement stmt(db_->connection(), R"(
    SELECT d.dataset_id, d.year, d.source_type, d.created_at,
           (SELECT COUNT(*) FROM records r WHERE r.dataset_id = d.dataset_id)
    FROM datasets d ORDER BY d.dataset_id ASC
  )");
  if (!stmt.is_valid()) {
    return ListResult::err("Failed to prepare dataset listing: " + stmt.error());
  }

  std::vector<DatasetSummary> summaries;
  int rc = SQLITE_ROW;
  while ((rc = stmt.step()) == SQLITE_ROW) {
    DatasetSummary summary;
    summary.dataset_id = stmt.column_text(0);
    summary.year = stmt.column_int(1);
    const std::string type_text = stmt.column_text(2);
    const auto type = domain::source_type_from_string(type_text);
    if (!type.has_value()) {
      return ListResult::err("Dataset " + summary.dataset_id + " has unknown source type '" +
                             type_text + "'");
    }
    summary.source_type = *type;
    summary.created_at = stmt.column_text(3);
    summary.record_count = static_cast<std::size_t>(stmt.column_int64(4));
    summaries.push_back(std::move(summary));
  }
  if (rc != SQLITE_DONE) {
    return ListResult::err("Failed to list datasets: " + db_->last_error());
  }

  return ListResult::ok(std::move(summaries));
}

core::Result<bool, std::string> SqliteDatasetStore::save_report(const std::string& dataset_id,
                                                                const nlohmann::json& report,
                                                                const std::string& created_at) {
  PreparedStatement stmt(db_->connection(), R"(
    INSERT INTO validation_reports (dataset_id, report_json, created_at) VALUES (?, ?, ?)
  )");
  if (!stmt.is_valid()) {
    return core::Result<bool, std::string>::err("Failed to prepare report insert: " +
                                                stmt.error());
  }
  stmt.bind_text(1, dataset_id);
  stmt.bind_text(2, domain::json_text(report));
  stmt.bind_text(3, created_at);

  if (stmt.step() != SQLITE_DONE) {
    return core::Result<bool, std::string>::err("Failed to save report for " + dataset_id + ": " +
                                                db_->last_error());
  }
  return core::Result<bool, std::string>::ok(true);
}

core::Result<std::optional<nlohmann::json>, std::string> SqliteDatasetStore::latest_report(
    const std::string& dataset_id) const {
  using ReportResult = core::Result<std::optional<nlohmann::json>, std::string>;

  PreparedStatement stmt(db_->connection(), R"(
    SELECT report_json FROM validation_reports
    WHERE dataset_id = ? ORDER BY report_id DESC LIMIT 1
  )");
  if (!stmt.is_valid()) {
    return ReportResult::err("Failed to prepare report query: " + stmt.error());
  }
  stmt.bind_text(1, dataset_id);

  const int rc = stmt.step();
  if (rc == SQLITE_DONE) {
    return ReportResult::ok(std::nullopt);
  }
  if (rc != SQLITE_ROW) {
    return ReportResult::err("Failed to read report for " + dataset_id + ": " +
                             db_->last_error());
  }

  try {
    return ReportResult::ok(nlohmann::json::parse(stmt.column_text(0)));
  } catch (const nlohmann::json::exception& e) {
    return ReportResult::err("Stored report for " + dataset_id + " is malformed: " + e.what());
  }
}

}  // namespace budgetam::storage::sqlite
