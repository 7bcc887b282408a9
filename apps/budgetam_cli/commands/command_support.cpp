#include "command_support.h"

#include "budgetam/storage/sqlite/sqlite_db.h"

#include <charconv>
#include <iostream>

bool parse_source_type_flag(const std::string& value,
                            std::optional<budgetam::domain::SourceType>& out) {
  const auto type = budgetam::domain::source_type_from_string(value);
  if (!type.has_value()) {
    std::cerr << "Invalid --source-type: " << value
              << " (valid: BUDGET_LAW, SPENDING_Q1, SPENDING_Q12, SPENDING_Q123, "
                 "SPENDING_Q1234, MTEP)\n";
    return false;
  }
  out = type;
  return true;
}

bool parse_year_flag(const std::string& value, std::optional<int>& out) {
  int year = 0;
  const char* end = value.data() + value.size();
  const auto [ptr, ec] = std::from_chars(value.data(), end, year);
  if (ec != std::errc() || ptr != end || year < 1900 || year > 2100) {
    std::cerr << "Invalid --year: " << value << "\n";
    return false;
  }
  out = year;
  return true;
}

budgetam::core::Result<std::unique_ptr<budgetam::storage::sqlite::SqliteDatasetStore>, std::string>
open_dataset_store(const std::string& db_path) {
  using StoreResult =
      budgetam::core::Result<std::unique_ptr<budgetam::storage::sqlite::SqliteDatasetStore>,
                             std::string>;

  auto db_result = budgetam::storage::sqlite::SqliteDb::open(db_path);
  if (!db_result.has_value()) {
    return StoreResult::err(db_result.error());
  }

  auto db = db_result.value();
  auto schema_result = db->ensure_schema_v1();
  if (!schema_result.has_value()) {
    return StoreResult::err(schema_result.error());
  }

  return StoreResult::ok(std::make_unique<budgetam::storage::sqlite::SqliteDatasetStore>(db));
}

void print_diagnostics(const budgetam::parsing::ParseDiagnostics& diagnostics) {
  for (const auto& warning : diagnostics.warnings()) {
    std::cerr << "warning: " << warning.message << "\n";
  }
  if (diagnostics.skipped_rows() > 0) {
    std::cerr << "Skipped rows: " << diagnostics.skipped_rows() << "\n";
  }
}
