#include "budgetam/storage/sqlite/sqlite_dataset_store.h"
#include "budgetam/storage/sqlite/sqlite_db.h"

#include <catch2/catch_test_macros.hpp>

#include "support/sheet_fixtures.h"

#include <string>

using namespace budgetam;
using storage::StoredDataset;
using storage::sqlite::SqliteDatasetStore;
using storage::sqlite::SqliteDb;
using storage::sqlite::Transaction;

namespace {

std::shared_ptr<SqliteDb> open_memory_db() {
  auto db_result = SqliteDb::open(":memory:");
  REQUIRE(db_result.has_value());
  auto db = db_result.value();
  REQUIRE(db->ensure_schema_v1().has_value());
  return db;
}

StoredDataset budget_law_dataset() {
  StoredDataset dataset;
  dataset.dataset_id = domain::dataset_id(2023, domain::SourceType::kBudgetLaw);
  dataset.year = 2023;
  dataset.source_type = domain::SourceType::kBudgetLaw;
  dataset.source_path = "raw/2023.xlsx";
  dataset.fingerprint = "fp-2023";
  dataset.created_at = "2026-01-01T00:00:00Z";
  dataset.records = testing::budget_law_records();
  dataset.overall = testing::budget_law_overall();
  return dataset;
}

}  // namespace

TEST_CASE("Schema is created once", "[sqlite][schema]") {
  auto db = open_memory_db();
  CHECK(db->get_schema_version() == 1);

  // Idempotent.
  REQUIRE(db->ensure_schema_v1().has_value());
}

TEST_CASE("Unfinished transactions are rolled back", "[sqlite][transaction]") {
  auto db = open_memory_db();
  SqliteDatasetStore store(db);
  const std::string insert =
      "INSERT INTO datasets VALUES ('d1', 2023, 'BUDGET_LAW', 'p', 'f', '{}', 't')";

  SECTION("destructor without commit") {
    {
      Transaction tx(*db);
      REQUIRE(tx.begin().has_value());
      REQUIRE(db->exec(insert).has_value());
    }
    auto listed = store.list();
    REQUIRE(listed.has_value());
    CHECK(listed.value().empty());
  }

  SECTION("explicit rollback keeps the original error") {
    Transaction tx(*db);
    REQUIRE(tx.begin().has_value());
    REQUIRE(db->exec(insert).has_value());
    auto rolled_back = tx.rollback("insert failed");
    REQUIRE_FALSE(rolled_back.has_value());
    CHECK(rolled_back.error() == "insert failed");
    CHECK(store.list().value().empty());
  }

  SECTION("commit keeps the work") {
    Transaction tx(*db);
    REQUIRE(tx.begin().has_value());
    REQUIRE(db->exec(insert).has_value());
    REQUIRE(tx.commit().has_value());
    CHECK(store.list().value().size() == 1);
  }
}

TEST_CASE("SqliteDatasetStore roundtrip", "[sqlite][store]") {
  SqliteDatasetStore store(open_memory_db());
  const StoredDataset original = budget_law_dataset();

  REQUIRE(store.save(original).has_value());

  auto loaded = store.load("2023_BUDGET_LAW");
  REQUIRE(loaded.has_value());
  REQUIRE(loaded.value().has_value());
  const StoredDataset& dataset = loaded.value().value();

  CHECK(dataset.year == 2023);
  CHECK(dataset.source_type == domain::SourceType::kBudgetLaw);
  CHECK(dataset.source_path == "raw/2023.xlsx");
  CHECK(dataset.fingerprint == "fp-2023");
  CHECK(dataset.created_at == "2026-01-01T00:00:00Z");
  CHECK(domain::amount_of(dataset.overall.amounts, domain::AmountField::kTotal) == 1000000.0);

  REQUIRE(dataset.records.size() == 4);
  // Output order is preserved.
  CHECK(dataset.records[0].subprogram_code == 1);
  CHECK(dataset.records[3].subprogram_code == 4);
  CHECK(dataset.records[3].state_body == "State Body 2");
  CHECK(dataset.records[2].program_name == "Program 2");
  CHECK_FALSE(dataset.records[0].program_code_ext.has_value());
  CHECK(domain::amount_of(dataset.records[2].subprogram_amounts, domain::AmountField::kTotal) ==
        300000.0);
}

TEST_CASE("Loading an unknown dataset yields nullopt", "[sqlite][store]") {
  SqliteDatasetStore store(open_memory_db());

  auto loaded = store.load("1999_MTEP");
  REQUIRE(loaded.has_value());
  CHECK_FALSE(loaded.value().has_value());
}

TEST_CASE("Saving the same dataset id replaces its records", "[sqlite][store]") {
  SqliteDatasetStore store(open_memory_db());
  StoredDataset dataset = budget_law_dataset();
  REQUIRE(store.save(dataset).has_value());

  dataset.records.resize(1);
  dataset.fingerprint = "fp-2023-b";
  REQUIRE(store.save(dataset).has_value());

  auto loaded = store.load(dataset.dataset_id);
  REQUIRE(loaded.has_value());
  REQUIRE(loaded.value().has_value());
  CHECK(loaded.value()->records.size() == 1);
  CHECK(loaded.value()->fingerprint == "fp-2023-b");
}

TEST_CASE("Plan datasets keep forecast years and null amounts", "[sqlite][store]") {
  SqliteDatasetStore store(open_memory_db());

  domain::FlattenedRecord record;
  record.state_body = "Ministry";
  record.program_code = 1001;
  record.program_name = "Roads";
  record.state_body_amounts = domain::PlanAmounts{10.0, 20.0, 30.0};
  record.program_amounts = domain::PlanAmounts{10.0, std::nullopt, 30.0};
  record.subprogram_amounts = domain::PlanAmounts{};

  StoredDataset dataset;
  dataset.dataset_id = domain::dataset_id(2024, domain::SourceType::kMtep);
  dataset.year = 2024;
  dataset.source_type = domain::SourceType::kMtep;
  dataset.created_at = "2026-01-01T00:00:00Z";
  dataset.records = {record};
  dataset.overall = domain::OverallTotals{domain::PlanAmounts{10.0, 20.0, 30.0}, {2024, 2025, 2026}};
  REQUIRE(store.save(dataset).has_value());

  auto loaded = store.load("2024_MTEP");
  REQUIRE(loaded.has_value());
  REQUIRE(loaded.value().has_value());
  const StoredDataset& restored = loaded.value().value();

  CHECK(restored.overall.plan_years == std::vector<int>{2024, 2025, 2026});
  REQUIRE(restored.records.size() == 1);
  CHECK_FALSE(restored.records[0].subprogram_code.has_value());
  CHECK(domain::amount_of(restored.records[0].program_amounts, domain::AmountField::kTotalY0) ==
        10.0);
  CHECK_FALSE(domain::amount_of(restored.records[0].program_amounts, domain::AmountField::kTotalY1)
                  .has_value());
}

TEST_CASE("list orders datasets by id", "[sqlite][store]") {
  SqliteDatasetStore store(open_memory_db());

  StoredDataset later = budget_law_dataset();
  later.dataset_id = domain::dataset_id(2024, domain::SourceType::kBudgetLaw);
  later.year = 2024;
  later.records.resize(2);
  REQUIRE(store.save(later).has_value());
  REQUIRE(store.save(budget_law_dataset()).has_value());

  auto listed = store.list();
  REQUIRE(listed.has_value());
  REQUIRE(listed.value().size() == 2);
  CHECK(listed.value()[0].dataset_id == "2023_BUDGET_LAW");
  CHECK(listed.value()[0].record_count == 4);
  CHECK(listed.value()[1].dataset_id == "2024_BUDGET_LAW");
  CHECK(listed.value()[1].year == 2024);
  CHECK(listed.value()[1].record_count == 2);
}

TEST_CASE("Validation reports are appended per dataset", "[sqlite][store]") {
  SqliteDatasetStore store(open_memory_db());
  REQUIRE(store.save(budget_law_dataset()).has_value());

  auto none = store.latest_report("2023_BUDGET_LAW");
  REQUIRE(none.has_value());
  CHECK_FALSE(none.value().has_value());

  REQUIRE(store.save_report("2023_BUDGET_LAW", {{"run", 1}}, "2026-01-01T00:00:00Z").has_value());
  REQUIRE(store.save_report("2023_BUDGET_LAW", {{"run", 2}}, "2026-01-02T00:00:00Z").has_value());

  auto latest = store.latest_report("2023_BUDGET_LAW");
  REQUIRE(latest.has_value());
  REQUIRE(latest.value().has_value());
  CHECK(latest.value().value()["run"] == 2);
}

TEST_CASE("Reports require a saved dataset", "[sqlite][store]") {
  SqliteDatasetStore store(open_memory_db());

  auto result = store.save_report("2030_BUDGET_LAW", {{"run", 1}}, "2026-01-01T00:00:00Z");
  CHECK_FALSE(result.has_value());
}
