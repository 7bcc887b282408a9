#include "budgetam/app/batch_runner.h"
#include "budgetam/output/dataset_writer.h"
#include "budgetam/storage/sqlite/sqlite_dataset_store.h"
#include "budgetam/storage/sqlite/sqlite_db.h"

#include <catch2/catch_test_macros.hpp>

#include "support/sheet_fixtures.h"

#include <filesystem>
#include <fstream>

using namespace budgetam;
using namespace budgetam::app;

namespace {

// Write a worksheet as CSV so it goes through the same read path as a real file.
void write_csv(const std::filesystem::path& path, const ingest::Sheet& sheet) {
  std::ofstream out(path, std::ios::binary);
  for (const auto& row : sheet.rows) {
    for (std::size_t i = 0; i < row.cells.size(); ++i) {
      if (i > 0) {
        out << ',';
      }
      out << output::csv_escape(row.cells[i]);
    }
    out << '\n';
  }
}

class BatchFixture {
 public:
  BatchFixture() : dir_(std::filesystem::temp_directory_path() / "budgetam_test_batch") {
    std::filesystem::remove_all(dir_);
    std::filesystem::create_directories(dir_);

    write_csv(dir_ / "law_2023.csv", testing::budget_law_fixture().build());

    testing::ClassicSheetBuilder unbalanced = testing::budget_law_fixture();
    auto sheet = unbalanced.build();
    sheet.rows[0].cells[3] = "999";
    write_csv(dir_ / "law_2022.csv", sheet);

    write_csv(dir_ / "law_2021.csv", testing::make_sheet({{"", "", "State Body", "10"}}));

    // Balanced, but with a negative subprogram (a warning only).
    testing::ClassicSheetBuilder negative;
    negative.grand_total({"300"})
        .state_body("State Body 1", {"300"})
        .program("1", {"300"}, "Program One")
        .subprogram("1", {"350"}, "Subprogram 1")
        .subprogram("2", {"-50"}, "Subprogram 2")
        .state_body("State Body 2", {"0"})
        .program("2", {"0"}, "Program Two")
        .subprogram("3", {"0"}, "Subprogram 3")
        .program("3", {"0"}, "Program Three")
        .subprogram("4", {"0"}, "Subprogram 4");
    write_csv(dir_ / "law_2019.csv", negative.build());

    // Same workbook with a cp1251 state body name, which is not valid UTF-8.
    auto cp1251 = negative.build();
    cp1251.rows[1].cells[2] = "\xCC\xE8\xED";
    write_csv(dir_ / "law_2018.csv", cp1251);
  }

  ~BatchFixture() { std::filesystem::remove_all(dir_); }

  BatchFixture(const BatchFixture&) = delete;
  BatchFixture& operator=(const BatchFixture&) = delete;
  BatchFixture(BatchFixture&&) = delete;
  BatchFixture& operator=(BatchFixture&&) = delete;

  [[nodiscard]] std::string path(const std::string& name) const { return (dir_ / name).string(); }

 private:
  std::filesystem::path dir_;
};

}  // namespace

TEST_CASE("parse_manifest reads items in order", "[batch][manifest]") {
  const auto manifest = nlohmann::json::parse(R"([
    {"year": 2023, "source_type": "BUDGET_LAW", "path": "a.xlsx"},
    {"year": 2024, "source_type": "SPENDING_Q12", "path": "b.xlsx"}
  ])");

  auto items = parse_manifest(manifest);
  REQUIRE(items.has_value());
  REQUIRE(items.value().size() == 2);
  CHECK(items.value()[0].year == 2023);
  CHECK(items.value()[0].source_type == domain::SourceType::kBudgetLaw);
  CHECK(items.value()[1].source_type == domain::SourceType::kSpendingQ12);
  CHECK(items.value()[1].path == "b.xlsx");
}

TEST_CASE("parse_manifest rejects malformed manifests", "[batch][manifest]") {
  SECTION("not an array") {
    auto items = parse_manifest(nlohmann::json::object());
    REQUIRE_FALSE(items.has_value());
    CHECK(items.error() == "Manifest must be a JSON array");
  }

  SECTION("year is not an integer") {
    auto items = parse_manifest(nlohmann::json::parse(
        R"([{"year": 2023, "source_type": "MTEP", "path": "a"}, {"year": "x"}])"));
    REQUIRE_FALSE(items.has_value());
    CHECK(items.error() == "Manifest entry 1: 'year' must be an integer");
  }

  SECTION("unknown source type") {
    auto items = parse_manifest(
        nlohmann::json::parse(R"([{"year": 2023, "source_type": "Q5", "path": "a"}])"));
    REQUIRE_FALSE(items.has_value());
    CHECK(items.error() == "Manifest entry 0: unknown source type 'Q5'");
  }
}

TEST_CASE("load_manifest reports unreadable files", "[batch][manifest]") {
  auto items = load_manifest("/nonexistent/budgetam/manifest.json");
  REQUIRE_FALSE(items.has_value());
  CHECK(items.error() == "Cannot open manifest: /nonexistent/budgetam/manifest.json");
}

TEST_CASE("run_batch isolates failing items", "[batch][pipeline]") {
  BatchFixture fixture;
  const std::vector<BatchItem> items = {
      {2023, domain::SourceType::kBudgetLaw, fixture.path("law_2023.csv")},
      {2020, domain::SourceType::kBudgetLaw, fixture.path("missing.csv")},
      {2021, domain::SourceType::kBudgetLaw, fixture.path("law_2021.csv")},
      {2022, domain::SourceType::kBudgetLaw, fixture.path("law_2022.csv")},
  };
  core::ReportClock clock("2026-01-01T00:00:00Z");

  const auto outcomes = run_batch(items, BatchOptions{}, clock);
  REQUIRE(outcomes.size() == 4);

  CHECK(outcomes[0].ok);
  CHECK(outcomes[0].record_count == 4);
  CHECK(format_outcome(outcomes[0]) == "OK   2023_BUDGET_LAW  4 records, 0 errors, 0 warnings");

  CHECK_FALSE(outcomes[1].ok);
  CHECK(outcomes[1].reason.rfind("read: ", 0) == 0);

  CHECK_FALSE(outcomes[2].ok);
  CHECK(format_outcome(outcomes[2]) == "FAIL 2021_BUDGET_LAW  parse: Grand total row not found");

  CHECK_FALSE(outcomes[3].ok);
  CHECK(outcomes[3].record_count == 4);
  CHECK(outcomes[3].reason == "validation: 1 errors, 0 warnings");

  CHECK(count_failures(outcomes) == 3);
}

TEST_CASE("run_batch persists parsed datasets and reports", "[batch][sqlite]") {
  BatchFixture fixture;
  auto db_result = storage::sqlite::SqliteDb::open(":memory:");
  REQUIRE(db_result.has_value());
  auto db = db_result.value();
  REQUIRE(db->ensure_schema_v1().has_value());
  storage::sqlite::SqliteDatasetStore store(db);

  const std::vector<BatchItem> items = {
      {2023, domain::SourceType::kBudgetLaw, fixture.path("law_2023.csv")},
      {2021, domain::SourceType::kBudgetLaw, fixture.path("law_2021.csv")},
      {2022, domain::SourceType::kBudgetLaw, fixture.path("law_2022.csv")},
  };
  BatchOptions options;
  options.store = &store;
  core::ReportClock clock("2026-01-01T00:00:00Z");

  const auto outcomes = run_batch(items, options, clock);
  REQUIRE(count_failures(outcomes) == 2);

  // Datasets that parsed are stored even when validation failed.
  auto listed = store.list();
  REQUIRE(listed.has_value());
  REQUIRE(listed.value().size() == 2);
  CHECK(listed.value()[0].dataset_id == "2022_BUDGET_LAW");
  CHECK(listed.value()[1].dataset_id == "2023_BUDGET_LAW");

  auto report = store.latest_report("2022_BUDGET_LAW");
  REQUIRE(report.has_value());
  REQUIRE(report.value().has_value());
  CHECK(report.value().value()["summary"]["error_count"] == 1);
  CHECK(report.value().value()["metadata"]["generated_at"] == "2026-01-01T00:00:00Z");
}

TEST_CASE("Strict batches fail on warnings", "[batch][pipeline]") {
  BatchFixture fixture;
  const std::vector<BatchItem> items = {
      {2019, domain::SourceType::kBudgetLaw, fixture.path("law_2019.csv")},
  };
  core::ReportClock clock("2026-01-01T00:00:00Z");

  const auto lenient = run_batch(items, BatchOptions{}, clock);
  REQUIRE(lenient.size() == 1);
  CHECK(lenient[0].ok);
  CHECK(lenient[0].reason == "4 records, 0 errors, 1 warnings");

  BatchOptions options;
  options.strict = true;
  const auto strict = run_batch(items, options, clock);
  REQUIRE(strict.size() == 1);
  CHECK_FALSE(strict[0].ok);
  CHECK(strict[0].reason == "validation: 0 errors, 1 warnings");
}

TEST_CASE("Non-UTF-8 workbook text does not stop the batch", "[batch][sqlite]") {
  BatchFixture fixture;
  auto db_result = storage::sqlite::SqliteDb::open(":memory:");
  REQUIRE(db_result.has_value());
  auto db = db_result.value();
  REQUIRE(db->ensure_schema_v1().has_value());
  storage::sqlite::SqliteDatasetStore store(db);

  const std::vector<BatchItem> items = {
      {2018, domain::SourceType::kBudgetLaw, fixture.path("law_2018.csv")},
      {2023, domain::SourceType::kBudgetLaw, fixture.path("law_2023.csv")},
  };
  BatchOptions options;
  options.store = &store;
  core::ReportClock clock("2026-01-01T00:00:00Z");

  const auto outcomes = run_batch(items, options, clock);
  REQUIRE(outcomes.size() == 2);
  CHECK(format_outcome(outcomes[0]) == "OK   2018_BUDGET_LAW  4 records, 0 errors, 1 warnings");
  CHECK(outcomes[1].ok);

  // The report is stored with the invalid bytes replaced by U+FFFD.
  auto report = store.latest_report("2018_BUDGET_LAW");
  REQUIRE(report.has_value());
  REQUIRE(report.value().has_value());
  CHECK(report.value().value().dump().find("\xEF\xBF\xBD") != std::string::npos);
}
