#include "budgetam/output/dataset_writer.h"

#include <catch2/catch_test_macros.hpp>

#include "support/sheet_fixtures.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace budgetam;
using namespace budgetam::output;

namespace {

std::string read_text(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

}  // namespace

TEST_CASE("csv_escape quotes only when needed", "[output][csv]") {
  CHECK(csv_escape("plain") == "plain");
  CHECK(csv_escape("") == "");
  CHECK(csv_escape("a,b") == "\"a,b\"");
  CHECK(csv_escape("say \"hi\"") == "\"say \"\"hi\"\"\"");
  CHECK(csv_escape("two\nlines") == "\"two\nlines\"");
}

TEST_CASE("Budget-law records render in classic column order", "[output][csv]") {
  const std::string csv = render_records_csv(testing::budget_law_records(),
                                             domain::SourceType::kBudgetLaw,
                                             domain::Layout::kClassic);

  std::istringstream lines(csv);
  std::string header;
  std::string first;
  std::getline(lines, header);
  std::getline(lines, first);

  CHECK(header ==
        "state_body,program_code,program_name,program_goal,program_result_desc,"
        "subprogram_code,subprogram_name,subprogram_desc,subprogram_type,"
        "state_body_total,program_total,subprogram_total");
  CHECK(first == "State Body 1,1,Program 1,,,1,Subprogram 1,,,600000,300000,150000");

  // Header plus four records, each terminated by "\n".
  CHECK(std::count(csv.begin(), csv.end(), '\n') == 5);
  CHECK(csv.find('\r') == std::string::npos);
}

TEST_CASE("2025 records carry the extended program code", "[output][csv]") {
  auto record = testing::budget_law_record("Ministry, central", 1001, 11, 10.0, 10.0, 10.0);
  record.program_code_ext = 1001;

  const std::string csv =
      render_records_csv({record}, domain::SourceType::kBudgetLaw, domain::Layout::kBudget2025);

  CHECK(csv.rfind("state_body,state_body_total,program_code,program_code_ext,", 0) == 0);
  CHECK(csv.find("\"Ministry, central\",10,1001,1001,Program 1001,,,10,11,") !=
        std::string::npos);
}

TEST_CASE("Plan records leave out subprogram columns", "[output][csv]") {
  domain::FlattenedRecord record;
  record.state_body = "Ministry";
  record.program_code = 7;
  record.program_name = "Roads";
  record.state_body_amounts = domain::PlanAmounts{1.5, 2.0, 3.0};
  record.program_amounts = domain::PlanAmounts{1.5, 2.0, std::nullopt};
  record.subprogram_amounts = domain::PlanAmounts{};

  const std::string csv =
      render_records_csv({record}, domain::SourceType::kMtep, domain::Layout::kMtep);

  CHECK(csv ==
        "state_body,program_code,program_name,program_goal,program_result_desc,"
        "state_body_total_y0,state_body_total_y1,state_body_total_y2,"
        "program_total_y0,program_total_y1,program_total_y2\n"
        "Ministry,7,Roads,,,1.5,2,3,1.5,2,\n");
}

TEST_CASE("write_dataset writes the record table and overall totals", "[output][files]") {
  const std::filesystem::path tmp_dir =
      std::filesystem::temp_directory_path() / "budgetam_test_dataset_writer";
  std::filesystem::remove_all(tmp_dir);
  const std::string out_dir = (tmp_dir / "nested" / "out").string();

  const auto result = write_dataset(out_dir, "2023_BUDGET_LAW", testing::budget_law_records(),
                                    testing::budget_law_overall(), domain::SourceType::kBudgetLaw,
                                    domain::Layout::kClassic);
  REQUIRE(result.has_value());

  const WrittenFiles& files = result.value();
  CHECK(std::filesystem::path(files.records_csv).filename() == "2023_BUDGET_LAW.csv");
  CHECK(std::filesystem::path(files.overall_json).filename() == "2023_BUDGET_LAW_overall.json");

  CHECK(read_text(files.records_csv) ==
        render_records_csv(testing::budget_law_records(), domain::SourceType::kBudgetLaw,
                           domain::Layout::kClassic));

  const auto overall = nlohmann::json::parse(read_text(files.overall_json));
  CHECK(overall["overall_total"] == 1000000.0);

  std::filesystem::remove_all(tmp_dir);
}

TEST_CASE("write_dataset reports an unusable output directory", "[output][files]") {
  const std::filesystem::path tmp_dir =
      std::filesystem::temp_directory_path() / "budgetam_test_dataset_writer_blocked";
  std::filesystem::remove_all(tmp_dir);
  std::filesystem::create_directories(tmp_dir);
  const auto blocker = tmp_dir / "file";
  std::ofstream(blocker) << "not a directory";

  const auto result = write_dataset((blocker / "out").string(), "2023_BUDGET_LAW", {},
                                    testing::budget_law_overall(), domain::SourceType::kBudgetLaw,
                                    domain::Layout::kClassic);
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().rfind("Cannot create output directory", 0) == 0);

  std::filesystem::remove_all(tmp_dir);
}
