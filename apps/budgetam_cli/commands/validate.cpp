#include "validate.h"

#include "budgetam/core/clock.h"

#include "command_support.h"
#include "shared/arg_parser.h"
#include "validate_logic.h"
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

struct ValidateCliConfig {
  std::optional<budgetam::domain::SourceType> source_type;
  std::optional<int> year;
  bool strict{false};
  ValidateOutputs outputs;
  std::optional<std::string> db_path;
};

std::vector<budgetam::apps::Option<ValidateCliConfig>> validate_cli_options() {
  return {
      {"--source-type", true, "Report series (BUDGET_LAW, SPENDING_Q1..Q1234, MTEP)",
       [](ValidateCliConfig& c, const std::string& v) {
         return parse_source_type_flag(v, c.source_type);
       }},
      {"--year", true, "Budget year of the workbook",
       [](ValidateCliConfig& c, const std::string& v) { return parse_year_flag(v, c.year); }},
      {"--strict", false, "Treat failed warning checks as failures",
       [](ValidateCliConfig& c, const std::string& /*v*/) {
         c.strict = true;
         return true;
       }},
      {"--report-md", true, "Write the Markdown report to this file",
       [](ValidateCliConfig& c, const std::string& v) {
         c.outputs.report_md = v;
         return true;
       }},
      {"--report-json", true, "Write the JSON report to this file",
       [](ValidateCliConfig& c, const std::string& v) {
         c.outputs.report_json = v;
         return true;
       }},
      {"--db", true, "Persist the dataset and its report into this SQLite database",
       [](ValidateCliConfig& c, const std::string& v) {
         c.db_path = v;
         return true;
       }},
  };
}

}  // namespace

int cmd_validate(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const auto options = validate_cli_options();
  auto parsed = budgetam::apps::parse_options(argc, argv, options, 2);

  if (parsed.valid && (parsed.positional.size() != 1 || !parsed.config.source_type.has_value() ||
                       !parsed.config.year.has_value())) {
    std::cerr << "validate requires one workbook path, --source-type and --year\n";
    parsed.valid = false;
  }
  if (!parsed.valid) {
    std::cerr << "Usage: budgetam_cli validate <workbook> --source-type <TYPE> --year <YEAR> "
                 "[options]\n";
    budgetam::apps::print_options(std::cerr, options);
    return kExitUsage;
  }

  const auto& config = parsed.config;
  const budgetam::app::ParsePipelineRequest req{parsed.positional.front(), *config.source_type,
                                                *config.year, std::nullopt};
  budgetam::core::ReportClock clock;

  if (!config.db_path.has_value()) {
    return execute_validate(req, config.strict, config.outputs, nullptr, clock);
  }

  auto store = open_dataset_store(*config.db_path);
  if (!store.has_value()) {
    std::cerr << "Failed to open database: " << store.error() << "\n";
    return kExitFailure;
  }
  return execute_validate(req, config.strict, config.outputs, store.value().get(), clock);
}
