#include "parse.h"

#include "budgetam/core/clock.h"

#include "command_support.h"
#include "parse_logic.h"
#include "shared/arg_parser.h"
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

struct ParseCliConfig {
  std::optional<budgetam::domain::SourceType> source_type;
  std::optional<int> year;
  std::optional<std::string> out_dir;
  std::optional<std::string> db_path;
};

std::vector<budgetam::apps::Option<ParseCliConfig>> parse_cli_options() {
  return {
      {"--source-type", true, "Report series (BUDGET_LAW, SPENDING_Q1..Q1234, MTEP)",
       [](ParseCliConfig& c, const std::string& v) {
         return parse_source_type_flag(v, c.source_type);
       }},
      {"--year", true, "Budget year of the workbook",
       [](ParseCliConfig& c, const std::string& v) { return parse_year_flag(v, c.year); }},
      {"--out-dir", true, "Write <dataset_id>.csv and <dataset_id>_overall.json here",
       [](ParseCliConfig& c, const std::string& v) {
         c.out_dir = v;
         return true;
       }},
      {"--db", true, "Persist the dataset into this SQLite database",
       [](ParseCliConfig& c, const std::string& v) {
         c.db_path = v;
         return true;
       }},
  };
}

}  // namespace

int cmd_parse(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const auto options = parse_cli_options();
  auto parsed = budgetam::apps::parse_options(argc, argv, options, 2);

  if (parsed.valid && (parsed.positional.size() != 1 || !parsed.config.source_type.has_value() ||
                       !parsed.config.year.has_value())) {
    std::cerr << "parse requires one workbook path, --source-type and --year\n";
    parsed.valid = false;
  }
  if (!parsed.valid) {
    std::cerr << "Usage: budgetam_cli parse <workbook> --source-type <TYPE> --year <YEAR> "
                 "[options]\n";
    budgetam::apps::print_options(std::cerr, options);
    return kExitUsage;
  }

  const auto& config = parsed.config;
  const budgetam::app::ParsePipelineRequest req{parsed.positional.front(), *config.source_type,
                                                *config.year, config.out_dir};
  budgetam::core::ReportClock clock;

  if (!config.db_path.has_value()) {
    return execute_parse(req, nullptr, clock);
  }

  auto store = open_dataset_store(*config.db_path);
  if (!store.has_value()) {
    std::cerr << "Failed to open database: " << store.error() << "\n";
    return kExitFailure;
  }
  return execute_parse(req, store.value().get(), clock);
}
