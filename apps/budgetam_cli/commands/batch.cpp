#include "batch.h"

#include "budgetam/core/clock.h"

#include "batch_logic.h"
#include "command_support.h"
#include "shared/arg_parser.h"
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

struct BatchCliConfig {
  std::optional<std::string> manifest_path;
  std::optional<std::string> out_dir;
  std::optional<std::string> db_path;
  bool strict{false};
};

std::vector<budgetam::apps::Option<BatchCliConfig>> batch_cli_options() {
  return {
      {"--manifest", true, "JSON array of {year, source_type, path}",
       [](BatchCliConfig& c, const std::string& v) {
         c.manifest_path = v;
         return true;
       }},
      {"--out-dir", true, "Write record CSV and overall JSON for every dataset here",
       [](BatchCliConfig& c, const std::string& v) {
         c.out_dir = v;
         return true;
       }},
      {"--strict", false, "Treat failed warning checks as failures",
       [](BatchCliConfig& c, const std::string& /*v*/) {
         c.strict = true;
         return true;
       }},
      {"--db", true, "Persist every dataset and report into this SQLite database",
       [](BatchCliConfig& c, const std::string& v) {
         c.db_path = v;
         return true;
       }},
  };
}

}  // namespace

int cmd_batch(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const auto options = batch_cli_options();
  auto parsed = budgetam::apps::parse_options(argc, argv, options, 2);

  if (parsed.valid && (!parsed.positional.empty() || !parsed.config.manifest_path.has_value())) {
    std::cerr << "batch requires --manifest and takes no positional arguments\n";
    parsed.valid = false;
  }
  if (!parsed.valid) {
    std::cerr << "Usage: budgetam_cli batch --manifest <file> [options]\n";
    budgetam::apps::print_options(std::cerr, options);
    return kExitUsage;
  }

  const auto& config = parsed.config;
  auto items = budgetam::app::load_manifest(*config.manifest_path);
  if (!items.has_value()) {
    std::cerr << items.error() << "\n";
    return kExitUsage;
  }

  budgetam::app::BatchOptions batch_options;
  batch_options.out_dir = config.out_dir;
  batch_options.strict = config.strict;

  budgetam::core::ReportClock clock;

  if (!config.db_path.has_value()) {
    return execute_batch(items.value(), batch_options, clock);
  }

  auto store = open_dataset_store(*config.db_path);
  if (!store.has_value()) {
    std::cerr << "Failed to open database: " << store.error() << "\n";
    return kExitFailure;
  }
  batch_options.store = store.value().get();
  return execute_batch(items.value(), batch_options, clock);
}
