#include "parse_logic.h"

#include "command_support.h"

#include <nlohmann/json.hpp>

#include <iostream>

int execute_parse(const budgetam::app::ParsePipelineRequest& req,
                  budgetam::storage::IDatasetStore* store,
                  const budgetam::core::ReportClock& clock) {
  std::cerr << "Parsing " << req.input_path << " as "
            << budgetam::domain::source_type_to_string(req.source_type) << " " << req.year
            << "\n";

  auto result = budgetam::app::run_parse_pipeline(req);
  if (!result.has_value()) {
    std::cerr << "Parse failed: " << budgetam::app::describe(result.error()) << "\n";
    return kExitFailure;
  }

  const auto& response = result.value();
  print_diagnostics(response.diagnostics);

  if (store != nullptr) {
    auto stored = budgetam::app::persist_dataset(req, response, *store, clock);
    if (!stored.has_value()) {
      std::cerr << "Persist failed: " << budgetam::app::describe(stored.error()) << "\n";
      return kExitFailure;
    }
  }

  nlohmann::json out;
  out["dataset_id"] = response.dataset_id;
  out["fingerprint"] = response.fingerprint;
  out["record_count"] = response.output.records.size();
  out["warning_count"] = response.diagnostics.warnings().size();
  out["overall"] = budgetam::domain::overall_to_json(response.output.overall);
  if (response.written.has_value()) {
    out["records_csv"] = response.written->records_csv;
    out["overall_json"] = response.written->overall_json;
  }
  std::cout << budgetam::domain::json_text(out, 2) << "\n";

  return kExitOk;
}
