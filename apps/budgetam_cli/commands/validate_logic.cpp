#include "validate_logic.h"

#include "budgetam/domain/budget_record.h"
#include "budgetam/validation/report_renderer.h"

#include "command_support.h"
#include <fstream>
#include <iostream>

namespace {

bool write_report_file(const std::string& path, const std::string& content) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    std::cerr << "Cannot open " << path << " for writing\n";
    return false;
  }
  out << content;
  out.close();
  if (!out) {
    std::cerr << "Failed to write " << path << "\n";
    return false;
  }
  std::cerr << "Report written: " << path << "\n";
  return true;
}

}  // namespace

int execute_validate(const budgetam::app::ParsePipelineRequest& req, const bool strict,
                     const ValidateOutputs& outputs, budgetam::storage::IDatasetStore* store,
                     const budgetam::core::ReportClock& clock) {
  std::cerr << "Validating " << req.input_path << " as "
            << budgetam::domain::source_type_to_string(req.source_type) << " " << req.year
            << (strict ? " (strict)" : "") << "\n";

  auto result = budgetam::app::run_validate_pipeline(req, strict, clock);
  if (!result.has_value()) {
    std::cerr << "Validation aborted: " << budgetam::app::describe(result.error()) << "\n";
    return kExitFailure;
  }

  const auto& response = result.value();
  print_diagnostics(response.parsed.diagnostics);
  std::cout << budgetam::validation::render_console(response.report);

  bool io_ok = true;
  if (outputs.report_md.has_value()) {
    io_ok = write_report_file(*outputs.report_md, budgetam::validation::render_markdown(
                                                      response.report, response.metadata)) &&
            io_ok;
  }
  if (outputs.report_json.has_value()) {
    const auto report_json =
        budgetam::validation::render_json(response.report, response.metadata);
    io_ok = write_report_file(*outputs.report_json,
                              budgetam::domain::json_text(report_json, 2) + "\n") &&
            io_ok;
  }

  if (store != nullptr) {
    auto stored = budgetam::app::persist_validation(req, response, *store, clock);
    if (!stored.has_value()) {
      std::cerr << "Persist failed: " << budgetam::app::describe(stored.error()) << "\n";
      return kExitFailure;
    }
  }

  if (!io_ok || response.failed) {
    return kExitFailure;
  }
  return kExitOk;
}
