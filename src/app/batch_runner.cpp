#include "budgetam/app/batch_runner.h"

#include <algorithm>
#include <exception>
#include <fstream>
#include <utility>

namespace budgetam::app {

namespace {

using ManifestResult = core::Result<std::vector<BatchItem>, std::string>;

std::string entry_error(const std::size_t index, const std::string& problem) {
  return "Manifest entry " + std::to_string(index) + ": " + problem;
}

std::string validation_summary(const validation::ValidationReport& report) {
  return std::to_string(report.error_count()) + " errors, " +
         std::to_string(report.warning_count()) + " warnings";
}

}  // namespace

ManifestResult parse_manifest(const nlohmann::json& manifest) {
  if (!manifest.is_array()) {
    return ManifestResult::err("Manifest must be a JSON array");
  }

  std::vector<BatchItem> items;
  items.reserve(manifest.size());
  for (std::size_t i = 0; i < manifest.size(); ++i) {
    const auto& entry = manifest.at(i);
    if (!entry.is_object()) {
      return ManifestResult::err(entry_error(i, "not an object"));
    }
    if (!entry.contains("year") || !entry.at("year").is_number_integer()) {
      return ManifestResult::err(entry_error(i, "'year' must be an integer"));
    }
    if (!entry.contains("source_type") || !entry.at("source_type").is_string()) {
      return ManifestResult::err(entry_error(i, "'source_type' must be a string"));
    }
    if (!entry.contains("path") || !entry.at("path").is_string()) {
      return ManifestResult::err(entry_error(i, "'path' must be a string"));
    }

    const auto type_text = entry.at("source_type").get<std::string>();
    const auto type = domain::source_type_from_string(type_text);
    if (!type.has_value()) {
      return ManifestResult::err(entry_error(i, "unknown source type '" + type_text + "'"));
    }

    items.push_back(BatchItem{entry.at("year").get<int>(), *type,
                              entry.at("path").get<std::string>()});
  }
  return ManifestResult::ok(std::move(items));
}

ManifestResult load_manifest(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    return ManifestResult::err("Cannot open manifest: " + path);
  }

  nlohmann::json manifest;
  try {
    in >> manifest;
  } catch (const nlohmann::json::parse_error& e) {
    return ManifestResult::err("Manifest is not valid JSON: " + std::string(e.what()));
  }
  return parse_manifest(manifest);
}

namespace {

BatchOutcome run_item(const BatchItem& item, const BatchOptions& options,
                      const core::ReportClock& clock) {
  BatchOutcome outcome;
  outcome.item = item;
  outcome.dataset_id = domain::dataset_id(item.year, item.source_type);

  const ParsePipelineRequest req{item.path, item.source_type, item.year, options.out_dir};
  auto validated = run_validate_pipeline(req, options.strict, clock);
  if (!validated.has_value()) {
    outcome.reason = describe(validated.error());
    return outcome;
  }

  const auto& response = validated.value();
  outcome.record_count = response.parsed.output.records.size();

  if (options.store != nullptr) {
    auto stored = persist_validation(req, response, *options.store, clock);
    if (!stored.has_value()) {
      outcome.reason = describe(stored.error());
      return outcome;
    }
  }

  if (response.failed) {
    outcome.reason = "validation: " + validation_summary(response.report);
  } else {
    outcome.ok = true;
    outcome.reason =
        std::to_string(outcome.record_count) + " records, " + validation_summary(response.report);
  }
  return outcome;
}

}  // namespace

std::vector<BatchOutcome> run_batch(const std::vector<BatchItem>& items,
                                    const BatchOptions& options,
                                    const core::ReportClock& clock) {
  std::vector<BatchOutcome> outcomes;
  outcomes.reserve(items.size());

  for (const auto& item : items) {
    try {
      outcomes.push_back(run_item(item, options, clock));
    } catch (const std::exception& e) {
      // One workbook's failure never stops the rest of the batch.
      BatchOutcome outcome;
      outcome.item = item;
      outcome.dataset_id = domain::dataset_id(item.year, item.source_type);
      outcome.reason = std::string("internal: ") + e.what();
      outcomes.push_back(std::move(outcome));
    }
  }
  return outcomes;
}

std::string format_outcome(const BatchOutcome& outcome) {
  return std::string(outcome.ok ? "OK   " : "FAIL ") + outcome.dataset_id + "  " + outcome.reason;
}

std::size_t count_failures(const std::vector<BatchOutcome>& outcomes) {
  return static_cast<std::size_t>(std::count_if(
      outcomes.begin(), outcomes.end(), [](const BatchOutcome& o) { return !o.ok; }));
}

}  // namespace budgetam::app
