#pragma once

#include "budgetam/app/app_service.h"
#include "budgetam/core/clock.h"
#include "budgetam/core/result.h"
#include "budgetam/domain/source_type.h"
#include "budgetam/storage/dataset_store.h"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace budgetam::app {

// One manifest entry: {"year": 2023, "source_type": "BUDGET_LAW", "path": "..."}
struct BatchItem {
  int year{0};  // NOLINT(readability-identifier-naming)
  domain::SourceType source_type{domain::SourceType::kBudgetLaw};  // NOLINT
  std::string path;  // NOLINT(readability-identifier-naming)
};

// The manifest is a JSON array of items. Any malformed entry rejects the whole manifest,
// naming the entry index.
[[nodiscard]] core::Result<std::vector<BatchItem>, std::string> parse_manifest(
    const nlohmann::json& manifest);
[[nodiscard]] core::Result<std::vector<BatchItem>, std::string> load_manifest(
    const std::string& path);

struct BatchOptions {
  std::optional<std::string> out_dir;  // NOLINT(readability-identifier-naming)
  bool strict{false};                  // NOLINT(readability-identifier-naming)
  // Not owned. When set, every parsed dataset and its report are persisted.
  storage::IDatasetStore* store{nullptr};  // NOLINT(readability-identifier-naming)
};

struct BatchOutcome {
  BatchItem item;          // NOLINT(readability-identifier-naming)
  std::string dataset_id;  // NOLINT(readability-identifier-naming)
  bool ok{false};          // NOLINT(readability-identifier-naming)
  std::string reason;      // NOLINT(readability-identifier-naming)
  std::size_t record_count{0};  // NOLINT(readability-identifier-naming)
};

// Items run one after another in manifest order. A failing item never stops the batch.
[[nodiscard]] std::vector<BatchOutcome> run_batch(const std::vector<BatchItem>& items,
                                                  const BatchOptions& options,
                                                  const core::ReportClock& clock);

// "OK   <dataset_id>  <reason>" or "FAIL <dataset_id>  <reason>"
[[nodiscard]] std::string format_outcome(const BatchOutcome& outcome);

[[nodiscard]] std::size_t count_failures(const std::vector<BatchOutcome>& outcomes);

}  // namespace budgetam::app
