#pragma once

#include "budgetam/core/result.h"
#include "budgetam/domain/budget_record.h"
#include "budgetam/domain/source_type.h"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace budgetam::storage {

// StoredDataset is one parsed workbook as persisted: the flattened records in
// output order plus the grand-total row and provenance.
struct StoredDataset {
  std::string dataset_id;                        // "<year>_<SOURCE_TYPE>"
  int year{0};                                   // NOLINT(readability-identifier-naming)
  domain::SourceType source_type{domain::SourceType::kBudgetLaw};  // NOLINT
  std::string source_path;                       // NOLINT(readability-identifier-naming)
  std::string fingerprint;                       // fingerprint_bytes of the source file
  std::string created_at;                        // ISO-8601 UTC from the injected clock
  std::vector<domain::FlattenedRecord> records;  // NOLINT(readability-identifier-naming)
  domain::OverallTotals overall;                 // NOLINT(readability-identifier-naming)
};

struct DatasetSummary {
  std::string dataset_id;  // NOLINT(readability-identifier-naming)
  int year{0};             // NOLINT(readability-identifier-naming)
  domain::SourceType source_type{domain::SourceType::kBudgetLaw};  // NOLINT
  std::size_t record_count{0};  // NOLINT(readability-identifier-naming)
  std::string created_at;       // NOLINT(readability-identifier-naming)
};

// IDatasetStore persists parsed datasets and their validation reports.
// Saving a dataset id that already exists replaces its records.
class IDatasetStore {
 public:
  virtual ~IDatasetStore() = default;

  [[nodiscard]] virtual core::Result<bool, std::string> save(const StoredDataset& dataset) = 0;

  // nullopt when no dataset with this id exists
  [[nodiscard]] virtual core::Result<std::optional<StoredDataset>, std::string> load(
      const std::string& dataset_id) const = 0;

  // Ordered by dataset_id
  [[nodiscard]] virtual core::Result<std::vector<DatasetSummary>, std::string> list() const = 0;

  // Reports are append-only; the dataset must already be saved.
  [[nodiscard]] virtual core::Result<bool, std::string> save_report(
      const std::string& dataset_id, const nlohmann::json& report,
      const std::string& created_at) = 0;

  [[nodiscard]] virtual core::Result<std::optional<nlohmann::json>, std::string> latest_report(
      const std::string& dataset_id) const = 0;

 protected:
  IDatasetStore() = default;
  IDatasetStore(const IDatasetStore&) = default;
  IDatasetStore& operator=(const IDatasetStore&) = default;
  IDatasetStore(IDatasetStore&&) = default;
  IDatasetStore& operator=(IDatasetStore&&) = default;
};

}  // namespace budgetam::storage
