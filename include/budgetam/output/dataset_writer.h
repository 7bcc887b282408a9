#pragma once

#include "budgetam/core/result.h"
#include "budgetam/domain/budget_record.h"
#include "budgetam/domain/source_type.h"

#include <string>
#include <vector>

namespace budgetam::output {

/// Paths written for one dataset.
struct WrittenFiles {
  std::string records_csv;   ///< "<out_dir>/<dataset_id>.csv"
  std::string overall_json;  ///< "<out_dir>/<dataset_id>_overall.json"
};

/// Quote a CSV field when it contains a comma, quote or line break.
[[nodiscard]] std::string csv_escape(const std::string& field);

/// Render the record table: header row from output_columns(type, layout),
/// one line per record, "\n" line endings.
[[nodiscard]] std::string render_records_csv(const std::vector<domain::FlattenedRecord>& records,
                                             domain::SourceType type, domain::Layout layout);

/// Write the record CSV and overall JSON into out_dir (created if missing).
[[nodiscard]] core::Result<WrittenFiles, std::string> write_dataset(
    const std::string& out_dir, const std::string& dataset_id,
    const std::vector<domain::FlattenedRecord>& records, const domain::OverallTotals& overall,
    domain::SourceType type, domain::Layout layout);

}  // namespace budgetam::output
