#pragma once

#include "budgetam/validation/validation_report.h"

#include <nlohmann/json.hpp>

#include <string>

namespace budgetam::validation {

// Values that are not part of the report itself but appear in rendered output.
struct ReportMetadata {
  std::string fingerprint;   // workbook content hash
  std::string generated_at;  // ISO 8601 UTC
};

// Console summary followed by every failed result and its messages.
[[nodiscard]] std::string render_console(const ValidationReport& report);

// Markdown document: summary, errors and warnings grouped per check id, passed checks.
[[nodiscard]] std::string render_markdown(const ValidationReport& report,
                                          const ReportMetadata& metadata);

// {metadata, summary, passed_checks, warning_checks, error_checks}. Failed buckets are
// ordered by fail_count, largest first.
[[nodiscard]] nlohmann::json render_json(const ValidationReport& report,
                                         const ReportMetadata& metadata);

}  // namespace budgetam::validation
