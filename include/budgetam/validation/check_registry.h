#pragma once

#include "budgetam/domain/budget_record.h"
#include "budgetam/domain/source_type.h"
#include "budgetam/validation/validation_check.h"
#include "budgetam/validation/validation_report.h"

#include <memory>
#include <string>
#include <vector>

namespace budgetam::validation {

// Ordered, closed set of checks. Order is the order results appear in reports.
using CheckRegistry = std::vector<std::unique_ptr<ValidationCheck>>;

// required_fields, empty_identifiers, missing_financial_data, hierarchical_totals,
// negative_totals, period_vs_annual, negative_percentages, execution_exceeds_100,
// percentage_calculation, hierarchical_structure_sanity
[[nodiscard]] CheckRegistry make_default_registry();

// Run every check that applies to the source type, in registry order.
[[nodiscard]] std::vector<CheckResult> run_checks(
    const CheckRegistry& registry, const std::vector<domain::FlattenedRecord>& records,
    const domain::OverallTotals& overall, domain::SourceType type);

// Default registry over one dataset.
[[nodiscard]] ValidationReport run_validation(const std::vector<domain::FlattenedRecord>& records,
                                              const domain::OverallTotals& overall,
                                              domain::SourceType type, std::string source_path);

}  // namespace budgetam::validation
