#pragma once

#include "budgetam/domain/amounts.h"
#include "budgetam/domain/source_type.h"
#include "budgetam/validation/check_result.h"

#include <string_view>

namespace budgetam::validation {

// Absolute tolerances (AMD) for hierarchical sums.
inline constexpr double kBudgetLawTolerance = 1.0;
inline constexpr double kSpendingTolerance = 5.0;
inline constexpr double kMtepTolerance = 0.5;

// Absolute tolerance for reported execution rates (0.001 == 0.1 percentage points).
inline constexpr double kPercentageTolerance = 0.001;

[[nodiscard]] double hierarchical_tolerance(domain::SourceType type) noexcept;

// Severity of a check's result at a hierarchy level. Checks without a per-level
// table (required_fields, hierarchical_totals, percentage_calculation,
// hierarchical_structure_sanity) are errors at every level.
[[nodiscard]] Severity severity_for(std::string_view check_id, domain::Level level) noexcept;

}  // namespace budgetam::validation
