#pragma once

#include "budgetam/domain/source_type.h"

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace budgetam::domain {

// Hierarchy level a value belongs to. kOverall is the grand-total row.
enum class Level {
  kOverall,
  kStateBody,
  kProgram,
  kSubprogram,
};

// "overall", "state_body", "program", "subprogram"
[[nodiscard]] std::string_view level_prefix(Level level) noexcept;
// "Overall", "State body", "Program", "Subprogram"
[[nodiscard]] std::string_view level_display_name(Level level) noexcept;

// AmountField is the base name of a financial column, shared by all levels.
// The column name of a field at a level is "<level_prefix>_<base name>".
enum class AmountField {
  kTotal,
  kAnnualPlan,
  kRevAnnualPlan,
  kPeriodPlan,
  kRevPeriodPlan,
  kActual,
  kActualVsRevAnnualPlan,
  kActualVsRevPeriodPlan,
  kTotalY0,
  kTotalY1,
  kTotalY2,
};

// "total", "annual_plan", ..., "actual_vs_rev_period_plan", "total_y0", ...
[[nodiscard]] std::string_view amount_field_name(AmountField field) noexcept;
[[nodiscard]] std::optional<AmountField> amount_field_from_name(std::string_view name) noexcept;

// Execution-rate fields hold fractions (0.712 == 71.2%), not currency.
[[nodiscard]] bool is_percentage_field(AmountField field) noexcept;

// "<level_prefix>_<base name>", e.g. column_name(kProgram, kRevAnnualPlan) == "program_rev_annual_plan"
[[nodiscard]] std::string column_name(Level level, AmountField field);

// Field-set shapes, one per source kind. A value is nullopt when the cell was absent
// (for example a dataset loaded from storage with a null amount); the parser always
// fills every field of the shape it was built with.
struct BudgetLawAmounts {
  std::optional<double> total;  // NOLINT(readability-identifier-naming)
};

struct PeriodSpendingAmounts {
  std::optional<double> annual_plan;                // NOLINT(readability-identifier-naming)
  std::optional<double> rev_annual_plan;            // NOLINT(readability-identifier-naming)
  std::optional<double> period_plan;                // NOLINT(readability-identifier-naming)
  std::optional<double> rev_period_plan;            // NOLINT(readability-identifier-naming)
  std::optional<double> actual;                     // NOLINT(readability-identifier-naming)
  std::optional<double> actual_vs_rev_annual_plan;  // NOLINT(readability-identifier-naming)
  std::optional<double> actual_vs_rev_period_plan;  // NOLINT(readability-identifier-naming)
};

struct YearEndSpendingAmounts {
  std::optional<double> annual_plan;                // NOLINT(readability-identifier-naming)
  std::optional<double> rev_annual_plan;            // NOLINT(readability-identifier-naming)
  std::optional<double> actual;                     // NOLINT(readability-identifier-naming)
  std::optional<double> actual_vs_rev_annual_plan;  // NOLINT(readability-identifier-naming)
};

struct PlanAmounts {
  std::optional<double> total_y0;  // NOLINT(readability-identifier-naming)
  std::optional<double> total_y1;  // NOLINT(readability-identifier-naming)
  std::optional<double> total_y2;  // NOLINT(readability-identifier-naming)
};

// Alternative order matches SourceKind.
using LevelAmounts =
    std::variant<BudgetLawAmounts, PeriodSpendingAmounts, YearEndSpendingAmounts, PlanAmounts>;

// Empty (all nullopt) field set of the right shape for a source type.
[[nodiscard]] LevelAmounts make_amounts(SourceKind kind);

[[nodiscard]] SourceKind kind_of(const LevelAmounts& amounts) noexcept;

// Fields of a source kind in workbook column order, percentages included.
[[nodiscard]] const std::vector<AmountField>& amount_fields(SourceKind kind);

// Fields of a source kind excluding execution rates (used for sums and sign checks).
[[nodiscard]] std::vector<AmountField> currency_fields(SourceKind kind);

// Execution-rate fields of a source kind (empty for budget law and plan).
[[nodiscard]] std::vector<AmountField> percentage_fields(SourceKind kind);

// Field access. has_field is false when the shape does not carry the field;
// amount_of returns nullopt both for absent fields and for null values.
[[nodiscard]] bool has_field(const LevelAmounts& amounts, AmountField field) noexcept;
[[nodiscard]] std::optional<double> amount_of(const LevelAmounts& amounts, AmountField field);

// Returns false (and leaves amounts unchanged) when the shape does not carry the field.
bool set_amount(LevelAmounts& amounts, AmountField field, std::optional<double> value);

}  // namespace budgetam::domain
