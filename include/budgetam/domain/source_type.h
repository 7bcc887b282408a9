#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace budgetam::domain {

// SourceType identifies one published report series.
enum class SourceType {
  kBudgetLaw,
  kSpendingQ1,
  kSpendingQ12,
  kSpendingQ123,
  kSpendingQ1234,
  kMtep,
};

// SourceKind groups source types that share a financial field set.
//   kBudgetLaw       - one amount per level ("total")
//   kPeriodSpending  - Q1/Q12/Q123: annual, revised annual, period, revised period, actual
//                      plus two execution rates
//   kYearEndSpending - Q1234: annual, revised annual, actual plus one execution rate
//   kMediumTermPlan  - three forecast-year totals, two-level hierarchy
enum class SourceKind {
  kBudgetLaw,
  kPeriodSpending,
  kYearEndSpending,
  kMediumTermPlan,
};

// Layout is the concrete workbook grammar a file is written in.
enum class Layout {
  kClassic,     // 2019-2024 budget law and all spending reports
  kBudget2025,  // budget law from 2025 on: seven columns, no subprogram marker
  kMtep,        // medium-term expenditure plan: six columns, no subprograms
};

// "BUDGET_LAW", "SPENDING_Q1", ..., "MTEP"
[[nodiscard]] std::string source_type_to_string(SourceType type);
[[nodiscard]] std::optional<SourceType> source_type_from_string(std::string_view text);

[[nodiscard]] SourceKind source_kind_of(SourceType type) noexcept;

[[nodiscard]] Layout layout_for(SourceType type, int year) noexcept;

[[nodiscard]] inline bool has_subprogram_level(const SourceType type) noexcept {
  return type != SourceType::kMtep;
}

[[nodiscard]] inline bool has_period_fields(const SourceType type) noexcept {
  return source_kind_of(type) == SourceKind::kPeriodSpending;
}

[[nodiscard]] inline bool is_spending(const SourceType type) noexcept {
  const SourceKind kind = source_kind_of(type);
  return kind == SourceKind::kPeriodSpending || kind == SourceKind::kYearEndSpending;
}

// Dataset identifier used by writers and the store: "<year>_<SOURCE_TYPE>".
[[nodiscard]] std::string dataset_id(int year, SourceType type);

}  // namespace budgetam::domain
