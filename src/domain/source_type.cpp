#include "budgetam/domain/source_type.h"

#include <array>
#include <utility>

namespace budgetam::domain {

namespace {

constexpr std::array<std::pair<SourceType, std::string_view>, 6> kSourceTypeNames = {{
    {SourceType::kBudgetLaw, "BUDGET_LAW"},
    {SourceType::kSpendingQ1, "SPENDING_Q1"},
    {SourceType::kSpendingQ12, "SPENDING_Q12"},
    {SourceType::kSpendingQ123, "SPENDING_Q123"},
    {SourceType::kSpendingQ1234, "SPENDING_Q1234"},
    {SourceType::kMtep, "MTEP"},
}};

// First budget law year published in the seven-column layout.
constexpr int kFirstBudget2025Year = 2025;

}  // namespace

std::string source_type_to_string(const SourceType type) {
  for (const auto& [value, name] : kSourceTypeNames) {
    if (value == type) {
      return std::string{name};
    }
  }
  return "UNKNOWN";
}

std::optional<SourceType> source_type_from_string(const std::string_view text) {
  for (const auto& [value, name] : kSourceTypeNames) {
    if (name == text) {
      return value;
    }
  }
  return std::nullopt;
}

SourceKind source_kind_of(const SourceType type) noexcept {
  switch (type) {
    case SourceType::kBudgetLaw:
      return SourceKind::kBudgetLaw;
    case SourceType::kSpendingQ1:
    case SourceType::kSpendingQ12:
    case SourceType::kSpendingQ123:
      return SourceKind::kPeriodSpending;
    case SourceType::kSpendingQ1234:
      return SourceKind::kYearEndSpending;
    case SourceType::kMtep:
      return SourceKind::kMediumTermPlan;
  }
  return SourceKind::kBudgetLaw;
}

Layout layout_for(const SourceType type, const int year) noexcept {
  if (type == SourceType::kMtep) {
    return Layout::kMtep;
  }
  if (type == SourceType::kBudgetLaw && year >= kFirstBudget2025Year) {
    return Layout::kBudget2025;
  }
  return Layout::kClassic;
}

std::string dataset_id(const int year, const SourceType type) {
  return std::to_string(year) + "_" + source_type_to_string(type);
}

}  // namespace budgetam::domain
