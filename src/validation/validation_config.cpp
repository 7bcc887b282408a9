#include "budgetam/validation/validation_config.h"

#include <array>

namespace budgetam::validation {

namespace {

using domain::Level;

// Per-level severities, indexed overall / state body / program / subprogram.
struct SeverityTable {
  std::string_view check_id;
  std::array<Severity, 4> by_level;
};

constexpr Severity kE = Severity::kError;
constexpr Severity kW = Severity::kWarning;

constexpr std::array<SeverityTable, 6> kSeverityTables = {{
    {"empty_identifiers", {kE, kE, kE, kW}},
    {"missing_financial_data", {kE, kE, kE, kW}},
    {"negative_totals", {kE, kE, kW, kW}},
    {"period_vs_annual", {kE, kE, kE, kW}},
    {"negative_percentages", {kE, kE, kW, kW}},
    {"execution_exceeds_100", {kW, kW, kW, kW}},
}};

std::size_t level_index(const Level level) noexcept {
  switch (level) {
    case Level::kOverall:
      return 0;
    case Level::kStateBody:
      return 1;
    case Level::kProgram:
      return 2;
    case Level::kSubprogram:
      return 3;
  }
  return 0;
}

}  // namespace

double hierarchical_tolerance(const domain::SourceType type) noexcept {
  switch (type) {
    case domain::SourceType::kBudgetLaw:
      return kBudgetLawTolerance;
    case domain::SourceType::kMtep:
      return kMtepTolerance;
    default:
      return kSpendingTolerance;
  }
}

Severity severity_for(const std::string_view check_id, const Level level) noexcept {
  for (const auto& table : kSeverityTables) {
    if (table.check_id == check_id) {
      return table.by_level[level_index(level)];
    }
  }
  return Severity::kError;
}

}  // namespace budgetam::validation
