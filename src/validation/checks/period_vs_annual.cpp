#include "budgetam/validation/checks/period_vs_annual.h"

#include "budgetam/domain/budget_record.h"
#include "budgetam/validation/check_support.h"
#include "budgetam/validation/validation_config.h"

#include <cmath>
#include <optional>
#include <utility>

namespace budgetam::validation {

namespace {

using domain::AmountField;
using domain::Level;

struct PlanPair {
  AmountField period;
  AmountField annual;
};

constexpr PlanPair kPlainPair{AmountField::kPeriodPlan, AmountField::kAnnualPlan};
constexpr PlanPair kRevisedPair{AmountField::kRevPeriodPlan, AmountField::kRevAnnualPlan};

bool violates(const double period, const double annual) {
  if (annual >= 0.0 && period > annual) {
    return true;
  }
  if (annual < 0.0 && period < annual) {
    return true;
  }
  const bool mixed_signs = (annual >= 0.0 && period < 0.0) || (annual <= 0.0 && period > 0.0);
  return mixed_signs && period != 0.0;
}

// Period and annual values of a pair, when both are present.
std::optional<std::pair<double, double>> pair_values(const domain::LevelAmounts& amounts,
                                                     const PlanPair& pair) {
  const auto period = domain::amount_of(amounts, pair.period);
  const auto annual = domain::amount_of(amounts, pair.annual);
  if (!period.has_value() || !annual.has_value()) {
    return std::nullopt;
  }
  return std::make_pair(period.value(), annual.value());
}

// A violation is strict unless one of its operands is negative.
bool is_strict(const double period, const double annual) {
  return period >= 0.0 && annual >= 0.0;
}

// Downgrade an error-level result to a warning when none of its violations is strict.
Severity effective_severity(const Severity base, const bool any_strict) {
  if (base == Severity::kError && !any_strict) {
    return Severity::kWarning;
  }
  return base;
}

}  // namespace

std::vector<CheckResult> PeriodVsAnnualCheck::validate(
    const std::vector<domain::FlattenedRecord>& records, const domain::OverallTotals& overall,
    const domain::SourceType type) const {
  const std::string id{check_id()};
  std::vector<CheckResult> results;

  // Overall totals: one aggregated message listing every violating pair.
  {
    std::vector<std::string> violations;
    bool any_strict = false;
    for (const PlanPair& pair : {kPlainPair, kRevisedPair}) {
      const auto values = pair_values(overall.amounts, pair);
      if (!values.has_value() || !violates(values->first, values->second)) {
        continue;
      }
      any_strict = any_strict || is_strict(values->first, values->second);
      violations.push_back(domain::column_name(Level::kOverall, pair.period) + " (" +
                           domain::format_number(values->first) + ") exceeds limit " +
                           domain::column_name(Level::kOverall, pair.annual) + " (" +
                           domain::format_number(values->second) + ")");
    }

    const Severity base = severity_for(id, Level::kOverall);
    if (violations.empty()) {
      results.push_back(CheckResult::pass(id, base));
    } else {
      const int count = static_cast<int>(violations.size());
      results.push_back(CheckResult::fail(id, effective_severity(base, any_strict), count,
                                          {"Overall violations: " + join(violations)}));
    }
  }

  for (const Level level : record_levels(type)) {
    const auto entities = distinct_entities(records, level);
    std::vector<std::string> messages;
    bool any_strict = false;

    // All plain-pair violations first, then the revised ones.
    for (const PlanPair& pair : {kPlainPair, kRevisedPair}) {
      for (const domain::FlattenedRecord* record : entities) {
        const domain::LevelAmounts& amounts = domain::amounts_at(*record, level);
        const auto values = pair_values(amounts, pair);
        if (!values.has_value() || !violates(values->first, values->second)) {
          continue;
        }
        const auto [period, annual] = values.value();
        any_strict = any_strict || is_strict(period, annual);
        messages.push_back(std::string{domain::level_display_name(level)} + " violation: '" +
                           domain::column_name(level, pair.period) + "' (" +
                           format_fixed(period, 2) + ") exceeds limit '" +
                           domain::column_name(level, pair.annual) + "' (" +
                           format_fixed(annual, 2) + ") by " +
                           format_fixed(std::fabs(period - annual), 2) + " for " +
                           domain::record_locator(*record));
      }
    }

    const Severity base = severity_for(id, level);
    if (messages.empty()) {
      results.push_back(CheckResult::pass(id, base));
    } else {
      results.push_back(result_from_messages(id, effective_severity(base, any_strict),
                                             std::move(messages)));
    }
  }

  return results;
}

}  // namespace budgetam::validation
