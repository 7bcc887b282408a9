#include "budgetam/validation/checks/percentage_calculation.h"

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

struct RateDefinition {
  AmountField rate;
  AmountField numerator;
  AmountField denominator;
};

std::vector<RateDefinition> rate_definitions(const domain::SourceType type) {
  std::vector<RateDefinition> rates = {
      {AmountField::kActualVsRevAnnualPlan, AmountField::kActual, AmountField::kRevAnnualPlan}};
  if (domain::has_period_fields(type)) {
    rates.push_back(
        {AmountField::kActualVsRevPeriodPlan, AmountField::kActual, AmountField::kRevPeriodPlan});
  }
  return rates;
}

// Expected and reported rate, or nullopt when the rate cannot be checked
// (missing operand, or a zero denominator).
std::optional<std::pair<double, double>> rate_values(const domain::LevelAmounts& amounts,
                                                     const RateDefinition& definition) {
  const auto reported = domain::amount_of(amounts, definition.rate);
  const auto numerator = domain::amount_of(amounts, definition.numerator);
  const auto denominator = domain::amount_of(amounts, definition.denominator);
  if (!reported.has_value() || !numerator.has_value() || !denominator.has_value() ||
      denominator.value() == 0.0) {
    return std::nullopt;
  }
  return std::make_pair(numerator.value() / denominator.value(), reported.value());
}

}  // namespace

std::vector<CheckResult> PercentageCalculationCheck::validate(
    const std::vector<domain::FlattenedRecord>& records, const domain::OverallTotals& overall,
    const domain::SourceType type) const {
  const std::string id{check_id()};
  std::vector<CheckResult> results;

  for (const RateDefinition& definition : rate_definitions(type)) {
    const auto overall_values = rate_values(overall.amounts, definition);
    if (!overall_values.has_value() ||
        std::fabs(overall_values->first - overall_values->second) <= kPercentageTolerance) {
      results.push_back(CheckResult::pass(id, Severity::kError));
    } else {
      const auto [expected, reported] = overall_values.value();
      results.push_back(CheckResult::fail(
          id, Severity::kError, 1,
          {"Overall " + std::string{domain::amount_field_name(definition.rate)} + ": expected " +
           format_fixed(expected, 4) + ", reported " + format_fixed(reported, 4) + ", diff " +
           format_fixed(std::fabs(expected - reported), 4) + " (tolerance " +
           domain::format_number(kPercentageTolerance) + ")"}));
    }

    for (const Level level : record_levels(type)) {
      std::vector<std::string> messages;
      for (const domain::FlattenedRecord* record : distinct_entities(records, level)) {
        const auto values = rate_values(domain::amounts_at(*record, level), definition);
        if (!values.has_value()) {
          continue;
        }
        const auto [expected, reported] = values.value();
        const double diff = std::fabs(expected - reported);
        if (diff > kPercentageTolerance) {
          messages.push_back("Mismatch for '" + domain::column_name(level, definition.rate) +
                             "'. Expected: " + format_fixed(expected, 4) +
                             ", Reported: " + format_fixed(reported, 4) +
                             ", Diff: " + format_fixed(diff, 4) + " in " +
                             domain::record_locator(*record));
        }
      }
      results.push_back(result_from_messages(id, Severity::kError, std::move(messages)));
    }
  }

  return results;
}

}  // namespace budgetam::validation
