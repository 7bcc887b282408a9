#include "budgetam/validation/checks/negative_percentages.h"

#include "budgetam/validation/check_support.h"
#include "budgetam/validation/validation_config.h"

namespace budgetam::validation {

std::vector<CheckResult> NegativePercentagesCheck::validate(
    const std::vector<domain::FlattenedRecord>& records, const domain::OverallTotals& overall,
    const domain::SourceType type) const {
  using domain::Level;
  const std::string id{check_id()};
  const auto fields = domain::percentage_fields(domain::source_kind_of(type));
  std::vector<CheckResult> results;

  std::vector<std::string> negative_overall;
  for (const domain::AmountField field : fields) {
    const auto value = domain::amount_of(overall.amounts, field);
    if (value.has_value() && value.value() < 0.0) {
      negative_overall.push_back(domain::column_name(Level::kOverall, field));
    }
  }
  const Severity overall_severity = severity_for(id, Level::kOverall);
  if (negative_overall.empty()) {
    results.push_back(CheckResult::pass(id, overall_severity));
  } else {
    const int count = static_cast<int>(negative_overall.size());
    results.push_back(CheckResult::fail(id, overall_severity, count,
                                        {"Negative overall percentages: " + join(negative_overall)}));
  }

  for (const Level level : record_levels(type)) {
    const auto entities = distinct_entities(records, level);
    int total_negatives = 0;
    std::vector<std::string> negative_fields;
    for (const domain::AmountField field : fields) {
      int negatives = 0;
      for (const domain::FlattenedRecord* record : entities) {
        const auto value = domain::amount_of(domain::amounts_at(*record, level), field);
        if (value.has_value() && value.value() < 0.0) {
          ++negatives;
        }
      }
      if (negatives > 0) {
        total_negatives += negatives;
        negative_fields.push_back(domain::column_name(level, field) + " (" +
                                  std::to_string(negatives) + " rows)");
      }
    }

    const Severity severity = severity_for(id, level);
    if (total_negatives == 0) {
      results.push_back(CheckResult::pass(id, severity));
    } else {
      results.push_back(CheckResult::fail(
          id, severity, total_negatives,
          {"Negative " + std::string{domain::level_prefix(level)} +
           " percentages: " + join(negative_fields)}));
    }
  }

  return results;
}

}  // namespace budgetam::validation
