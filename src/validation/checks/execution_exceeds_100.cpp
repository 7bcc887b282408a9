#include "budgetam/validation/checks/execution_exceeds_100.h"

#include "budgetam/validation/check_support.h"
#include "budgetam/validation/validation_config.h"

namespace budgetam::validation {

namespace {

// Execution rates are fractions; 1.0 is 100%.
constexpr double kFullExecution = 1.0;

}  // namespace

std::vector<CheckResult> ExecutionExceeds100Check::validate(
    const std::vector<domain::FlattenedRecord>& records, const domain::OverallTotals& overall,
    const domain::SourceType type) const {
  using domain::Level;
  const std::string id{check_id()};
  const auto fields = domain::percentage_fields(domain::source_kind_of(type));
  std::vector<CheckResult> results;

  std::vector<std::string> exceeding_overall;
  for (const domain::AmountField field : fields) {
    const auto value = domain::amount_of(overall.amounts, field);
    if (value.has_value() && value.value() > kFullExecution) {
      exceeding_overall.push_back(domain::column_name(Level::kOverall, field));
    }
  }
  const Severity overall_severity = severity_for(id, Level::kOverall);
  if (exceeding_overall.empty()) {
    results.push_back(CheckResult::pass(id, overall_severity));
  } else {
    const int count = static_cast<int>(exceeding_overall.size());
    results.push_back(CheckResult::fail(id, overall_severity, count,
                                        {"Overall execution > 100%: " + join(exceeding_overall)}));
  }

  for (const Level level : record_levels(type)) {
    const auto entities = distinct_entities(records, level);
    int total = 0;
    std::vector<std::string> exceeding_fields;
    for (const domain::AmountField field : fields) {
      int exceeding = 0;
      for (const domain::FlattenedRecord* record : entities) {
        const auto value = domain::amount_of(domain::amounts_at(*record, level), field);
        if (value.has_value() && value.value() > kFullExecution) {
          ++exceeding;
        }
      }
      if (exceeding > 0) {
        total += exceeding;
        exceeding_fields.push_back(domain::column_name(level, field) + " (" +
                                   std::to_string(exceeding) + " rows)");
      }
    }

    const Severity severity = severity_for(id, level);
    if (total == 0) {
      results.push_back(CheckResult::pass(id, severity));
    } else {
      results.push_back(CheckResult::fail(
          id, severity, total,
          {std::string{domain::level_display_name(level)} +
           " execution > 100%: " + join(exceeding_fields)}));
    }
  }

  return results;
}

}  // namespace budgetam::validation
