#include "budgetam/validation/checks/negative_totals.h"

#include "budgetam/validation/check_support.h"
#include "budgetam/validation/validation_config.h"

#include <utility>

namespace budgetam::validation {

std::vector<CheckResult> NegativeTotalsCheck::validate(
    const std::vector<domain::FlattenedRecord>& records, const domain::OverallTotals& overall,
    const domain::SourceType type) const {
  using domain::Level;
  const std::string id{check_id()};
  const auto fields = domain::currency_fields(domain::source_kind_of(type));
  std::vector<CheckResult> results;

  std::vector<std::string> overall_messages;
  for (const domain::AmountField field : fields) {
    const auto value = domain::amount_of(overall.amounts, field);
    if (value.has_value() && value.value() < 0.0) {
      overall_messages.push_back("Overall field '" + domain::column_name(Level::kOverall, field) +
                                 "' has negative value: " + format_fixed(value.value(), 2));
    }
  }
  results.push_back(
      result_from_messages(id, severity_for(id, Level::kOverall), std::move(overall_messages)));

  for (const Level level : record_levels(type)) {
    std::vector<std::string> messages;
    for (const domain::FlattenedRecord* record : distinct_entities(records, level)) {
      for (const domain::AmountField field : fields) {
        const auto value = domain::amount_of(domain::amounts_at(*record, level), field);
        if (value.has_value() && value.value() < 0.0) {
          messages.push_back(std::string{domain::level_display_name(level)} + " field '" +
                             domain::column_name(level, field) +
                             "' has negative value: " + format_fixed(value.value(), 2) +
                             " for " + domain::record_locator(*record));
        }
      }
    }
    results.push_back(result_from_messages(id, severity_for(id, level), std::move(messages)));
  }

  return results;
}

}  // namespace budgetam::validation
