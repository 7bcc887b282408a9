#include "budgetam/validation/checks/missing_financial_data.h"

#include "budgetam/validation/check_support.h"
#include "budgetam/validation/validation_config.h"

#include <utility>

namespace budgetam::validation {

std::vector<CheckResult> MissingFinancialDataCheck::validate(
    const std::vector<domain::FlattenedRecord>& records, const domain::OverallTotals& overall,
    const domain::SourceType type) const {
  using domain::Level;
  const domain::SourceKind kind = domain::source_kind_of(type);
  const std::string id{check_id()};
  std::vector<CheckResult> results;

  std::vector<std::string> missing_overall;
  for (const domain::AmountField field : domain::amount_fields(kind)) {
    if (!domain::amount_of(overall.amounts, field).has_value()) {
      missing_overall.push_back(domain::column_name(Level::kOverall, field));
    }
  }
  const Severity overall_severity = severity_for(id, Level::kOverall);
  if (missing_overall.empty()) {
    results.push_back(CheckResult::pass(id, overall_severity));
  } else {
    const int count = static_cast<int>(missing_overall.size());
    results.push_back(CheckResult::fail(id, overall_severity, count,
                                        {"Missing overall fields: " + join(missing_overall)}));
  }

  for (const Level level : record_levels(type)) {
    std::vector<std::string> messages;
    for (const domain::FlattenedRecord* record : distinct_entities(records, level)) {
      const domain::LevelAmounts& amounts = domain::amounts_at(*record, level);
      for (const domain::AmountField field : domain::amount_fields(kind)) {
        if (!domain::amount_of(amounts, field).has_value()) {
          messages.push_back("Missing data for '" + domain::column_name(level, field) + "' in " +
                             domain::record_locator(*record));
        }
      }
    }
    results.push_back(result_from_messages(id, severity_for(id, level), std::move(messages)));
  }

  return results;
}

}  // namespace budgetam::validation
