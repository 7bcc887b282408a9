#include "budgetam/validation/checks/required_fields.h"

#include "budgetam/validation/check_support.h"

#include <algorithm>

namespace budgetam::validation {

std::vector<CheckResult> RequiredFieldsCheck::validate(
    const std::vector<domain::FlattenedRecord>& records, const domain::OverallTotals& overall,
    const domain::SourceType type) const {
  const domain::SourceKind kind = domain::source_kind_of(type);
  std::vector<std::string> missing;

  for (const domain::Level level : record_levels(type)) {
    for (const domain::AmountField field : domain::amount_fields(kind)) {
      const bool present =
          std::all_of(records.begin(), records.end(), [level, field](const auto& record) {
            return domain::has_field(domain::amounts_at(record, level), field);
          });
      if (!present) {
        missing.push_back(domain::column_name(level, field));
      }
    }
  }

  for (const domain::AmountField field : domain::amount_fields(kind)) {
    if (!domain::has_field(overall.amounts, field)) {
      missing.push_back(domain::column_name(domain::Level::kOverall, field));
    }
  }

  if (kind == domain::SourceKind::kMediumTermPlan && overall.plan_years.size() != 3) {
    missing.emplace_back("plan_years");
  }

  if (missing.empty()) {
    return {CheckResult::pass(std::string{check_id()}, Severity::kError)};
  }
  const int count = static_cast<int>(missing.size());
  return {CheckResult::fail(std::string{check_id()}, Severity::kError, count,
                            {"Missing fields: " + join(missing)})};
}

}  // namespace budgetam::validation
