#include "budgetam/validation/checks/empty_identifiers.h"

#include "budgetam/core/normalization.h"
#include "budgetam/validation/check_support.h"
#include "budgetam/validation/validation_config.h"

namespace budgetam::validation {

namespace {

// Identifier text that names an entity at a level.
const std::string& identifier_at(const domain::FlattenedRecord& record, const domain::Level level) {
  switch (level) {
    case domain::Level::kProgram:
      return record.program_name;
    case domain::Level::kSubprogram:
      return record.subprogram_name;
    default:
      return record.state_body;
  }
}

std::string_view identifier_column(const domain::Level level) {
  switch (level) {
    case domain::Level::kProgram:
      return "program_name";
    case domain::Level::kSubprogram:
      return "subprogram_name";
    default:
      return "state_body";
  }
}

}  // namespace

std::vector<CheckResult> EmptyIdentifiersCheck::validate(
    const std::vector<domain::FlattenedRecord>& records,
    const domain::OverallTotals& /*overall*/, const domain::SourceType type) const {
  std::vector<CheckResult> results;

  for (const domain::Level level : record_levels(type)) {
    const Severity severity = severity_for(check_id(), level);
    int empty = 0;
    for (const auto& record : records) {
      if (core::is_blank(identifier_at(record, level))) {
        ++empty;
      }
    }

    if (empty == 0) {
      results.push_back(CheckResult::pass(std::string{check_id()}, severity));
    } else {
      results.push_back(CheckResult::fail(
          std::string{check_id()}, severity, empty,
          {"Found " + std::to_string(empty) + " rows with empty " +
           std::string{identifier_column(level)}}));
    }
  }

  return results;
}

}  // namespace budgetam::validation
