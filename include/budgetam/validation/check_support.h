#pragma once

#include "budgetam/domain/amounts.h"
#include "budgetam/domain/budget_record.h"
#include "budgetam/domain/source_type.h"
#include "budgetam/validation/check_result.h"

#include <string>
#include <string_view>
#include <vector>

namespace budgetam::validation {

// Record levels present for a source type: state body and program, plus subprogram
// unless the source has a two-level hierarchy.
[[nodiscard]] std::vector<domain::Level> record_levels(domain::SourceType type);

// Entities checked at a level, in first-seen order:
//   kStateBody  - first record of each distinct state body
//   kProgram    - first record of each distinct (state body, program code)
//   kSubprogram - every record
[[nodiscard]] std::vector<const domain::FlattenedRecord*> distinct_entities(
    const std::vector<domain::FlattenedRecord>& records, domain::Level level);

// Fixed-point text, e.g. format_fixed(-50.0, 2) == "-50.00".
[[nodiscard]] std::string format_fixed(double value, int precision);

// Joins with ", ".
[[nodiscard]] std::string join(const std::vector<std::string>& parts);

// Pass when there are no messages, otherwise fail with one failure per message.
[[nodiscard]] CheckResult result_from_messages(std::string_view check_id, Severity severity,
                                               std::vector<std::string> messages);

}  // namespace budgetam::validation
