#include "budgetam/validation/checks/hierarchical_structure_sanity.h"

#include <algorithm>
#include <map>
#include <set>
#include <string>
#include <utility>

namespace budgetam::validation {

std::vector<CheckResult> HierarchicalStructureSanityCheck::validate(
    const std::vector<domain::FlattenedRecord>& records,
    const domain::OverallTotals& /*overall*/, const domain::SourceType /*type*/) const {
  const std::string id{check_id()};

  std::map<std::string, std::set<int>> programs_by_state_body;
  for (const auto& record : records) {
    programs_by_state_body[record.state_body].insert(record.program_code);
  }

  if (programs_by_state_body.empty()) {
    return {CheckResult::fail(id, Severity::kError, 1, {"No state bodies found"})};
  }

  std::set<std::size_t> distinct_counts;
  std::size_t max_count = 0;
  for (const auto& [state_body, programs] : programs_by_state_body) {
    distinct_counts.insert(programs.size());
    max_count = std::max(max_count, programs.size());
  }

  std::vector<std::string> messages;
  if (distinct_counts.size() == 1) {
    messages.push_back("All state bodies have identical program count (" +
                       std::to_string(*distinct_counts.begin()) +
                       "). This suggests degenerate hierarchy or parser failure.");
  }
  if (max_count == 1) {
    messages.emplace_back(
        "No state body has multiple programs. This suggests flat/broken hierarchical "
        "structure.");
  }

  if (messages.empty()) {
    return {CheckResult::pass(id, Severity::kError)};
  }
  const int count = static_cast<int>(messages.size());
  return {CheckResult::fail(id, Severity::kError, count, std::move(messages))};
}

}  // namespace budgetam::validation
