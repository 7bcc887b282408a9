#include "budgetam/validation/check_support.h"

#include <iomanip>
#include <set>
#include <sstream>
#include <utility>

namespace budgetam::validation {

using domain::Level;

std::vector<Level> record_levels(const domain::SourceType type) {
  if (domain::has_subprogram_level(type)) {
    return {Level::kStateBody, Level::kProgram, Level::kSubprogram};
  }
  return {Level::kStateBody, Level::kProgram};
}

std::vector<const domain::FlattenedRecord*> distinct_entities(
    const std::vector<domain::FlattenedRecord>& records, const Level level) {
  std::vector<const domain::FlattenedRecord*> entities;
  if (level == Level::kSubprogram) {
    entities.reserve(records.size());
    for (const auto& record : records) {
      entities.push_back(&record);
    }
    return entities;
  }

  std::set<std::pair<std::string, int>> seen;
  for (const auto& record : records) {
    const int code = level == Level::kProgram ? record.program_code : 0;
    if (seen.insert({record.state_body, code}).second) {
      entities.push_back(&record);
    }
  }
  return entities;
}

std::string format_fixed(const double value, const int precision) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(precision) << value;
  return out.str();
}

std::string join(const std::vector<std::string>& parts) {
  std::string joined;
  for (std::size_t i = 0; i < parts.size(); ++i) {
    if (i > 0) {
      joined += ", ";
    }
    joined += parts[i];
  }
  return joined;
}

CheckResult result_from_messages(const std::string_view check_id, const Severity severity,
                                 std::vector<std::string> messages) {
  if (messages.empty()) {
    return CheckResult::pass(std::string{check_id}, severity);
  }
  const int count = static_cast<int>(messages.size());
  return CheckResult::fail(std::string{check_id}, severity, count, std::move(messages));
}

}  // namespace budgetam::validation
