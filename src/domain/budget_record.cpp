#include "budgetam/domain/budget_record.h"

#include <charconv>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace budgetam::domain {

namespace {

// Identifier columns of the classic layout, in output order.
const std::vector<std::string>& classic_identifier_columns() {
  static const std::vector<std::string> kColumns = {
      "state_body",      "program_code",    "program_name",    "program_goal",
      "program_result_desc", "subprogram_code", "subprogram_name", "subprogram_desc",
      "subprogram_type"};
  return kColumns;
}

std::string optional_int_cell(const std::optional<int>& value) {
  return value.has_value() ? std::to_string(value.value()) : std::string{};
}

// Resolve "state_body_annual_plan" into (kStateBody, kAnnualPlan).
std::optional<std::pair<Level, AmountField>> parse_amount_column(const std::string& column) {
  for (const Level level : {Level::kStateBody, Level::kProgram, Level::kSubprogram}) {
    const std::string prefix = std::string{level_prefix(level)} + "_";
    if (column.starts_with(prefix)) {
      const auto field = amount_field_from_name(std::string_view{column}.substr(prefix.size()));
      if (field.has_value()) {
        return std::make_pair(level, field.value());
      }
    }
  }
  return std::nullopt;
}

}  // namespace

const LevelAmounts& amounts_at(const FlattenedRecord& record, const Level level) {
  switch (level) {
    case Level::kStateBody:
      return record.state_body_amounts;
    case Level::kProgram:
      return record.program_amounts;
    case Level::kSubprogram:
      return record.subprogram_amounts;
    case Level::kOverall:
      break;
  }
  throw std::invalid_argument("amounts_at: records carry no overall amounts");
}

std::string record_locator(const FlattenedRecord& record) {
  return record.state_body + " | " + std::to_string(record.program_code) + " | " +
         optional_int_cell(record.subprogram_code);
}

std::vector<std::string> output_columns(const SourceType type, const Layout layout) {
  const SourceKind kind = source_kind_of(type);

  if (layout == Layout::kBudget2025) {
    return {"state_body",      "state_body_total", "program_code",        "program_code_ext",
            "program_name",    "program_goal",     "program_result_desc", "program_total",
            "subprogram_code", "subprogram_name",  "subprogram_desc",     "subprogram_type",
            "subprogram_total"};
  }

  if (layout == Layout::kMtep) {
    std::vector<std::string> columns = {"state_body", "program_code", "program_name",
                                        "program_goal", "program_result_desc"};
    for (const Level level : {Level::kStateBody, Level::kProgram}) {
      for (const AmountField field : amount_fields(kind)) {
        columns.push_back(column_name(level, field));
      }
    }
    return columns;
  }

  std::vector<std::string> columns = classic_identifier_columns();
  for (const Level level : {Level::kStateBody, Level::kProgram, Level::kSubprogram}) {
    for (const AmountField field : amount_fields(kind)) {
      columns.push_back(column_name(level, field));
    }
  }
  return columns;
}

std::string format_number(const double value) {
  if (std::isfinite(value) && value == std::trunc(value) && std::fabs(value) < 1e15) {
    return std::to_string(static_cast<long long>(value));
  }
  char buffer[64];
  const auto [ptr, ec] = std::to_chars(buffer, buffer + sizeof(buffer), value);
  if (ec != std::errc{}) {
    return std::to_string(value);
  }
  return std::string(buffer, ptr);
}

std::string record_cell(const FlattenedRecord& record, const std::string& column) {
  if (column == "state_body") {
    return record.state_body;
  }
  if (column == "program_code") {
    return std::to_string(record.program_code);
  }
  if (column == "program_code_ext") {
    return optional_int_cell(record.program_code_ext);
  }
  if (column == "program_name") {
    return record.program_name;
  }
  if (column == "program_goal") {
    return record.program_goal;
  }
  if (column == "program_result_desc") {
    return record.program_result_desc;
  }
  if (column == "subprogram_code") {
    return optional_int_cell(record.subprogram_code);
  }
  if (column == "subprogram_name") {
    return record.subprogram_name;
  }
  if (column == "subprogram_desc") {
    return record.subprogram_desc;
  }
  if (column == "subprogram_type") {
    return record.subprogram_type;
  }

  const auto amount_column = parse_amount_column(column);
  if (!amount_column.has_value()) {
    return {};
  }
  const auto value = amount_of(amounts_at(record, amount_column->first), amount_column->second);
  return value.has_value() ? format_number(value.value()) : std::string{};
}

nlohmann::json amounts_to_json(const LevelAmounts& amounts) {
  nlohmann::json j = nlohmann::json::object();
  for (const AmountField field : amount_fields(kind_of(amounts))) {
    const auto value = amount_of(amounts, field);
    if (value.has_value()) {
      j[std::string{amount_field_name(field)}] = value.value();
    } else {
      j[std::string{amount_field_name(field)}] = nullptr;
    }
  }
  return j;
}

LevelAmounts amounts_from_json(const nlohmann::json& j, const SourceKind kind) {
  LevelAmounts amounts = make_amounts(kind);
  for (const AmountField field : amount_fields(kind)) {
    const std::string key{amount_field_name(field)};
    if (j.contains(key) && j.at(key).is_number()) {
      set_amount(amounts, field, j.at(key).get<double>());
    }
  }
  return amounts;
}

std::string json_text(const nlohmann::json& j, const int indent) {
  return j.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

nlohmann::json overall_to_json(const OverallTotals& overall) {
  nlohmann::json j = nlohmann::json::object();
  for (const AmountField field : amount_fields(kind_of(overall.amounts))) {
    const std::string key = column_name(Level::kOverall, field);
    const auto value = amount_of(overall.amounts, field);
    if (value.has_value()) {
      j[key] = value.value();
    } else {
      j[key] = nullptr;
    }
  }
  if (kind_of(overall.amounts) == SourceKind::kMediumTermPlan) {
    j["plan_years"] = overall.plan_years;
  }
  return j;
}

OverallTotals overall_from_json(const nlohmann::json& j, const SourceKind kind) {
  OverallTotals overall{make_amounts(kind), {}};
  for (const AmountField field : amount_fields(kind)) {
    const std::string key = column_name(Level::kOverall, field);
    if (j.contains(key) && j.at(key).is_number()) {
      set_amount(overall.amounts, field, j.at(key).get<double>());
    }
  }
  if (j.contains("plan_years") && j.at("plan_years").is_array()) {
    overall.plan_years = j.at("plan_years").get<std::vector<int>>();
  }
  return overall;
}

}  // namespace budgetam::domain
