#include "budgetam/domain/amounts.h"

#include <array>
#include <utility>

namespace budgetam::domain {

namespace {

constexpr std::array<std::pair<AmountField, std::string_view>, 11> kFieldNames = {{
    {AmountField::kTotal, "total"},
    {AmountField::kAnnualPlan, "annual_plan"},
    {AmountField::kRevAnnualPlan, "rev_annual_plan"},
    {AmountField::kPeriodPlan, "period_plan"},
    {AmountField::kRevPeriodPlan, "rev_period_plan"},
    {AmountField::kActual, "actual"},
    {AmountField::kActualVsRevAnnualPlan, "actual_vs_rev_annual_plan"},
    {AmountField::kActualVsRevPeriodPlan, "actual_vs_rev_period_plan"},
    {AmountField::kTotalY0, "total_y0"},
    {AmountField::kTotalY1, "total_y1"},
    {AmountField::kTotalY2, "total_y2"},
}};

// Slot lookup per shape; nullptr when the shape does not carry the field.
std::optional<double>* slot(BudgetLawAmounts& amounts, const AmountField field) noexcept {
  return field == AmountField::kTotal ? &amounts.total : nullptr;
}

std::optional<double>* slot(PeriodSpendingAmounts& amounts, const AmountField field) noexcept {
  switch (field) {
    case AmountField::kAnnualPlan:
      return &amounts.annual_plan;
    case AmountField::kRevAnnualPlan:
      return &amounts.rev_annual_plan;
    case AmountField::kPeriodPlan:
      return &amounts.period_plan;
    case AmountField::kRevPeriodPlan:
      return &amounts.rev_period_plan;
    case AmountField::kActual:
      return &amounts.actual;
    case AmountField::kActualVsRevAnnualPlan:
      return &amounts.actual_vs_rev_annual_plan;
    case AmountField::kActualVsRevPeriodPlan:
      return &amounts.actual_vs_rev_period_plan;
    default:
      return nullptr;
  }
}

std::optional<double>* slot(YearEndSpendingAmounts& amounts, const AmountField field) noexcept {
  switch (field) {
    case AmountField::kAnnualPlan:
      return &amounts.annual_plan;
    case AmountField::kRevAnnualPlan:
      return &amounts.rev_annual_plan;
    case AmountField::kActual:
      return &amounts.actual;
    case AmountField::kActualVsRevAnnualPlan:
      return &amounts.actual_vs_rev_annual_plan;
    default:
      return nullptr;
  }
}

std::optional<double>* slot(PlanAmounts& amounts, const AmountField field) noexcept {
  switch (field) {
    case AmountField::kTotalY0:
      return &amounts.total_y0;
    case AmountField::kTotalY1:
      return &amounts.total_y1;
    case AmountField::kTotalY2:
      return &amounts.total_y2;
    default:
      return nullptr;
  }
}

std::optional<double>* find_slot(LevelAmounts& amounts, const AmountField field) noexcept {
  return std::visit([field](auto& shape) { return slot(shape, field); }, amounts);
}

}  // namespace

std::string_view level_prefix(const Level level) noexcept {
  switch (level) {
    case Level::kOverall:
      return "overall";
    case Level::kStateBody:
      return "state_body";
    case Level::kProgram:
      return "program";
    case Level::kSubprogram:
      return "subprogram";
  }
  return "overall";
}

std::string_view level_display_name(const Level level) noexcept {
  switch (level) {
    case Level::kOverall:
      return "Overall";
    case Level::kStateBody:
      return "State body";
    case Level::kProgram:
      return "Program";
    case Level::kSubprogram:
      return "Subprogram";
  }
  return "Overall";
}

std::string_view amount_field_name(const AmountField field) noexcept {
  for (const auto& [value, name] : kFieldNames) {
    if (value == field) {
      return name;
    }
  }
  return "total";
}

std::optional<AmountField> amount_field_from_name(const std::string_view name) noexcept {
  for (const auto& [value, field_name] : kFieldNames) {
    if (field_name == name) {
      return value;
    }
  }
  return std::nullopt;
}

bool is_percentage_field(const AmountField field) noexcept {
  return field == AmountField::kActualVsRevAnnualPlan ||
         field == AmountField::kActualVsRevPeriodPlan;
}

std::string column_name(const Level level, const AmountField field) {
  std::string name{level_prefix(level)};
  name += '_';
  name += amount_field_name(field);
  return name;
}

LevelAmounts make_amounts(const SourceKind kind) {
  switch (kind) {
    case SourceKind::kBudgetLaw:
      return BudgetLawAmounts{};
    case SourceKind::kPeriodSpending:
      return PeriodSpendingAmounts{};
    case SourceKind::kYearEndSpending:
      return YearEndSpendingAmounts{};
    case SourceKind::kMediumTermPlan:
      return PlanAmounts{};
  }
  return BudgetLawAmounts{};
}

SourceKind kind_of(const LevelAmounts& amounts) noexcept {
  return static_cast<SourceKind>(amounts.index());
}

const std::vector<AmountField>& amount_fields(const SourceKind kind) {
  static const std::vector<AmountField> kBudgetLaw = {AmountField::kTotal};
  static const std::vector<AmountField> kPeriod = {
      AmountField::kAnnualPlan,           AmountField::kRevAnnualPlan,
      AmountField::kPeriodPlan,           AmountField::kRevPeriodPlan,
      AmountField::kActual,               AmountField::kActualVsRevAnnualPlan,
      AmountField::kActualVsRevPeriodPlan};
  static const std::vector<AmountField> kYearEnd = {
      AmountField::kAnnualPlan, AmountField::kRevAnnualPlan, AmountField::kActual,
      AmountField::kActualVsRevAnnualPlan};
  static const std::vector<AmountField> kPlan = {AmountField::kTotalY0, AmountField::kTotalY1,
                                                 AmountField::kTotalY2};

  switch (kind) {
    case SourceKind::kBudgetLaw:
      return kBudgetLaw;
    case SourceKind::kPeriodSpending:
      return kPeriod;
    case SourceKind::kYearEndSpending:
      return kYearEnd;
    case SourceKind::kMediumTermPlan:
      return kPlan;
  }
  return kBudgetLaw;
}

std::vector<AmountField> currency_fields(const SourceKind kind) {
  std::vector<AmountField> fields;
  for (const AmountField field : amount_fields(kind)) {
    if (!is_percentage_field(field)) {
      fields.push_back(field);
    }
  }
  return fields;
}

std::vector<AmountField> percentage_fields(const SourceKind kind) {
  std::vector<AmountField> fields;
  for (const AmountField field : amount_fields(kind)) {
    if (is_percentage_field(field)) {
      fields.push_back(field);
    }
  }
  return fields;
}

bool has_field(const LevelAmounts& amounts, const AmountField field) noexcept {
  // find_slot only inspects the shape; the const_cast never leads to a write.
  return find_slot(const_cast<LevelAmounts&>(amounts), field) != nullptr;
}

std::optional<double> amount_of(const LevelAmounts& amounts, const AmountField field) {
  const std::optional<double>* value = find_slot(const_cast<LevelAmounts&>(amounts), field);
  if (value == nullptr) {
    return std::nullopt;
  }
  return *value;
}

bool set_amount(LevelAmounts& amounts, const AmountField field, const std::optional<double> value) {
  std::optional<double>* target = find_slot(amounts, field);
  if (target == nullptr) {
    return false;
  }
  *target = value;
  return true;
}

}  // namespace budgetam::domain
