#include "budgetam/parsing/column_schema.h"

#include "budgetam/core/normalization.h"

namespace budgetam::parsing {

using domain::AmountField;
using domain::Layout;
using domain::Level;
using domain::SourceKind;
using domain::SourceType;

std::size_t row_width(const Layout layout, const SourceType type) noexcept {
  switch (layout) {
    case Layout::kBudget2025:
      return 7;
    case Layout::kMtep:
      return 6;
    case Layout::kClassic:
      break;
  }
  switch (domain::source_kind_of(type)) {
    case SourceKind::kPeriodSpending:
      return 10;
    case SourceKind::kYearEndSpending:
      return 7;
    default:
      return 4;
  }
}

std::vector<FieldColumn> column_schema(const Layout layout, const SourceType type,
                                       const Level level) {
  if (layout == Layout::kMtep) {
    if (level == Level::kSubprogram) {
      return {};
    }
    return {{AmountField::kTotalY0, 2, false},
            {AmountField::kTotalY1, 3, false},
            {AmountField::kTotalY2, 4, false}};
  }

  if (layout == Layout::kBudget2025) {
    return {{AmountField::kTotal, 6, false}};
  }

  // Classic rows put every level's amounts in the same columns.
  switch (domain::source_kind_of(type)) {
    case SourceKind::kPeriodSpending:
      return {{AmountField::kAnnualPlan, 3, false},
              {AmountField::kRevAnnualPlan, 4, false},
              {AmountField::kPeriodPlan, 5, false},
              {AmountField::kRevPeriodPlan, 6, false},
              {AmountField::kActual, 7, false},
              {AmountField::kActualVsRevAnnualPlan, 8, true},
              {AmountField::kActualVsRevPeriodPlan, 9, true}};
    case SourceKind::kYearEndSpending:
      return {{AmountField::kAnnualPlan, 3, false},
              {AmountField::kRevAnnualPlan, 4, false},
              {AmountField::kActual, 5, false},
              {AmountField::kActualVsRevAnnualPlan, 6, true}};
    default:
      return {{AmountField::kTotal, 3, false}};
  }
}

domain::LevelAmounts extract_amounts(const ingest::RawRow& row,
                                     const std::vector<FieldColumn>& columns,
                                     const SourceKind kind) {
  domain::LevelAmounts amounts = domain::make_amounts(kind);
  for (const FieldColumn& mapping : columns) {
    const std::string& text = row.cell(mapping.column);
    const double value =
        mapping.percentage ? core::parse_fraction(text) : core::parse_amount(text);
    domain::set_amount(amounts, mapping.field, value);
  }
  return amounts;
}

}  // namespace budgetam::parsing
