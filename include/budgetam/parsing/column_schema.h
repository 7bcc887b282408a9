#pragma once

#include "budgetam/domain/amounts.h"
#include "budgetam/domain/source_type.h"
#include "budgetam/ingest/sheet.h"

#include <cstddef>
#include <vector>

namespace budgetam::parsing {

// FieldColumn binds one financial field to the worksheet column it is read from.
struct FieldColumn {
  domain::AmountField field{domain::AmountField::kTotal};
  std::size_t column{0};
  bool percentage{false};  // stored as "71.2" or "71.2%", read as 0.712
};

// Number of leading cells the row classifier looks at for a layout.
//   classic budget law 4, Q1/Q12/Q123 10, Q1234 7; 2025 layout 7; plan 6
[[nodiscard]] std::size_t row_width(domain::Layout layout, domain::SourceType type) noexcept;

// Field-to-column mapping for one hierarchy level. kOverall is the grand-total row.
// The plan has no subprogram level and yields an empty mapping for kSubprogram.
[[nodiscard]] std::vector<FieldColumn> column_schema(domain::Layout layout,
                                                     domain::SourceType type,
                                                     domain::Level level);

// Read every mapped field of a row. Blank or non-numeric amounts become 0.0 and
// percentages are divided by 100.
[[nodiscard]] domain::LevelAmounts extract_amounts(const ingest::RawRow& row,
                                                   const std::vector<FieldColumn>& columns,
                                                   domain::SourceKind kind);

}  // namespace budgetam::parsing
