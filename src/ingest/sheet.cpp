#include "budgetam/ingest/sheet.h"

#include "budgetam/core/normalization.h"

namespace budgetam::ingest {

const std::string& RawRow::cell(const std::size_t column) const {
  static const std::string kEmpty;
  return column < cells.size() ? cells[column] : kEmpty;
}

RawRow Sheet::row(const std::size_t index, const std::size_t width) const {
  RawRow result;
  result.cells.reserve(width);
  for (std::size_t column = 0; column < width; ++column) {
    if (index < rows.size()) {
      result.cells.push_back(core::trim(rows[index].cell(column)));
    } else {
      result.cells.emplace_back();
    }
  }
  return result;
}

}  // namespace budgetam::ingest
