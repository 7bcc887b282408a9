#include "budgetam/parsing/detail_collector.h"

#include "budgetam/core/normalization.h"

namespace budgetam::parsing {

namespace {

constexpr std::array<std::string_view, 3> kProgramValueNames = {"name", "goal",
                                                                 "result description"};
constexpr std::array<std::string_view, 3> kSubprogramValueNames = {"name", "description",
                                                                    "type"};

std::string row_label(const std::size_t row) {
  return "Row " + std::to_string(row + 1);
}

}  // namespace

std::array<std::string_view, 2> detail_labels(const DetailLevel level) noexcept {
  if (level == DetailLevel::kProgram) {
    return {"ծրագրինպատակը", "վերջնականարդյունքինկարագրությունը"};
  }
  return {"միջոցառմաննկարագրությունը", "միջոցառմանտեսակը"};
}

DetailResult DetailCollector::collect_strict(const std::size_t start_row, const DetailLevel level,
                                             ParseDiagnostics& diagnostics) const {
  const auto labels = detail_labels(level);
  const auto& value_names =
      level == DetailLevel::kProgram ? kProgramValueNames : kSubprogramValueNames;
  const std::size_t text_column = classifier_.detail_text_column();

  DetailLines result;
  for (std::size_t offset = 0; offset < kDetailWindow; ++offset) {
    const std::size_t row_index = start_row + offset;
    const ingest::RawRow row = sheet_.row(row_index, classifier_.width());
    const RowType type = classifier_.classify(row);
    const std::string& text = row.cell(text_column);

    if (offset % 2 == 1) {
      const std::string_view expected = labels[offset / 2];
      const bool matches = type == RowType::kDetailLine &&
                           core::normalize_label(text).find(expected) != std::string::npos;
      if (!matches) {
        return DetailResult::err(
            detail_label_mismatch_error(row_index, std::string{expected}, text));
      }
      result.lines[offset] = text;
      continue;
    }

    const std::string_view value_name = value_names[offset / 2];
    if (type == RowType::kEmpty) {
      diagnostics.warn(row_index, row_label(row_index) + ": " + std::string{value_name} +
                                      " line is empty");
    } else if (type != RowType::kDetailLine) {
      diagnostics.warn(row_index, row_label(row_index) + ": " + std::string{value_name} +
                                      " line classified as " +
                                      std::string{row_type_name(type)} + ", text kept");
      result.lines[offset] = text;
    } else {
      result.lines[offset] = text;
    }
  }

  result.next_row = start_row + kDetailWindow;
  return DetailResult::ok(std::move(result));
}

DetailLines DetailCollector::collect_lenient(const std::size_t start_row) const {
  const std::size_t text_column = classifier_.detail_text_column();

  DetailLines result;
  std::size_t offset = 0;
  for (; offset < kDetailWindow; ++offset) {
    const std::size_t row_index = start_row + offset;
    if (row_index >= sheet_.row_count()) {
      break;
    }
    const ingest::RawRow row = sheet_.row(row_index, classifier_.width());
    const RowType type = classifier_.classify(row);
    if (type == RowType::kDetailLine) {
      result.lines[offset] = row.cell(text_column);
    } else if (type != RowType::kEmpty) {
      break;
    }
  }

  result.next_row = start_row + offset;
  return result;
}

}  // namespace budgetam::parsing
