#pragma once

#include "budgetam/domain/source_type.h"
#include "budgetam/ingest/sheet.h"
#include "budgetam/parsing/row_type.h"

#include <cstddef>
#include <memory>
#include <string_view>

namespace budgetam::parsing {

// Normalized marker tokens.
inline constexpr std::string_view kGrandTotalMarker = "ընդամենը";
inline constexpr std::string_view kSubprogramSectionMarker = "ծրագրիմիջոցառումներ";

// IRowClassifier maps one row to a RowType. Predicates are tried in a fixed
// precedence order and the first match wins:
//   Empty, GrandTotal, SubprogramMarker, StateBodyHeader, ProgramHeader,
//   SubprogramHeader, DetailLine, Unknown
// Classification looks at the row only, never at parser state.
class IRowClassifier {
 public:
  virtual ~IRowClassifier() = default;

  [[nodiscard]] virtual RowType classify(const ingest::RawRow& row) const = 0;

  // Number of leading cells a row is cut or padded to before classification.
  [[nodiscard]] virtual std::size_t width() const noexcept = 0;

  // Column holding free text on detail lines.
  [[nodiscard]] virtual std::size_t detail_text_column() const noexcept = 0;

 protected:
  IRowClassifier() = default;
  IRowClassifier(const IRowClassifier&) = default;
  IRowClassifier& operator=(const IRowClassifier&) = default;
  IRowClassifier(IRowClassifier&&) = default;
  IRowClassifier& operator=(IRowClassifier&&) = default;
};

// Four-column grammar (budget law up to 2024 and all spending reports):
// col0 program code, col1 subprogram code, col2 text, col3.. amounts.
class ClassicRowClassifier final : public IRowClassifier {
 public:
  explicit ClassicRowClassifier(std::size_t width) : width_(width) {}

  [[nodiscard]] RowType classify(const ingest::RawRow& row) const override;
  [[nodiscard]] std::size_t width() const noexcept override { return width_; }
  [[nodiscard]] std::size_t detail_text_column() const noexcept override { return 2; }

 private:
  std::size_t width_;
};

// Seven-column budget law grammar from 2025 on:
// col0 state body, col1 program code, col2 "<ext>-<code>", col3..5 text, col6 amount.
class Budget2025RowClassifier final : public IRowClassifier {
 public:
  [[nodiscard]] RowType classify(const ingest::RawRow& row) const override;
  [[nodiscard]] std::size_t width() const noexcept override { return 7; }
  [[nodiscard]] std::size_t detail_text_column() const noexcept override { return 3; }
};

// Six-column medium-term plan grammar:
// col0 program code, col1 text, col2..4 three forecast-year amounts.
class MtepRowClassifier final : public IRowClassifier {
 public:
  [[nodiscard]] RowType classify(const ingest::RawRow& row) const override;
  [[nodiscard]] std::size_t width() const noexcept override { return 6; }
  [[nodiscard]] std::size_t detail_text_column() const noexcept override { return 1; }
};

[[nodiscard]] std::unique_ptr<IRowClassifier> make_row_classifier(domain::Layout layout,
                                                                  domain::SourceType type);

// Classic subprogram code cell: a bare number, or "<a>-<b>" with two numeric parts.
[[nodiscard]] bool is_subprogram_code_cell(std::string_view text);

}  // namespace budgetam::parsing
