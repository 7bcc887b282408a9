#pragma once

#include "budgetam/core/result.h"
#include "budgetam/ingest/sheet.h"
#include "budgetam/parsing/parse_diagnostics.h"
#include "budgetam/parsing/parse_error.h"
#include "budgetam/parsing/row_classifier.h"

#include <array>
#include <cstddef>
#include <string>
#include <string_view>

namespace budgetam::parsing {

// Hierarchy level whose description block is being read. Selects the label pair.
enum class DetailLevel {
  kProgram,
  kSubprogram,
};

// Rows in one description block.
inline constexpr std::size_t kDetailWindow = 5;

// Normalized substrings the two label lines must contain, at offsets 1 and 3.
[[nodiscard]] std::array<std::string_view, 2> detail_labels(DetailLevel level) noexcept;

struct DetailLines {
  std::array<std::string, kDetailWindow> lines;  // NOLINT(readability-identifier-naming)
  std::size_t next_row{0};                       // first row not consumed
};

using DetailResult = core::Result<DetailLines, ParseError>;

// DetailCollector reads the description block that follows a program or
// subprogram header. Offsets 0, 2 and 4 are value lines (name, goal/description,
// result/type); offsets 1 and 3 are label lines.
//
// Strict mode requires both label lines to be detail lines containing the expected
// label; a mismatch is fatal. Value lines never fail: problems are recorded in the
// diagnostics. Rows past the end of the sheet read as empty.
//
// Lenient mode enforces no labels and stops at the first row that is neither a
// detail line nor empty, so the next header is left for the parser.
class DetailCollector {
 public:
  DetailCollector(const ingest::Sheet& sheet, const IRowClassifier& classifier)
      : sheet_(sheet), classifier_(classifier) {}

  [[nodiscard]] DetailResult collect_strict(std::size_t start_row, DetailLevel level,
                                            ParseDiagnostics& diagnostics) const;

  [[nodiscard]] DetailLines collect_lenient(std::size_t start_row) const;

 private:
  const ingest::Sheet& sheet_;
  const IRowClassifier& classifier_;
};

}  // namespace budgetam::parsing
