#pragma once

#include <string_view>

namespace budgetam::parsing {

// RowType is the classification of one worksheet row.
enum class RowType {
  kEmpty,
  kGrandTotal,
  kSubprogramMarker,
  kStateBodyHeader,
  kProgramHeader,
  kSubprogramHeader,
  kDetailLine,
  kUnknown,
};

// ProcessingState is the hierarchy section the parser is currently in.
enum class ProcessingState {
  kInit,
  kReady,
  kStateBody,
  kProgram,
  kSubprogram,
};

[[nodiscard]] std::string_view row_type_name(RowType type) noexcept;
[[nodiscard]] std::string_view processing_state_name(ProcessingState state) noexcept;

// State after consuming a row of the given type. Rows that are not hierarchy
// markers leave the state unchanged.
[[nodiscard]] ProcessingState next_state(ProcessingState current, RowType type) noexcept;

}  // namespace budgetam::parsing
