#include "budgetam/parsing/row_type.h"

namespace budgetam::parsing {

std::string_view row_type_name(const RowType type) noexcept {
  switch (type) {
    case RowType::kEmpty:
      return "Empty";
    case RowType::kGrandTotal:
      return "GrandTotal";
    case RowType::kSubprogramMarker:
      return "SubprogramMarker";
    case RowType::kStateBodyHeader:
      return "StateBodyHeader";
    case RowType::kProgramHeader:
      return "ProgramHeader";
    case RowType::kSubprogramHeader:
      return "SubprogramHeader";
    case RowType::kDetailLine:
      return "DetailLine";
    case RowType::kUnknown:
      return "Unknown";
  }
  return "Unknown";
}

std::string_view processing_state_name(const ProcessingState state) noexcept {
  switch (state) {
    case ProcessingState::kInit:
      return "Init";
    case ProcessingState::kReady:
      return "Ready";
    case ProcessingState::kStateBody:
      return "StateBody";
    case ProcessingState::kProgram:
      return "Program";
    case ProcessingState::kSubprogram:
      return "Subprogram";
  }
  return "Init";
}

ProcessingState next_state(const ProcessingState current, const RowType type) noexcept {
  if (type == RowType::kGrandTotal) {
    return ProcessingState::kReady;
  }
  // Nothing but the grand total leaves Init.
  if (current == ProcessingState::kInit) {
    return current;
  }
  switch (type) {
    case RowType::kStateBodyHeader:
      return ProcessingState::kStateBody;
    case RowType::kProgramHeader:
      return ProcessingState::kProgram;
    case RowType::kSubprogramMarker:
      return ProcessingState::kSubprogram;
    default:
      return current;
  }
}

}  // namespace budgetam::parsing
