#pragma once

#include "budgetam/domain/amounts.h"
#include "budgetam/domain/budget_record.h"

#include <optional>
#include <string>

namespace budgetam::parsing {

// HierarchyContext is the state body and program the scan is currently inside.
// A state-body header resets the program part.
struct HierarchyContext {
  explicit HierarchyContext(domain::SourceKind kind)
      : state_body_amounts(domain::make_amounts(kind)), program_amounts(domain::make_amounts(kind)) {}

  std::string state_body;                   // NOLINT(readability-identifier-naming)
  domain::LevelAmounts state_body_amounts;  // NOLINT(readability-identifier-naming)
  int program_code{0};                      // NOLINT(readability-identifier-naming)
  std::string program_name;                 // NOLINT(readability-identifier-naming)
  std::string program_goal;                 // NOLINT(readability-identifier-naming)
  std::string program_result_desc;          // NOLINT(readability-identifier-naming)
  domain::LevelAmounts program_amounts;     // NOLINT(readability-identifier-naming)

  void enter_state_body(std::string name, domain::LevelAmounts amounts);
  void enter_program(int code, domain::LevelAmounts amounts);
};

// Leaf-level fields read from one subprogram header and its description block.
struct SubprogramFields {
  int code{0};                          // NOLINT(readability-identifier-naming)
  std::optional<int> program_code_ext;  // 2025 layout only
  std::string name;                     // NOLINT(readability-identifier-naming)
  std::string desc;                     // NOLINT(readability-identifier-naming)
  std::string type;                     // NOLINT(readability-identifier-naming)
  domain::LevelAmounts amounts;         // NOLINT(readability-identifier-naming)
};

// One record per accepted subprogram: context frozen at that row plus the leaf fields.
[[nodiscard]] domain::FlattenedRecord build_subprogram_record(const HierarchyContext& context,
                                                              SubprogramFields subprogram);

// One record per program for layouts without a subprogram level. Subprogram
// fields are left empty and the subprogram amounts carry no values.
[[nodiscard]] domain::FlattenedRecord build_program_record(const HierarchyContext& context);

}  // namespace budgetam::parsing
