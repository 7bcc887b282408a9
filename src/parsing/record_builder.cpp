#include "budgetam/parsing/record_builder.h"

#include <utility>

namespace budgetam::parsing {

void HierarchyContext::enter_state_body(std::string name, domain::LevelAmounts amounts) {
  state_body = std::move(name);
  state_body_amounts = std::move(amounts);

  program_code = 0;
  program_name.clear();
  program_goal.clear();
  program_result_desc.clear();
  program_amounts = domain::make_amounts(domain::kind_of(state_body_amounts));
}

void HierarchyContext::enter_program(const int code, domain::LevelAmounts amounts) {
  program_code = code;
  program_amounts = std::move(amounts);
  program_name.clear();
  program_goal.clear();
  program_result_desc.clear();
}

domain::FlattenedRecord build_subprogram_record(const HierarchyContext& context,
                                                SubprogramFields subprogram) {
  domain::FlattenedRecord record = build_program_record(context);
  record.program_code_ext = subprogram.program_code_ext;
  record.subprogram_code = subprogram.code;
  record.subprogram_name = std::move(subprogram.name);
  record.subprogram_desc = std::move(subprogram.desc);
  record.subprogram_type = std::move(subprogram.type);
  record.subprogram_amounts = std::move(subprogram.amounts);
  return record;
}

domain::FlattenedRecord build_program_record(const HierarchyContext& context) {
  domain::FlattenedRecord record;
  record.state_body = context.state_body;
  record.program_code = context.program_code;
  record.program_name = context.program_name;
  record.program_goal = context.program_goal;
  record.program_result_desc = context.program_result_desc;
  record.state_body_amounts = context.state_body_amounts;
  record.program_amounts = context.program_amounts;
  record.subprogram_amounts = domain::make_amounts(domain::kind_of(context.program_amounts));
  return record;
}

}  // namespace budgetam::parsing
