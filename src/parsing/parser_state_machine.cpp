#include "budgetam/parsing/parser_state_machine.h"

#include "budgetam/core/normalization.h"
#include "budgetam/parsing/column_schema.h"

#include <string_view>
#include <utility>

namespace budgetam::parsing {

namespace {

using domain::Layout;
using domain::Level;

std::string row_label(const std::size_t index) {
  return "Row " + std::to_string(index + 1);
}

// Column holding the state body name on a state-body header.
std::size_t state_body_name_column(const Layout layout) noexcept {
  switch (layout) {
    case Layout::kBudget2025:
      return 0;
    case Layout::kMtep:
      return 1;
    case Layout::kClassic:
      break;
  }
  return 2;
}

// "<ext>-<code>" split into two integers; nullopt unless there are exactly two parts.
std::optional<std::pair<int, int>> split_compound_code(const std::string_view text) {
  const auto dash = text.find('-');
  if (dash == std::string_view::npos || text.find('-', dash + 1) != std::string_view::npos) {
    return std::nullopt;
  }
  const auto head = core::parse_integer(text.substr(0, dash));
  const auto tail = core::parse_integer(text.substr(dash + 1));
  if (!head.has_value() || !tail.has_value()) {
    return std::nullopt;
  }
  return std::make_pair(head.value(), tail.value());
}

bool is_hierarchy_row(const RowType type) noexcept {
  return type == RowType::kStateBodyHeader || type == RowType::kProgramHeader ||
         type == RowType::kSubprogramHeader || type == RowType::kSubprogramMarker;
}

}  // namespace

ParserStateMachine::ParserStateMachine(const ingest::Sheet& sheet, ParseOptions options,
                                       ParseDiagnostics& diagnostics)
    : sheet_(sheet),
      options_(options),
      diagnostics_(diagnostics),
      layout_(domain::layout_for(options.source_type, options.year)),
      kind_(domain::source_kind_of(options.source_type)),
      classifier_(make_row_classifier(layout_, options.source_type)),
      collector_(sheet, *classifier_),
      context_(kind_) {}

ParseResult ParserStateMachine::run() {
  std::size_t index = 0;
  while (index < sheet_.row_count()) {
    const ingest::RawRow row = sheet_.row(index, classifier_->width());
    const RowType type = classifier_->classify(row);
    state_ = next_state(state_, type);
    diagnostics_.note_row(type, state_);

    if (state_ == ProcessingState::kInit && is_hierarchy_row(type)) {
      diagnostics_.note_ignored_row();
      diagnostics_.warn(index, row_label(index) + ": " + std::string{row_type_name(type)} +
                                   " before grand total ignored");
      ++index;
      continue;
    }

    Step step = Step::ok(index + 1);
    switch (type) {
      case RowType::kGrandTotal:
        step = on_grand_total(index, row);
        break;
      case RowType::kStateBodyHeader:
        step = on_state_body(index, row);
        break;
      case RowType::kProgramHeader:
        step = on_program(index, row);
        break;
      case RowType::kSubprogramHeader:
        step = on_subprogram(index, row);
        break;
      default:
        break;
    }

    if (!step.has_value()) {
      return ParseResult::err(step.error());
    }
    index = step.value();
  }

  if (!overall_.has_value()) {
    return ParseResult::err(missing_grand_total_error());
  }

  ParseOutput output;
  output.records = std::move(records_);
  output.overall = std::move(overall_.value());
  output.layout = layout_;
  return ParseResult::ok(std::move(output));
}

ParserStateMachine::Step ParserStateMachine::on_grand_total(const std::size_t index,
                                                           const ingest::RawRow& row) {
  if (overall_.has_value()) {
    diagnostics_.warn(index, row_label(index) + ": duplicate grand total ignored");
    return Step::ok(index + 1);
  }

  const auto columns = column_schema(layout_, options_.source_type, Level::kOverall);
  if (kind_ == domain::SourceKind::kBudgetLaw) {
    const std::string& cell = row.cell(columns.front().column);
    if (!core::is_numeric(cell)) {
      return Step::err(grand_total_not_numeric_error(index, cell));
    }
  }

  domain::OverallTotals overall{extract_amounts(row, columns, kind_), {}};
  if (layout_ == Layout::kMtep) {
    overall.plan_years = {options_.year, options_.year + 1, options_.year + 2};
  }
  overall_ = std::move(overall);
  return Step::ok(index + 1);
}

ParserStateMachine::Step ParserStateMachine::on_state_body(const std::size_t index,
                                                          const ingest::RawRow& row) {
  program_skipped_ = false;
  context_.enter_state_body(
      row.cell(state_body_name_column(layout_)),
      extract_amounts(row, column_schema(layout_, options_.source_type, Level::kStateBody),
                      kind_));
  return Step::ok(index + 1);
}

ParserStateMachine::Step ParserStateMachine::on_program(const std::size_t index,
                                                       const ingest::RawRow& row) {
  const std::size_t code_column = layout_ == Layout::kBudget2025 ? 1 : 0;
  const auto code = core::parse_code(row.cell(code_column));
  if (!code.has_value()) {
    skip_row(index, "malformed program code '" + row.cell(code_column) + "'");
    program_skipped_ = true;
    return Step::ok(index + 1);
  }
  program_skipped_ = false;

  const auto amounts =
      extract_amounts(row, column_schema(layout_, options_.source_type, Level::kProgram), kind_);

  if (layout_ == Layout::kBudget2025) {
    context_.enter_program(code.value(), amounts);
    context_.program_name = row.cell(3);
    context_.program_goal = row.cell(4);
    context_.program_result_desc = row.cell(5);
    return Step::ok(index + 1);
  }

  context_.enter_program(code.value(), amounts);

  if (layout_ == Layout::kMtep) {
    DetailLines details = collector_.collect_lenient(index + 1);
    if (details.lines[0].empty()) {
      context_.program_name = row.cell(1);
    } else {
      context_.program_name = std::move(details.lines[0]);
    }
    context_.program_goal = std::move(details.lines[2]);
    context_.program_result_desc = std::move(details.lines[4]);
    records_.push_back(build_program_record(context_));
    return Step::ok(details.next_row);
  }

  auto details = collector_.collect_strict(index + 1, DetailLevel::kProgram, diagnostics_);
  if (!details.has_value()) {
    return Step::err(details.error());
  }
  DetailLines& lines = details.value();
  context_.program_name = std::move(lines.lines[0]);
  context_.program_goal = std::move(lines.lines[2]);
  context_.program_result_desc = std::move(lines.lines[4]);
  return Step::ok(lines.next_row);
}

ParserStateMachine::Step ParserStateMachine::on_subprogram(const std::size_t index,
                                                          const ingest::RawRow& row) {
  if (program_skipped_) {
    skip_row(index, "subprogram of a skipped program");
    return Step::ok(index + 1);
  }

  const auto columns = column_schema(layout_, options_.source_type, Level::kSubprogram);

  if (layout_ == Layout::kBudget2025) {
    const auto code = split_compound_code(row.cell(2));
    if (!code.has_value()) {
      skip_row(index, "malformed subprogram code '" + row.cell(2) + "'");
      return Step::ok(index + 1);
    }
    if (!core::is_numeric(row.cell(6))) {
      skip_row(index, "subprogram amount is not numeric: '" + row.cell(6) + "'");
      return Step::ok(index + 1);
    }

    SubprogramFields fields;
    fields.program_code_ext = code->first;
    fields.code = code->second;
    fields.name = row.cell(3);
    fields.desc = row.cell(4);
    fields.type = row.cell(5);
    fields.amounts = extract_amounts(row, columns, kind_);
    records_.push_back(build_subprogram_record(context_, std::move(fields)));
    return Step::ok(index + 1);
  }

  if (state_ != ProcessingState::kSubprogram) {
    skip_row(index, "subprogram header outside the program activities section");
    return Step::ok(index + 1);
  }

  const std::string& code_text = row.cell(1);
  SubprogramFields fields;
  if (code_text.find('-') != std::string::npos) {
    const auto code = split_compound_code(code_text);
    if (!code.has_value()) {
      skip_row(index, "malformed subprogram code '" + code_text + "'");
      return Step::ok(index + 1);
    }
    fields.code = code->second;
  } else {
    const auto code = core::parse_code(code_text);
    if (!code.has_value()) {
      skip_row(index, "malformed subprogram code '" + code_text + "'");
      return Step::ok(index + 1);
    }
    fields.code = code.value();
  }
  fields.amounts = extract_amounts(row, columns, kind_);

  auto details = collector_.collect_strict(index + 1, DetailLevel::kSubprogram, diagnostics_);
  if (!details.has_value()) {
    return Step::err(details.error());
  }
  DetailLines& lines = details.value();
  fields.name = std::move(lines.lines[0]);
  fields.desc = std::move(lines.lines[2]);
  fields.type = std::move(lines.lines[4]);
  records_.push_back(build_subprogram_record(context_, std::move(fields)));
  return Step::ok(lines.next_row);
}

void ParserStateMachine::skip_row(const std::size_t index, const std::string& reason) {
  diagnostics_.warn(index, row_label(index) + ": " + reason + ", row skipped");
  diagnostics_.note_skipped_row();
}

ParseResult parse_sheet(const ingest::Sheet& sheet, const ParseOptions& options,
                        ParseDiagnostics& diagnostics) {
  ParserStateMachine machine(sheet, options, diagnostics);
  return machine.run();
}

}  // namespace budgetam::parsing
