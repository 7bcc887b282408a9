#pragma once

// cmd_parse: parse one workbook into flattened records.
// Usage: budgetam_cli parse <workbook> --source-type <TYPE> --year <YEAR>
//                           [--out-dir <dir>] [--db <path>]
int cmd_parse(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
