#pragma once

// cmd_validate: parse one workbook and run every applicable validation check.
// Usage: budgetam_cli validate <workbook> --source-type <TYPE> --year <YEAR> [--strict]
//                              [--report-md <file>] [--report-json <file>] [--db <path>]
int cmd_validate(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
