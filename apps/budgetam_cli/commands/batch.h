#pragma once

// cmd_batch: parse and validate every workbook listed in a manifest, one after another.
// Usage: budgetam_cli batch --manifest <file> [--out-dir <dir>] [--strict] [--db <path>]
int cmd_batch(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
