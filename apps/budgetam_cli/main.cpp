#include "budgetam/core/version.h"

#include "commands/batch.h"
#include "commands/command_support.h"
#include "commands/parse.h"
#include "commands/validate.h"

#include <iostream>
#include <string>

namespace {

void print_usage() {
  std::cerr << "budgetam " << budgetam::core::kVersion << "\n"
            << "Usage: budgetam_cli <command> [options]\n"
            << "Commands:\n"
            << "  parse     Parse a workbook into flattened records\n"
            << "  validate  Parse a workbook and run the validation checks\n"
            << "  batch     Parse and validate every workbook in a manifest\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc < 2) {
    print_usage();
    return kExitUsage;
  }

  const std::string subcommand = argv[1];
  if (subcommand == "parse") {
    return cmd_parse(argc, argv);
  }
  if (subcommand == "validate") {
    return cmd_validate(argc, argv);
  }
  if (subcommand == "batch") {
    return cmd_batch(argc, argv);
  }
  if (subcommand == "--version") {
    std::cout << budgetam::core::kVersion << "\n";
    return kExitOk;
  }
  if (subcommand == "--help" || subcommand == "-h") {
    print_usage();
    return kExitOk;
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_usage();
  return kExitUsage;
}
