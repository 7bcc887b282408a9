#pragma once

namespace budgetam::core {

// kVersion is the current software version string, printed by budgetam_cli.
constexpr const char* kVersion = "0.1.0";

}  // namespace budgetam::core
