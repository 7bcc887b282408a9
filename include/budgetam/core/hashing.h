#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace budgetam::core {

// FNV-1a 64-bit. Used as the content fingerprint of an input workbook, so reports and
// stored datasets can be tied to the exact bytes they were produced from.
std::uint64_t stable_hash64(std::string_view input);
std::string stable_hash64_hex(std::string_view input);

// Fingerprint of raw file bytes (16 lowercase hex digits).
std::string fingerprint_bytes(const std::vector<std::uint8_t>& data);

}  // namespace budgetam::core
