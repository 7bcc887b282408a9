#include "budgetam/core/hashing.h"

#include <iomanip>
#include <sstream>

namespace budgetam::core {

namespace {

constexpr std::uint64_t kOffset = 14695981039346656037ull;
constexpr std::uint64_t kPrime = 1099511628211ull;

std::string to_hex(const std::uint64_t hash) {
  std::ostringstream oss;
  oss << std::hex << std::setfill('0') << std::setw(16) << hash;
  return oss.str();
}

}  // namespace

std::uint64_t stable_hash64(const std::string_view input) {
  std::uint64_t hash = kOffset;
  for (const char ch : input) {
    // Cast through unsigned char to avoid sign-extension of UTF-8 bytes.
    const auto c = static_cast<unsigned char>(ch);
    hash ^= static_cast<std::uint64_t>(c);
    hash *= kPrime;
  }
  return hash;
}

std::string stable_hash64_hex(const std::string_view input) {
  return to_hex(stable_hash64(input));
}

std::string fingerprint_bytes(const std::vector<std::uint8_t>& data) {
  std::uint64_t hash = kOffset;
  for (const std::uint8_t byte : data) {
    hash ^= static_cast<std::uint64_t>(byte);
    hash *= kPrime;
  }
  return to_hex(hash);
}

}  // namespace budgetam::core
