#include "budgetam/core/normalization.h"

#include <charconv>
#include <cmath>
#include <limits>
#include <system_error>

namespace budgetam::core {

namespace {

bool is_ascii_space(const char ch) {
  return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\f' || ch == '\v';
}

// NBSP (U+00A0) is common in exported workbooks and is treated as whitespace.
bool starts_with_nbsp(const std::string_view input, const std::size_t pos) {
  return pos + 1 < input.size() && static_cast<unsigned char>(input[pos]) == 0xC2 &&
         static_cast<unsigned char>(input[pos + 1]) == 0xA0;
}

bool ends_with_nbsp(const std::string_view input, const std::size_t end) {
  return end >= 2 && static_cast<unsigned char>(input[end - 2]) == 0xC2 &&
         static_cast<unsigned char>(input[end - 1]) == 0xA0;
}

// Punctuation stripped from labels, as UTF-8 sequences.
constexpr std::string_view kLabelPunctuation[] = {
    ":", ".", "-", "_",
    "\xD5\x9D",      // ՝ U+055D Armenian comma
    "\xD6\x89",      // ։ U+0589 Armenian full stop
    "\xE2\x80\x94",  // — em dash
    "\xE2\x80\x93",  // – en dash
    "\xC2\xA0",      // NBSP
};

}  // namespace

std::string trim(const std::string_view input) {
  std::size_t start = 0;
  while (start < input.size()) {
    if (is_ascii_space(input[start])) {
      ++start;
    } else if (starts_with_nbsp(input, start)) {
      start += 2;
    } else {
      break;
    }
  }

  std::size_t end = input.size();
  while (end > start) {
    if (is_ascii_space(input[end - 1])) {
      --end;
    } else if (end - start >= 2 && ends_with_nbsp(input, end)) {
      end -= 2;
    } else {
      break;
    }
  }

  return std::string{input.substr(start, end - start)};
}

std::string utf8_lower(const std::string_view input) {
  std::string result;
  result.reserve(input.size());

  for (std::size_t i = 0; i < input.size(); ++i) {
    const auto b0 = static_cast<unsigned char>(input[i]);
    if (b0 >= 'A' && b0 <= 'Z') {
      constexpr char kCaseOffset = 'a' - 'A';
      result.push_back(static_cast<char>(input[i] + kCaseOffset));
      continue;
    }

    // Two-byte sequence: decode, shift Armenian capitals U+0531..U+0556 by 0x30.
    if ((b0 & 0xE0) == 0xC0 && i + 1 < input.size()) {
      const auto b1 = static_cast<unsigned char>(input[i + 1]);
      unsigned int cp = ((b0 & 0x1Fu) << 6) | (b1 & 0x3Fu);
      if (cp >= 0x531 && cp <= 0x556) {
        cp += 0x30;
        result.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        result.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
      } else {
        result.push_back(input[i]);
        result.push_back(input[i + 1]);
      }
      ++i;
      continue;
    }

    result.push_back(input[i]);
  }

  return result;
}

std::string normalize_label(const std::string_view input) {
  std::string lowered = utf8_lower(trim(input));

  std::string result;
  result.reserve(lowered.size());
  std::string_view rest{lowered};
  while (!rest.empty()) {
    if (is_ascii_space(rest.front())) {
      rest.remove_prefix(1);
      continue;
    }
    bool stripped = false;
    for (const auto punct : kLabelPunctuation) {
      if (rest.starts_with(punct)) {
        rest.remove_prefix(punct.size());
        stripped = true;
        break;
      }
    }
    if (!stripped) {
      result.push_back(rest.front());
      rest.remove_prefix(1);
    }
  }
  return result;
}

bool is_blank(const std::string_view input) {
  return trim(input).empty();
}

std::optional<double> parse_number(const std::string_view input) {
  const std::string text = trim(input);
  if (text.empty()) {
    return std::nullopt;
  }

  std::string_view digits{text};
  // from_chars rejects a leading '+', spreadsheet exports do not.
  if (digits.front() == '+') {
    digits.remove_prefix(1);
    if (digits.empty() || digits.front() == '-' || digits.front() == '+') {
      return std::nullopt;
    }
  }

  double value = 0.0;
  const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
  if (ec != std::errc{} || ptr != digits.data() + digits.size()) {
    return std::nullopt;
  }
  return value;
}

bool is_numeric(const std::string_view input) {
  return parse_number(input).has_value();
}

double parse_amount(const std::string_view input) {
  return parse_number(input).value_or(0.0);
}

double parse_fraction(const std::string_view input) {
  std::string text;
  text.reserve(input.size());
  for (const char ch : input) {
    if (ch != '%') {
      text.push_back(ch);
    }
  }

  const auto value = parse_number(text);
  if (!value.has_value()) {
    return 0.0;
  }
  if (!std::isfinite(*value)) {
    return *value;
  }

  // Divide by 100 in decimal: lower the exponent by two and let from_chars round once,
  // so "71.2" gives the double nearest 0.712 rather than 71.2 / 100.0.
  std::string decimal = trim(text);
  if (decimal.front() == '+') {
    decimal.erase(0, 1);
  }
  int exponent = 0;
  const auto mark = decimal.find_first_of("eE");
  if (mark != std::string::npos) {
    const auto parsed = parse_integer(std::string_view{decimal}.substr(mark + 1));
    if (!parsed.has_value()) {
      return *value / 100.0;
    }
    exponent = *parsed;
    decimal.resize(mark);
  }
  decimal += "e" + std::to_string(static_cast<long long>(exponent) - 2);

  double fraction = 0.0;
  const auto [ptr, ec] =
      std::from_chars(decimal.data(), decimal.data() + decimal.size(), fraction);
  if (ec != std::errc{} || ptr != decimal.data() + decimal.size()) {
    return *value / 100.0;
  }
  return fraction;
}

std::optional<int> parse_integer(const std::string_view input) {
  const std::string text = trim(input);
  std::string_view digits{text};
  if (!digits.empty() && digits.front() == '+') {
    digits.remove_prefix(1);
  }
  if (digits.empty()) {
    return std::nullopt;
  }

  int value = 0;
  const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
  if (ec != std::errc{} || ptr != digits.data() + digits.size()) {
    return std::nullopt;
  }
  return value;
}

std::optional<int> parse_code(const std::string_view input) {
  const auto value = parse_number(input);
  if (!value.has_value() || !std::isfinite(*value) || std::trunc(*value) != *value) {
    return std::nullopt;
  }
  if (*value < static_cast<double>(std::numeric_limits<int>::min()) ||
      *value > static_cast<double>(std::numeric_limits<int>::max())) {
    return std::nullopt;
  }
  return static_cast<int>(*value);
}

}  // namespace budgetam::core
