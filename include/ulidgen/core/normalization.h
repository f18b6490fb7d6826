#pragma once

#include <string>
#include <string_view>

namespace ulidgen::core {

// Deterministic ASCII-only case mapping.
// Locale-independent: only A-Z / a-z are touched, every other byte is preserved.

// normalize_ascii_lower converts ASCII uppercase (A-Z) to lowercase (a-z).
inline std::string normalize_ascii_lower(const std::string_view input) {
  std::string result;
  result.reserve(input.size());

  for (const char ch : input) {
    if (ch >= 'A' && ch <= 'Z') {
      constexpr char kCaseOffset = 'a' - 'A';
      result.push_back(static_cast<char>(ch + kCaseOffset));
    } else {
      result.push_back(ch);
    }
  }

  return result;
}

// normalize_ascii_upper converts ASCII lowercase (a-z) to uppercase (A-Z).
inline std::string normalize_ascii_upper(const std::string_view input) {
  std::string result;
  result.reserve(input.size());

  for (const char ch : input) {
    if (ch >= 'a' && ch <= 'z') {
      constexpr char kCaseOffset = 'a' - 'A';
      result.push_back(static_cast<char>(ch - kCaseOffset));
    } else {
      result.push_back(ch);
    }
  }

  return result;
}

}  // namespace ulidgen::core
