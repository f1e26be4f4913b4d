#pragma once

#include <string>
#include <string_view>

namespace idforge::core {

// Deterministic ASCII-only normalization utilities.
// These functions are locale-independent and produce byte-stable output
// across all platforms and compilers.

// normalize_ascii_lower converts ASCII uppercase (A-Z) to lowercase (a-z).
// Non-ASCII characters are preserved unchanged.
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

// starts_with_ascii_ci reports whether input begins with prefix, ignoring ASCII case.
inline bool starts_with_ascii_ci(const std::string_view input, const std::string_view prefix) {
  if (input.size() < prefix.size()) {
    return false;
  }
  return normalize_ascii_lower(input.substr(0, prefix.size())) == normalize_ascii_lower(prefix);
}

// trim removes leading and trailing whitespace (ASCII space/tab/newline)
inline std::string trim(const std::string_view input) {
  if (input.empty()) {
    return std::string{};
  }

  // Find first non-whitespace
  std::size_t start = 0;
  while (start < input.size() && (input[start] == ' ' || input[start] == '\t' ||
                                  input[start] == '\n' || input[start] == '\r')) {
    ++start;
  }

  // All whitespace
  if (start == input.size()) {
    return std::string{};
  }

  // Find last non-whitespace
  std::size_t end = input.size();
  while (end > start && (input[end - 1] == ' ' || input[end - 1] == '\t' ||
                         input[end - 1] == '\n' || input[end - 1] == '\r')) {
    --end;
  }

  return std::string{input.substr(start, end - start)};
}

}  // namespace idforge::core
