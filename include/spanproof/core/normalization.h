#pragma once

#include <string>
#include <string_view>

namespace spanproof::core {

// Deterministic ASCII-only text helpers.
// These functions are locale-independent and produce byte-stable output
// across all platforms and compilers (no std::tolower, no <locale>).

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

inline bool equals_ascii_ci(const std::string_view a, const std::string_view b) {
  return a.size() == b.size() && normalize_ascii_lower(a) == normalize_ascii_lower(b);
}

inline bool is_ascii_space(const char ch) {
  return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\f' || ch == '\v';
}

// trim_view removes leading and trailing ASCII whitespace.
inline std::string_view trim_view(const std::string_view input) {
  std::size_t start = 0;
  while (start < input.size() && is_ascii_space(input[start])) {
    ++start;
  }

  std::size_t end = input.size();
  while (end > start && is_ascii_space(input[end - 1])) {
    --end;
  }

  return input.substr(start, end - start);
}

}  // namespace spanproof::core
