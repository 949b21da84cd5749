#pragma once

#include "spanproof/core/result.h"

#include <string>
#include <string_view>
#include <vector>

namespace spanproof::core {

// GlobPattern is a compiled shell-style wildcard pattern used to match span names.
//
// Supported syntax:
//   *        any run of characters (including none)
//   ?        exactly one character
//   [abc]    one character from the set
//   [a-z]    one character from the range
//   [!a-z]   one character not in the set (also [^...])
//   [[] []]  bracket-escaped metacharacters
//
// Span names are flat identifiers, not paths, so '*' also crosses '.' and '/'.
// Invalid patterns (unclosed '[' or a reversed range) are rejected by compile().
class GlobPattern {
 public:
  [[nodiscard]] static Result<GlobPattern> compile(std::string_view pattern);

  [[nodiscard]] bool matches(std::string_view text) const;
  [[nodiscard]] const std::string& source() const noexcept { return source_; }

  // is_literal is true when the pattern has no metacharacters; matching reduces to equality.
  [[nodiscard]] bool is_literal() const noexcept { return literal_; }

 private:
  enum class TokenType {
    kChar,
    kAnyOne,
    kAnyRun,
    kSet,
  };

  struct CharRange {
    char lo;
    char hi;
  };

  struct Token {
    TokenType type{TokenType::kChar};
    char ch{'\0'};
    bool negated{false};
    std::vector<CharRange> ranges;
  };

  GlobPattern() = default;

  [[nodiscard]] static bool token_matches(const Token& token, char ch);

  std::string source_;
  std::vector<Token> tokens_;
  bool literal_{true};
};

}  // namespace spanproof::core
