#include "spanproof/core/glob.h"

#include <cstddef>
#include <string>
#include <utility>

namespace spanproof::core {

Result<GlobPattern> GlobPattern::compile(const std::string_view pattern) {
  GlobPattern compiled;
  compiled.source_ = std::string{pattern};

  std::size_t i = 0;
  while (i < pattern.size()) {
    const char ch = pattern[i];

    if (ch == '*') {
      // Collapse runs of '*' into one token; '**' behaves like '*' for flat names.
      if (compiled.tokens_.empty() || compiled.tokens_.back().type != TokenType::kAnyRun) {
        compiled.tokens_.push_back(Token{TokenType::kAnyRun, '\0', false, {}});
      }
      compiled.literal_ = false;
      ++i;
      continue;
    }

    if (ch == '?') {
      compiled.tokens_.push_back(Token{TokenType::kAnyOne, '\0', false, {}});
      compiled.literal_ = false;
      ++i;
      continue;
    }

    if (ch == '[') {
      const std::size_t open = i;
      ++i;
      Token token{TokenType::kSet, '\0', false, {}};
      if (i < pattern.size() && (pattern[i] == '!' || pattern[i] == '^')) {
        token.negated = true;
        ++i;
      }

      // A ']' directly after the opening bracket (or its negation) is a literal member.
      bool first = true;
      bool closed = false;
      while (i < pattern.size()) {
        const char member = pattern[i];
        if (member == ']' && !first) {
          closed = true;
          ++i;
          break;
        }
        first = false;

        if (i + 2 < pattern.size() && pattern[i + 1] == '-' && pattern[i + 2] != ']') {
          const char hi = pattern[i + 2];
          if (hi < member) {
            return Result<GlobPattern>::err(Error::configuration(
                "invalid glob pattern '" + compiled.source_ + "': reversed range '" +
                std::string{member} + "-" + std::string{hi} + "' at offset " +
                std::to_string(i)));
          }
          token.ranges.push_back(CharRange{member, hi});
          i += 3;
        } else {
          token.ranges.push_back(CharRange{member, member});
          ++i;
        }
      }

      if (!closed) {
        return Result<GlobPattern>::err(Error::configuration(
            "invalid glob pattern '" + compiled.source_ + "': unclosed '[' at offset " +
            std::to_string(open)));
      }

      compiled.tokens_.push_back(std::move(token));
      compiled.literal_ = false;
      continue;
    }

    compiled.tokens_.push_back(Token{TokenType::kChar, ch, false, {}});
    ++i;
  }

  return Result<GlobPattern>::ok(std::move(compiled));
}

bool GlobPattern::token_matches(const Token& token, const char ch) {
  switch (token.type) {
    case TokenType::kChar:
      return token.ch == ch;
    case TokenType::kAnyOne:
      return true;
    case TokenType::kSet: {
      bool in_set = false;
      for (const auto& range : token.ranges) {
        if (ch >= range.lo && ch <= range.hi) {
          in_set = true;
          break;
        }
      }
      return in_set != token.negated;
    }
    case TokenType::kAnyRun:
      return true;
  }
  return false;
}

bool GlobPattern::matches(const std::string_view text) const {
  if (literal_) {
    return text == source_;
  }

  // Greedy match with single-point backtracking on the most recent '*'.
  // Linear in |text| * |tokens| in the worst case; no recursion.
  std::size_t ti = 0;
  std::size_t pi = 0;
  std::size_t star_pi = tokens_.size();
  std::size_t star_ti = 0;

  while (ti < text.size()) {
    if (pi < tokens_.size() && tokens_[pi].type == TokenType::kAnyRun) {
      star_pi = pi++;
      star_ti = ti;
      continue;
    }
    if (pi < tokens_.size() && token_matches(tokens_[pi], text[ti])) {
      ++pi;
      ++ti;
      continue;
    }
    if (star_pi != tokens_.size()) {
      pi = star_pi + 1;
      ti = ++star_ti;
      continue;
    }
    return false;
  }

  while (pi < tokens_.size() && tokens_[pi].type == TokenType::kAnyRun) {
    ++pi;
  }
  return pi == tokens_.size();
}

}  // namespace spanproof::core
