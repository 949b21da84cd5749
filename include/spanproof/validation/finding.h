#pragma once

#include <string>
#include <string_view>

namespace spanproof::validation {

// FindingCode classifies why a rule was not satisfied.
// The first three codes are span-existence failures: the rule could not even find the spans
// it talks about. On an empty span set they are the signature of a fake-green run.
enum class FindingCode {
  kNoMatchingSpan,
  kEdgeParentMissing,
  kEdgeChildMissing,
  kParentMismatch,
  kKindMismatch,
  kAttributeMismatch,
  kEventMissing,
  kDurationOutOfBounds,
  kEdgeMissing,
  kForbiddenEdge,
  kCycle,
  kCountOutOfBounds,
  kExternalService,
  kResourceMismatch,
  kForbiddenAttribute,
  kConfiguration,
};

// Finding is one unsatisfied rule, recorded as data (never thrown).
// expected/actual are short human-readable halves of the contrast shown to the user.
struct Finding {
  FindingCode code{FindingCode::kConfiguration};
  std::string rule_id;
  std::string message;
  std::string expected;
  std::string actual;
};

[[nodiscard]] bool is_span_existence(FindingCode code) noexcept;
[[nodiscard]] std::string_view finding_code_to_string(FindingCode code) noexcept;
// remediation_for returns a one-sentence suggestion for fixing the underlying run or rule.
[[nodiscard]] std::string_view remediation_for(FindingCode code) noexcept;

}  // namespace spanproof::validation
