#pragma once

#include "spanproof/validation/expectation_validator.h"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace spanproof::validation {

inline constexpr const char* kFakeSuccessNote =
    "likely fake success: process reported success without emitting real spans";

// FailingRule is the single authoritative failure shown to the user: the first finding of the
// first failed layer, in Span -> Graph -> Counts -> Hermeticity order.
struct FailingRule {
  std::string validator;
  std::string rule_id;
  std::string expected;
  std::string actual;
  std::string message;
  std::string remediation;
  // Set only when the finding is a span-existence failure and the run emitted zero spans.
  std::optional<std::string> fake_success_note;
};

// ValidationReport is built once by ValidationOrchestrator and not modified afterwards.
struct ValidationReport {
  bool passed{true};
  std::optional<FailingRule> first_failure;
  std::vector<ValidatorResult> results;  // configured layers, in evaluation order
  std::size_t span_count{0};
  std::string span_digest;  // see domain::spans_digest
};

// "PASS (n validators)" or "FAIL <validator>/<rule_id>: <message>".
[[nodiscard]] std::string report_summary(const ValidationReport& report);

[[nodiscard]] nlohmann::json validation_report_to_json(const ValidationReport& report);

}  // namespace spanproof::validation
