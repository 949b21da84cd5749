#include "spanproof/validation/expectation_validator.h"

#include <utility>

namespace spanproof::validation {

std::string_view validator_kind_to_string(const ValidatorKind kind) noexcept {
  switch (kind) {
    case ValidatorKind::kSpan:
      return "span";
    case ValidatorKind::kGraph:
      return "graph";
    case ValidatorKind::kCounts:
      return "counts";
    case ValidatorKind::kHermeticity:
      return "hermeticity";
  }
  return "span";
}

namespace {

ValidatorResult make_result(const ExpectationValidator& validator) {
  ValidatorResult result;
  result.kind = validator.kind();
  result.validator_name = std::string{validator.validator_name()};
  return result;
}

// A configuration error replaces whatever the layer found so far.
ValidatorResult config_failure(const ExpectationValidator& validator, const core::Error& error) {
  ValidatorResult result = make_result(validator);
  result.passed = false;
  result.findings.push_back(Finding{FindingCode::kConfiguration,
                                    result.validator_name + ".config", error.message,
                                    "a valid rule", error.message});
  return result;
}

}  // namespace

SpanRulesValidator::SpanRulesValidator(std::vector<SpanExpectation> expectations)
    : expectations_(std::move(expectations)) {}

ValidatorResult SpanRulesValidator::Validate(const std::vector<domain::SpanRecord>& /*spans*/,
                                             const SpanIndex& index) const {
  ValidatorResult result = make_result(*this);

  for (const auto& expectation : expectations_) {
    auto outcome = expectation.validate(index);
    if (!outcome.has_value()) {
      return config_failure(*this, outcome.error());
    }
    auto& checked = outcome.value();
    result.items_checked += checked.spans_checked;
    if (!checked.passed) {
      result.passed = false;
    }
    for (auto& finding : checked.findings) {
      result.findings.push_back(std::move(finding));
    }
  }

  return result;
}

GraphRulesValidator::GraphRulesValidator(GraphExpectation expectation)
    : expectation_(std::move(expectation)) {}

ValidatorResult GraphRulesValidator::Validate(const std::vector<domain::SpanRecord>& /*spans*/,
                                              const SpanIndex& index) const {
  auto outcome = expectation_.validate(index);
  if (!outcome.has_value()) {
    return config_failure(*this, outcome.error());
  }

  ValidatorResult result = make_result(*this);
  auto& checked = outcome.value();
  result.passed = checked.passed;
  result.items_checked = checked.edges_checked;
  result.findings = std::move(checked.findings);
  return result;
}

CountRulesValidator::CountRulesValidator(CountExpectation expectation)
    : expectation_(std::move(expectation)) {}

ValidatorResult CountRulesValidator::Validate(const std::vector<domain::SpanRecord>& spans,
                                              const SpanIndex& /*index*/) const {
  auto outcome = expectation_.validate(spans);
  if (!outcome.has_value()) {
    return config_failure(*this, outcome.error());
  }

  ValidatorResult result = make_result(*this);
  auto& checked = outcome.value();
  result.passed = checked.passed;
  result.items_checked = checked.bounds_checked;
  result.findings = std::move(checked.findings);
  result.actual_counts = std::move(checked.actual);
  return result;
}

HermeticityRulesValidator::HermeticityRulesValidator(HermeticityExpectation expectation)
    : expectation_(std::move(expectation)) {}

ValidatorResult HermeticityRulesValidator::Validate(
    const std::vector<domain::SpanRecord>& spans, const SpanIndex& /*index*/) const {
  auto outcome = expectation_.validate(spans);
  if (!outcome.has_value()) {
    return config_failure(*this, outcome.error());
  }

  ValidatorResult result = make_result(*this);
  auto& checked = outcome.value();
  result.passed = checked.passed;
  result.items_checked = checked.spans_checked;
  result.findings = std::move(checked.findings);
  result.violations = std::move(checked.violations);
  return result;
}

}  // namespace spanproof::validation
