#include "spanproof/validation/validation_orchestrator.h"

#include "spanproof/domain/span_record_json.h"
#include "spanproof/ingest/span_extractor.h"
#include "spanproof/validation/span_index.h"

#include <utility>

namespace spanproof::validation {

namespace {

FailingRule make_failing_rule(const ValidatorResult& result, const std::size_t span_count) {
  FailingRule rule;
  rule.validator = result.validator_name;

  if (result.findings.empty()) {
    // The built-in layers always record a finding when they fail.
    rule.rule_id = result.validator_name;
    rule.message = result.validator_name + " validation failed";
    return rule;
  }

  const Finding& finding = result.findings.front();
  rule.rule_id = finding.rule_id;
  rule.expected = finding.expected;
  rule.actual = finding.actual;
  rule.message = finding.message;
  rule.remediation = std::string{remediation_for(finding.code)};
  if (span_count == 0 && is_span_existence(finding.code)) {
    rule.fake_success_note = kFakeSuccessNote;
  }
  return rule;
}

}  // namespace

ValidationOrchestrator::ValidationOrchestrator(ExpectationSet expectations) {
  // Fixed evaluation order.
  if (!expectations.spans.empty()) {
    validators_.push_back(std::make_unique<SpanRulesValidator>(std::move(expectations.spans)));
  }
  if (expectations.graph) {
    validators_.push_back(std::make_unique<GraphRulesValidator>(std::move(*expectations.graph)));
  }
  if (expectations.counts) {
    validators_.push_back(std::make_unique<CountRulesValidator>(std::move(*expectations.counts)));
  }
  if (expectations.hermeticity) {
    validators_.push_back(
        std::make_unique<HermeticityRulesValidator>(std::move(*expectations.hermeticity)));
  }
}

ValidationReport ValidationOrchestrator::validate(
    const std::vector<domain::SpanRecord>& spans) const {
  ValidationReport report;
  report.span_count = spans.size();
  report.span_digest = domain::spans_digest(spans);

  const SpanIndex index{spans};
  for (const auto& validator : validators_) {
    report.results.push_back(validator->Validate(spans, index));
  }

  for (const auto& result : report.results) {
    if (!result.passed) {
      report.passed = false;
      report.first_failure = make_failing_rule(result, report.span_count);
      break;
    }
  }

  return report;
}

ValidationReport ValidationOrchestrator::validate_text(const std::string_view text) const {
  const auto extraction = ingest::SpanExtractor{}.extract(text);
  return validate(extraction.spans);
}

}  // namespace spanproof::validation
