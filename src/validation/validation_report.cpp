#include "spanproof/validation/validation_report.h"

#include "spanproof/core/version.h"

#include <type_traits>
#include <variant>

namespace spanproof::validation {

namespace {

using json = nlohmann::json;

json finding_to_json(const Finding& finding) {
  json j;
  j["code"] = std::string{finding_code_to_string(finding.code)};
  j["rule_id"] = finding.rule_id;
  j["message"] = finding.message;
  j["expected"] = finding.expected;
  j["actual"] = finding.actual;
  return j;
}

json actual_counts_to_json(const ActualCounts& counts) {
  json j;
  j["spans_total"] = counts.spans_total;
  j["events_total"] = counts.events_total;
  j["errors_total"] = counts.errors_total;
  j["by_name"] = json::object();
  for (const auto& [name, count] : counts.by_name) {
    j["by_name"][name] = count;
  }
  return j;
}

json violation_to_json(const HermeticityViolation& violation) {
  return std::visit(
      [](const auto& v) -> json {
        using V = std::decay_t<decltype(v)>;
        json j;
        if constexpr (std::is_same_v<V, ExternalServiceViolation>) {
          j["type"] = "external_service";
          j["span_name"] = v.span_name;
          j["attribute_key"] = v.attribute_key;
          j["attribute_value"] = v.attribute_value;
        } else if constexpr (std::is_same_v<V, ResourceMismatchViolation>) {
          j["type"] = "resource_mismatch";
          j["key"] = v.key;
          j["expected"] = v.expected;
          if (v.actual.has_value()) {
            j["actual"] = v.actual.value();
          } else {
            j["actual"] = nullptr;
          }
        } else {
          j["type"] = "forbidden_attribute";
          j["span_name"] = v.span_name;
          j["attribute_key"] = v.attribute_key;
        }
        return j;
      },
      violation);
}

json result_to_json(const ValidatorResult& result) {
  json j;
  j["validator"] = result.validator_name;
  j["passed"] = result.passed;
  j["items_checked"] = result.items_checked;

  json findings = json::array();
  for (const auto& finding : result.findings) {
    findings.push_back(finding_to_json(finding));
  }
  j["findings"] = std::move(findings);

  if (result.actual_counts.has_value()) {
    j["actual_counts"] = actual_counts_to_json(result.actual_counts.value());
  }
  if (result.kind == ValidatorKind::kHermeticity) {
    json violations = json::array();
    for (const auto& violation : result.violations) {
      violations.push_back(violation_to_json(violation));
    }
    j["violations"] = std::move(violations);
  }
  return j;
}

json failing_rule_to_json(const FailingRule& rule) {
  json j;
  j["validator"] = rule.validator;
  j["rule_id"] = rule.rule_id;
  j["expected"] = rule.expected;
  j["actual"] = rule.actual;
  j["message"] = rule.message;
  j["remediation"] = rule.remediation;
  if (rule.fake_success_note.has_value()) {
    j["fake_success_note"] = rule.fake_success_note.value();
  } else {
    j["fake_success_note"] = nullptr;
  }
  return j;
}

}  // namespace

std::string report_summary(const ValidationReport& report) {
  if (report.passed) {
    return "PASS (" + std::to_string(report.results.size()) + " validators)";
  }
  if (!report.first_failure.has_value()) {
    return "FAIL";
  }
  const auto& failure = report.first_failure.value();
  return "FAIL " + failure.validator + "/" + failure.rule_id + ": " + failure.message;
}

json validation_report_to_json(const ValidationReport& report) {
  json results = json::array();
  for (const auto& result : report.results) {
    results.push_back(result_to_json(result));
  }

  json j;
  j["engine_version"] = core::kBuildVersion;
  j["passed"] = report.passed;
  if (report.first_failure.has_value()) {
    j["first_failure"] = failing_rule_to_json(report.first_failure.value());
  } else {
    j["first_failure"] = nullptr;
  }
  j["results"] = std::move(results);
  j["span_count"] = report.span_count;
  j["span_digest"] = report.span_digest;
  return j;
}

}  // namespace spanproof::validation
