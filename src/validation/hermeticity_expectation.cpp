#include "spanproof/validation/hermeticity_expectation.h"

#include "spanproof/core/normalization.h"

namespace spanproof::validation {

bool is_internal_address(const std::string_view address) {
  const std::string lower = core::normalize_ascii_lower(address);
  const std::string_view view{lower};
  for (const std::string_view loopback : {"localhost", "127.0.0.1", "0.0.0.0", "::1"}) {
    if (view.find(loopback) != std::string_view::npos) {
      return true;
    }
  }
  return view.starts_with("internal") || view.starts_with("local");
}

namespace {

void check_external_services(const std::vector<domain::SpanRecord>& spans,
                             HermeticityValidationResult& result) {
  for (const auto& span : spans) {
    for (const auto indicator : kExternalServiceIndicators) {
      const auto it = span.attributes.find(std::string{indicator});
      if (it == span.attributes.end()) {
        continue;
      }
      // Non-string values (a numeric peer ip, say) are judged by their JSON text.
      const std::string value = domain::attribute_value_text(it->second);
      if (is_internal_address(value)) {
        continue;
      }
      result.add(
          Finding{FindingCode::kExternalService, "hermeticity.no_external_services",
                  "span '" + span.name + "' has external service indicator '" +
                      std::string{indicator} + "' = '" + value +
                      "' (fake-green: test made external call)",
                  "no external service attributes", std::string{indicator} + "=" + value},
          ExternalServiceViolation{span.name, std::string{indicator}, value});
    }
  }
}

void check_resource_attributes(const std::vector<domain::SpanRecord>& spans,
                               const std::map<std::string, std::string>& required,
                               HermeticityValidationResult& result) {
  for (const auto& [key, expected] : required) {
    std::optional<std::string> actual;
    if (!spans.empty()) {
      const auto& resource = spans.front().resource_attributes;
      if (const auto it = resource.find(key); it != resource.end()) {
        actual = domain::attribute_value_text(it->second);
      }
    }
    if (actual == expected) {
      continue;
    }

    const std::string shown = actual ? "'" + *actual + "'" : std::string{"nothing"};
    result.add(Finding{FindingCode::kResourceMismatch, "hermeticity.resource_attrs[" + key + "]",
                       "resource attribute '" + key + "' expected '" + expected +
                           "' but found " + shown,
                       key + "=" + expected, actual ? key + "=" + *actual : key + " absent"},
               ResourceMismatchViolation{key, expected, actual});
  }
}

void check_forbidden_attributes(const std::vector<domain::SpanRecord>& spans,
                                const std::vector<std::string>& forbidden,
                                HermeticityValidationResult& result) {
  for (const auto& span : spans) {
    for (const auto& key : forbidden) {
      if (!span.attributes.contains(key)) {
        continue;
      }
      result.add(Finding{FindingCode::kForbiddenAttribute,
                         "hermeticity.span_attrs.forbid_keys[" + key + "]",
                         "span '" + span.name + "' has forbidden attribute '" + key +
                             "' (fake-green: test violated isolation)",
                         "no attribute '" + key + "'", "attribute '" + key + "' present"},
                 ForbiddenAttributeViolation{span.name, key});
    }
  }
}

}  // namespace

core::Result<HermeticityValidationResult> HermeticityExpectation::validate(
    const std::vector<domain::SpanRecord>& spans) const {
  HermeticityValidationResult result;
  result.spans_checked = spans.size();

  if (no_external_services) {
    check_external_services(spans, result);
  }
  check_resource_attributes(spans, resource_attrs_must_match, result);
  check_forbidden_attributes(spans, span_attrs_forbid_keys, result);

  return core::Result<HermeticityValidationResult>::ok(std::move(result));
}

}  // namespace spanproof::validation
