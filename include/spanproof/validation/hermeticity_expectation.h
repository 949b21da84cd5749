#pragma once

#include "spanproof/core/result.h"
#include "spanproof/domain/span_record.h"
#include "spanproof/validation/finding.h"

#include <array>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace spanproof::validation {

// Attribute keys whose presence means a span talked to something outside the sandbox.
inline constexpr std::array<std::string_view, 5> kExternalServiceIndicators = {
    "net.peer.name", "net.peer.ip", "http.url", "db.connection_string", "rpc.service",
};

// is_internal_address: case-insensitive substring match on localhost, 127.0.0.1, 0.0.0.0
// or ::1, or a value starting with "internal" or "local".
[[nodiscard]] bool is_internal_address(std::string_view address);

struct ExternalServiceViolation {
  std::string span_name;
  std::string attribute_key;
  std::string attribute_value;

  bool operator==(const ExternalServiceViolation&) const = default;
};

struct ResourceMismatchViolation {
  std::string key;
  std::string expected;
  std::optional<std::string> actual;  // nullopt: key absent (or no spans at all)

  bool operator==(const ResourceMismatchViolation&) const = default;
};

struct ForbiddenAttributeViolation {
  std::string span_name;
  std::string attribute_key;

  bool operator==(const ForbiddenAttributeViolation&) const = default;
};

using HermeticityViolation =
    std::variant<ExternalServiceViolation, ResourceMismatchViolation, ForbiddenAttributeViolation>;

struct HermeticityValidationResult {
  bool passed{true};
  std::vector<Finding> findings;
  std::vector<HermeticityViolation> violations;  // parallel to findings
  std::size_t spans_checked{0};

  void add(Finding finding, HermeticityViolation violation) {
    passed = false;
    findings.push_back(std::move(finding));
    violations.push_back(std::move(violation));
  }
};

// HermeticityExpectation checks that a run stayed inside its sandbox.
// The three checks are independent and always all run.
// Resource attributes are compared against the FIRST span only; they are process-wide.
struct HermeticityExpectation {
  bool no_external_services{false};
  std::map<std::string, std::string> resource_attrs_must_match;
  std::vector<std::string> span_attrs_forbid_keys;

  bool operator==(const HermeticityExpectation&) const = default;

  [[nodiscard]] core::Result<HermeticityValidationResult> validate(
      const std::vector<domain::SpanRecord>& spans) const;
};

}  // namespace spanproof::validation
