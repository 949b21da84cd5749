#pragma once

#include "spanproof/core/result.h"
#include "spanproof/domain/span_record.h"
#include "spanproof/validation/finding.h"
#include "spanproof/validation/span_index.h"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace spanproof::validation {

struct SpanValidationResult {
  bool passed{true};
  std::vector<Finding> findings;
  std::size_t spans_checked{0};

  void add(Finding finding) {
    passed = false;
    findings.push_back(std::move(finding));
  }
};

// SpanExpectation constrains the shape of every span whose name matches `name` (a glob).
//
// Only `name` is required. Each other field, when set, is checked independently on every
// matching span, and every failure is recorded; one failing constraint never hides another.
// attrs_any entries are "key=value" strings; at least one must hold.
// events_any: at least one of the listed event names must be present.
// Duration bounds are inclusive milliseconds, computed with truncating division.
struct SpanExpectation {
  std::string name;
  std::optional<std::string> parent;
  std::optional<domain::SpanKind> kind;
  std::map<std::string, std::string> attrs_all;
  std::vector<std::string> attrs_any;
  std::vector<std::string> events_any;
  std::optional<std::uint64_t> duration_min_ms;
  std::optional<std::uint64_t> duration_max_ms;

  bool operator==(const SpanExpectation&) const = default;

  // rule_prefix is "span[<name>]"; findings use it as the stem of their rule_id.
  [[nodiscard]] std::string rule_prefix() const;

  // check_config rejects invalid globs, attrs_any entries without '=' and min > max.
  [[nodiscard]] core::Result<bool> check_config() const;

  // validate returns err only for configuration problems; unmet constraints are findings.
  // "No span matches pattern" is reported on its own, before any per-span check.
  [[nodiscard]] core::Result<SpanValidationResult> validate(const SpanIndex& index) const;
};

}  // namespace spanproof::validation
