#include "spanproof/validation/span_expectation.h"

#include "spanproof/core/glob.h"

#include <algorithm>
#include <string_view>

namespace spanproof::validation {

namespace {

std::string join(const std::vector<std::string>& items) {
  std::string joined;
  for (std::size_t i = 0; i < items.size(); ++i) {
    if (i > 0) {
      joined += ", ";
    }
    joined += items[i];
  }
  return joined;
}

std::string describe_span(const domain::SpanRecord& span) {
  return "span '" + span.name + "' (id " + span.span_id + ")";
}

std::string describe_duration_bounds(const std::optional<std::uint64_t>& min_ms,
                                     const std::optional<std::uint64_t>& max_ms) {
  if (min_ms && max_ms) {
    return "between " + std::to_string(*min_ms) + "ms and " + std::to_string(*max_ms) + "ms";
  }
  if (min_ms) {
    return "at least " + std::to_string(*min_ms) + "ms";
  }
  return "at most " + std::to_string(max_ms.value_or(0)) + "ms";
}

// Per-span checker. Every check appends its own findings and never stops the others.
class SpanChecker {
 public:
  SpanChecker(const SpanExpectation& expectation, const SpanIndex& index,
              const std::optional<core::GlobPattern>& parent_pattern, SpanValidationResult& out)
      : expectation_(expectation), index_(index), parent_pattern_(parent_pattern), out_(out) {}

  void check(const std::size_t position) {
    const auto& span = index_.spans()[position];
    check_parent(position, span);
    check_kind(span);
    check_attrs_all(span);
    check_attrs_any(span);
    check_events_any(span);
    check_duration(span);
  }

 private:
  void report(const FindingCode code, const std::string& suffix, const domain::SpanRecord& span,
              std::string message, std::string expected, std::string actual) {
    out_.add(Finding{code, expectation_.rule_prefix() + "." + suffix,
                     describe_span(span) + ": " + std::move(message), std::move(expected),
                     std::move(actual)});
  }

  void check_parent(const std::size_t position, const domain::SpanRecord& span) {
    if (!parent_pattern_.has_value()) {
      return;
    }
    const std::string expected = "parent matching '" + parent_pattern_->source() + "'";

    if (!span.parent_span_id.has_value()) {
      report(FindingCode::kParentMismatch, "parent", span,
             "has no parent but a parent was expected", expected, "no parent");
      return;
    }

    const auto parent = index_.parent_of(position);
    if (!parent.has_value()) {
      report(FindingCode::kParentMismatch, "parent", span,
             "parent span with id '" + *span.parent_span_id + "' not found", expected,
             "unresolved parent id '" + *span.parent_span_id + "'");
      return;
    }

    const auto& parent_name = index_.spans()[*parent].name;
    if (!parent_pattern_->matches(parent_name)) {
      report(FindingCode::kParentMismatch, "parent", span,
             "parent span name '" + parent_name + "' does not match pattern '" +
                 parent_pattern_->source() + "'",
             expected, "parent '" + parent_name + "'");
    }
  }

  void check_kind(const domain::SpanRecord& span) {
    if (!expectation_.kind.has_value()) {
      return;
    }
    const std::string expected = "kind " + domain::span_kind_to_string(*expectation_.kind);

    if (!span.kind.has_value()) {
      report(FindingCode::kKindMismatch, "kind", span, "has no kind but " + expected +
             " was expected", expected, "no kind");
      return;
    }
    if (*span.kind != *expectation_.kind) {
      report(FindingCode::kKindMismatch, "kind", span,
             "span kind is " + domain::span_kind_to_string(*span.kind) + " but expected " +
                 domain::span_kind_to_string(*expectation_.kind),
             expected, "kind " + domain::span_kind_to_string(*span.kind));
    }
  }

  void check_attrs_all(const domain::SpanRecord& span) {
    for (const auto& [key, expected_value] : expectation_.attrs_all) {
      const std::string expected = key + "=" + expected_value;
      const auto it = span.attributes.find(key);
      if (it == span.attributes.end()) {
        report(FindingCode::kAttributeMismatch, "attrs.all", span,
               "attribute '" + key + "' not found", expected, "attribute absent");
        continue;
      }
      const std::string actual_value = domain::attribute_value_text(it->second);
      if (actual_value != expected_value) {
        report(FindingCode::kAttributeMismatch, "attrs.all", span,
               "attribute '" + key + "' has value '" + actual_value + "' but expected '" +
                   expected_value + "'",
               expected, key + "=" + actual_value);
      }
    }
  }

  void check_attrs_any(const domain::SpanRecord& span) {
    if (expectation_.attrs_any.empty()) {
      return;
    }
    for (const auto& pattern : expectation_.attrs_any) {
      const auto eq = pattern.find('=');
      const std::string key = pattern.substr(0, eq);
      const std::string value = pattern.substr(eq + 1);
      const auto it = span.attributes.find(key);
      if (it != span.attributes.end() && domain::attribute_value_text(it->second) == value) {
        return;
      }
    }
    report(FindingCode::kAttributeMismatch, "attrs.any", span,
           "no attribute pattern matched from: [" + join(expectation_.attrs_any) + "]",
           "one of [" + join(expectation_.attrs_any) + "]", "none matched");
  }

  void check_events_any(const domain::SpanRecord& span) {
    if (expectation_.events_any.empty()) {
      return;
    }
    const std::string expected = "one of events [" + join(expectation_.events_any) + "]";
    if (!span.events.has_value() || span.events->empty()) {
      report(FindingCode::kEventMissing, "events.any", span,
             "span has no events but events were expected", expected, "no events");
      return;
    }
    for (const auto& wanted : expectation_.events_any) {
      if (std::find(span.events->begin(), span.events->end(), wanted) != span.events->end()) {
        return;
      }
    }
    report(FindingCode::kEventMissing, "events.any", span,
           "no event matched from: [" + join(expectation_.events_any) + "]", expected,
           "events [" + join(*span.events) + "]");
  }

  void check_duration(const domain::SpanRecord& span) {
    if (!expectation_.duration_min_ms.has_value() && !expectation_.duration_max_ms.has_value()) {
      return;
    }
    const std::string expected =
        "duration " +
        describe_duration_bounds(expectation_.duration_min_ms, expectation_.duration_max_ms);

    const auto duration = span.duration_ms();
    if (!duration.has_value()) {
      report(FindingCode::kDurationOutOfBounds, "duration_ms", span, "span has no duration data",
             expected, "no duration");
      return;
    }
    const std::string actual = "duration " + std::to_string(*duration) + "ms";
    if (expectation_.duration_min_ms && *duration < *expectation_.duration_min_ms) {
      report(FindingCode::kDurationOutOfBounds, "duration_ms", span,
             "duration " + std::to_string(*duration) + "ms is less than minimum " +
                 std::to_string(*expectation_.duration_min_ms) + "ms",
             expected, actual);
    }
    if (expectation_.duration_max_ms && *duration > *expectation_.duration_max_ms) {
      report(FindingCode::kDurationOutOfBounds, "duration_ms", span,
             "duration " + std::to_string(*duration) + "ms exceeds maximum " +
                 std::to_string(*expectation_.duration_max_ms) + "ms",
             expected, actual);
    }
  }

  const SpanExpectation& expectation_;
  const SpanIndex& index_;
  const std::optional<core::GlobPattern>& parent_pattern_;
  SpanValidationResult& out_;
};

}  // namespace

std::string SpanExpectation::rule_prefix() const {
  return "span[" + name + "]";
}

core::Result<bool> SpanExpectation::check_config() const {
  if (name.empty()) {
    return core::Result<bool>::err(core::Error::configuration("span rule has an empty name"));
  }
  if (auto compiled = core::GlobPattern::compile(name); !compiled.has_value()) {
    return core::Result<bool>::err(compiled.error());
  }
  if (parent.has_value()) {
    if (auto compiled = core::GlobPattern::compile(*parent); !compiled.has_value()) {
      return core::Result<bool>::err(compiled.error());
    }
  }
  for (const auto& pattern : attrs_any) {
    const auto eq = pattern.find('=');
    if (eq == std::string::npos || eq == 0) {
      return core::Result<bool>::err(core::Error::configuration(
          rule_prefix() + ": attrs.any entry '" + pattern + "' is not of the form key=value"));
    }
  }
  if (duration_min_ms && duration_max_ms && *duration_min_ms > *duration_max_ms) {
    return core::Result<bool>::err(core::Error::configuration(
        rule_prefix() + ": invalid duration range: min (" + std::to_string(*duration_min_ms) +
        "ms) > max (" + std::to_string(*duration_max_ms) + "ms)"));
  }
  return core::Result<bool>::ok(true);
}

core::Result<SpanValidationResult> SpanExpectation::validate(const SpanIndex& index) const {
  if (auto config = check_config(); !config.has_value()) {
    return core::Result<SpanValidationResult>::err(config.error());
  }

  // check_config() already proved both patterns compile.
  const auto name_pattern = core::GlobPattern::compile(name).value();
  std::optional<core::GlobPattern> parent_pattern;
  if (parent.has_value()) {
    parent_pattern = core::GlobPattern::compile(*parent).value();
  }

  std::vector<std::size_t> matching;
  const auto& spans = index.spans();
  for (std::size_t i = 0; i < spans.size(); ++i) {
    if (name_pattern.matches(spans[i].name)) {
      matching.push_back(i);
    }
  }

  SpanValidationResult result;
  if (matching.empty()) {
    result.add(Finding{FindingCode::kNoMatchingSpan, rule_prefix() + ".exists",
                       "no span matches pattern '" + name + "'",
                       "at least one span matching '" + name + "'",
                       "0 matching spans out of " + std::to_string(spans.size())});
    return core::Result<SpanValidationResult>::ok(std::move(result));
  }

  result.spans_checked = matching.size();
  SpanChecker checker{*this, index, parent_pattern, result};
  for (const auto position : matching) {
    checker.check(position);
  }

  return core::Result<SpanValidationResult>::ok(std::move(result));
}

}  // namespace spanproof::validation
