#include "spanproof/validation/count_expectation.h"

namespace spanproof::validation {

CountBound CountBound::eq(const std::size_t value) {
  CountBound bound;
  bound.eq_ = value;
  return bound;
}

CountBound CountBound::gte(const std::size_t value) {
  CountBound bound;
  bound.gte_ = value;
  return bound;
}

CountBound CountBound::lte(const std::size_t value) {
  CountBound bound;
  bound.lte_ = value;
  return bound;
}

core::Result<CountBound> CountBound::range(const std::size_t min, const std::size_t max) {
  return make(min, max, std::nullopt);
}

core::Result<CountBound> CountBound::make(const std::optional<std::size_t> gte,
                                          const std::optional<std::size_t> lte,
                                          const std::optional<std::size_t> eq) {
  if (gte && lte && *gte > *lte) {
    return core::Result<CountBound>::err(core::Error::configuration(
        "invalid count range: min (" + std::to_string(*gte) + ") > max (" + std::to_string(*lte) +
        ")"));
  }
  CountBound bound;
  bound.gte_ = gte;
  bound.lte_ = lte;
  bound.eq_ = eq;
  return core::Result<CountBound>::ok(bound);
}

std::optional<std::string> CountBound::check(const std::size_t actual,
                                             const std::string_view context) const {
  const std::string prefix = std::string{context} + ": expected ";
  const std::string found = ", found " + std::to_string(actual);

  if (eq_.has_value()) {
    if (actual != *eq_) {
      return prefix + "exactly " + std::to_string(*eq_) + found;
    }
    return std::nullopt;
  }
  if (gte_ && actual < *gte_) {
    return prefix + "at least " + std::to_string(*gte_) + found;
  }
  if (lte_ && actual > *lte_) {
    return prefix + "at most " + std::to_string(*lte_) + found;
  }
  return std::nullopt;
}

std::string CountBound::describe() const {
  if (eq_) {
    return "exactly " + std::to_string(*eq_);
  }
  if (gte_ && lte_) {
    return "between " + std::to_string(*gte_) + " and " + std::to_string(*lte_);
  }
  if (gte_) {
    return "at least " + std::to_string(*gte_);
  }
  if (lte_) {
    return "at most " + std::to_string(*lte_);
  }
  return "any count";
}

ActualCounts ActualCounts::from_spans(const std::vector<domain::SpanRecord>& spans) {
  ActualCounts counts;
  counts.spans_total = spans.size();
  for (const auto& span : spans) {
    counts.events_total += span.event_count();
    if (span.is_error()) {
      ++counts.errors_total;
    }
    ++counts.by_name[span.name];
  }
  return counts;
}

core::Result<CountValidationResult> CountExpectation::validate(
    const std::vector<domain::SpanRecord>& spans) const {
  CountValidationResult result;
  result.actual = ActualCounts::from_spans(spans);

  const auto apply = [&result](const CountBound& bound, const std::size_t actual,
                               const std::string& context, std::string rule_id) {
    ++result.bounds_checked;
    if (auto message = bound.check(actual, context)) {
      result.add(Finding{FindingCode::kCountOutOfBounds, std::move(rule_id), std::move(*message),
                         bound.describe(), std::to_string(actual)});
    }
  };

  if (spans_total) {
    apply(*spans_total, result.actual.spans_total, "Total spans", "counts.spans_total");
  }
  if (events_total) {
    apply(*events_total, result.actual.events_total, "Total events", "counts.events_total");
  }
  if (errors_total) {
    apply(*errors_total, result.actual.errors_total, "Total errors", "counts.errors_total");
  }
  for (const auto& [name, bound] : by_name) {
    const auto it = result.actual.by_name.find(name);
    const std::size_t actual = it == result.actual.by_name.end() ? 0 : it->second;
    apply(bound, actual, "Span name '" + name + "'", "counts.by_name[" + name + "]");
  }

  return core::Result<CountValidationResult>::ok(std::move(result));
}

}  // namespace spanproof::validation
