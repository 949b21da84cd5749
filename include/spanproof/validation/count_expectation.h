#pragma once

#include "spanproof/core/result.h"
#include "spanproof/domain/span_record.h"
#include "spanproof/validation/finding.h"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace spanproof::validation {

// CountBound is a cardinality constraint. eq, when set, takes precedence over gte/lte.
// A CountBound obtained from range() or make() always has gte <= lte.
class CountBound {
 public:
  static CountBound eq(std::size_t value);
  static CountBound gte(std::size_t value);
  static CountBound lte(std::size_t value);
  // range rejects min > max.
  static core::Result<CountBound> range(std::size_t min, std::size_t max);
  // make builds any combination, as read from a rule document.
  static core::Result<CountBound> make(std::optional<std::size_t> gte,
                                       std::optional<std::size_t> lte,
                                       std::optional<std::size_t> eq);

  [[nodiscard]] const std::optional<std::size_t>& min() const noexcept { return gte_; }
  [[nodiscard]] const std::optional<std::size_t>& max() const noexcept { return lte_; }
  [[nodiscard]] const std::optional<std::size_t>& exact() const noexcept { return eq_; }

  // check returns nullopt when satisfied, else "<context>: expected ..., found <actual>".
  [[nodiscard]] std::optional<std::string> check(std::size_t actual,
                                                 std::string_view context) const;
  // describe renders the bound alone: "exactly 2", "at least 1", "between 1 and 3".
  [[nodiscard]] std::string describe() const;

  bool operator==(const CountBound&) const = default;

 private:
  CountBound() = default;

  std::optional<std::size_t> gte_;
  std::optional<std::size_t> lte_;
  std::optional<std::size_t> eq_;
};

// ActualCounts is the full forensic snapshot; it is computed whether or not a bound exists.
struct ActualCounts {
  std::size_t spans_total{0};
  std::size_t events_total{0};
  std::size_t errors_total{0};
  std::map<std::string, std::size_t> by_name;

  static ActualCounts from_spans(const std::vector<domain::SpanRecord>& spans);

  bool operator==(const ActualCounts&) const = default;
};

struct CountValidationResult {
  bool passed{true};
  std::vector<Finding> findings;
  std::size_t bounds_checked{0};
  ActualCounts actual;

  void add(Finding finding) {
    passed = false;
    findings.push_back(std::move(finding));
  }
};

// CountExpectation bounds totals of spans, events and error spans, plus per-name tallies.
struct CountExpectation {
  std::optional<CountBound> spans_total;
  std::optional<CountBound> events_total;
  std::optional<CountBound> errors_total;
  std::map<std::string, CountBound> by_name;

  bool operator==(const CountExpectation&) const = default;

  // One finding per violated bound. A name missing from the span set counts as 0.
  [[nodiscard]] core::Result<CountValidationResult> validate(
      const std::vector<domain::SpanRecord>& spans) const;
};

}  // namespace spanproof::validation
