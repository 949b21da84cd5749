#pragma once

#include "spanproof/validation/count_expectation.h"
#include "spanproof/validation/graph_expectation.h"
#include "spanproof/validation/hermeticity_expectation.h"
#include "spanproof/validation/span_expectation.h"

#include <optional>
#include <vector>

namespace spanproof::validation {

// ExpectationSet is one complete rule set. An empty `spans` list or a nullopt section means
// that layer is not configured and is left out of the report.
struct ExpectationSet {
  std::vector<SpanExpectation> spans;
  std::optional<GraphExpectation> graph;
  std::optional<CountExpectation> counts;
  std::optional<HermeticityExpectation> hermeticity;

  bool operator==(const ExpectationSet&) const = default;

  [[nodiscard]] bool empty() const noexcept {
    return spans.empty() && !graph && !counts && !hermeticity;
  }
};

}  // namespace spanproof::validation
