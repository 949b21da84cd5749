#pragma once

#include "spanproof/core/result.h"
#include "spanproof/validation/finding.h"
#include "spanproof/validation/span_index.h"

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace spanproof::validation {

struct GraphValidationResult {
  bool passed{true};
  std::vector<Finding> findings;
  std::size_t edges_checked{0};

  void add(Finding finding) {
    passed = false;
    findings.push_back(std::move(finding));
  }
};

// Edge is a (parent name, child name) pair. Names are exact, not globs.
struct Edge {
  std::string parent;
  std::string child;

  bool operator==(const Edge&) const = default;
};

// GraphExpectation checks parent -> child topology of the span set.
//
// Edges are existential over names: (P, C) holds when ANY span named C has a parent_span_id
// equal to the span_id of ANY span named P. Names may repeat; positions are never paired.
// A forbidden edge whose parent or child name is absent is trivially satisfied.
// acyclic walks the inverse parent relation depth-first and reports the first back edge.
struct GraphExpectation {
  std::vector<Edge> must_include;
  std::vector<Edge> must_not_cross;
  bool acyclic{false};

  bool operator==(const GraphExpectation&) const = default;

  // All configured checks run; edges_checked counts every must_include/must_not_cross pair.
  [[nodiscard]] core::Result<GraphValidationResult> validate(const SpanIndex& index) const;
};

}  // namespace spanproof::validation
