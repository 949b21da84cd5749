#include "spanproof/validation/graph_expectation.h"

#include <optional>
#include <unordered_set>

namespace spanproof::validation {

namespace {

std::string edge_label(const Edge& edge) {
  return edge.parent + "->" + edge.child;
}

bool edge_exists(const SpanIndex& index, const Edge& edge) {
  const auto& spans = index.spans();

  std::unordered_set<std::string> parent_ids;
  for (const auto position : index.with_name(edge.parent)) {
    parent_ids.insert(spans[position].span_id);
  }

  for (const auto position : index.with_name(edge.child)) {
    const auto& parent_id = spans[position].parent_span_id;
    if (parent_id.has_value() && parent_ids.contains(*parent_id)) {
      return true;
    }
  }
  return false;
}

struct CycleEdge {
  std::size_t from;
  std::size_t to;
};

// Iterative DFS over children_of(). colour: 0 = unvisited, 1 = on the active stack, 2 = done.
// Returns the first edge that closes a cycle (its target is still on the stack).
std::optional<CycleEdge> find_cycle(const SpanIndex& index) {
  const std::size_t count = index.spans().size();
  std::vector<int> colour(count, 0);

  struct Frame {
    std::size_t node;
    std::size_t next_child;
  };

  for (std::size_t root = 0; root < count; ++root) {
    if (colour[root] != 0) {
      continue;
    }

    std::vector<Frame> stack;
    stack.push_back(Frame{root, 0});
    colour[root] = 1;

    while (!stack.empty()) {
      Frame& frame = stack.back();
      const auto& children = index.children_of(frame.node);

      if (frame.next_child == children.size()) {
        colour[frame.node] = 2;
        stack.pop_back();
        continue;
      }

      const std::size_t child = children[frame.next_child++];
      if (colour[child] == 1) {
        return CycleEdge{frame.node, child};
      }
      if (colour[child] == 0) {
        colour[child] = 1;
        stack.push_back(Frame{child, 0});
      }
    }
  }

  return std::nullopt;
}

}  // namespace

core::Result<GraphValidationResult> GraphExpectation::validate(const SpanIndex& index) const {
  GraphValidationResult result;

  for (const auto& edge : must_include) {
    ++result.edges_checked;
    const std::string rule_id = "graph.must_include[" + edge_label(edge) + "]";
    const std::string expected = "edge '" + edge.parent + "' -> '" + edge.child + "'";

    if (index.with_name(edge.parent).empty()) {
      result.add(Finding{FindingCode::kEdgeParentMissing, rule_id,
                         "parent not found: no span named '" + edge.parent +
                             "' (fake-green: the step never started?)",
                         expected, "parent not found"});
      continue;
    }
    if (index.with_name(edge.child).empty()) {
      result.add(Finding{FindingCode::kEdgeChildMissing, rule_id,
                         "child not found: no span named '" + edge.child +
                             "' (fake-green: operation never executed?)",
                         expected, "child not found"});
      continue;
    }
    if (!edge_exists(index, edge)) {
      result.add(Finding{FindingCode::kEdgeMissing, rule_id,
                         "required edge '" + edge.parent + "' -> '" + edge.child +
                             "' not found (parent-child relationship missing)",
                         expected, "both spans present but not linked"});
    }
  }

  for (const auto& edge : must_not_cross) {
    ++result.edges_checked;
    if (index.with_name(edge.parent).empty() || index.with_name(edge.child).empty()) {
      continue;
    }
    if (edge_exists(index, edge)) {
      result.add(Finding{FindingCode::kForbiddenEdge,
                         "graph.must_not_cross[" + edge_label(edge) + "]",
                         "forbidden edge '" + edge.parent + "' -> '" + edge.child +
                             "' exists (isolation violation)",
                         "no edge '" + edge.parent + "' -> '" + edge.child + "'",
                         "edge present"});
    }
  }

  if (acyclic) {
    if (const auto cycle = find_cycle(index)) {
      const auto& spans = index.spans();
      const auto& from = spans[cycle->from];
      const auto& to = spans[cycle->to];
      result.add(Finding{FindingCode::kCycle, "graph.acyclic",
                         "cycle detected: span '" + to.name + "' (id " + to.span_id +
                             ") is both an ancestor and a child of span '" + from.name +
                             "' (id " + from.span_id + ")",
                         "acyclic parent relation",
                         "cycle through '" + from.name + "' and '" + to.name + "'"});
    }
  }

  return core::Result<GraphValidationResult>::ok(std::move(result));
}

}  // namespace spanproof::validation
