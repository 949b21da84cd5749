#include "spanproof/validation/finding.h"

namespace spanproof::validation {

bool is_span_existence(const FindingCode code) noexcept {
  return code == FindingCode::kNoMatchingSpan || code == FindingCode::kEdgeParentMissing ||
         code == FindingCode::kEdgeChildMissing;
}

std::string_view finding_code_to_string(const FindingCode code) noexcept {
  switch (code) {
    case FindingCode::kNoMatchingSpan:
      return "no_matching_span";
    case FindingCode::kEdgeParentMissing:
      return "edge_parent_missing";
    case FindingCode::kEdgeChildMissing:
      return "edge_child_missing";
    case FindingCode::kParentMismatch:
      return "parent_mismatch";
    case FindingCode::kKindMismatch:
      return "kind_mismatch";
    case FindingCode::kAttributeMismatch:
      return "attribute_mismatch";
    case FindingCode::kEventMissing:
      return "event_missing";
    case FindingCode::kDurationOutOfBounds:
      return "duration_out_of_bounds";
    case FindingCode::kEdgeMissing:
      return "edge_missing";
    case FindingCode::kForbiddenEdge:
      return "forbidden_edge";
    case FindingCode::kCycle:
      return "cycle";
    case FindingCode::kCountOutOfBounds:
      return "count_out_of_bounds";
    case FindingCode::kExternalService:
      return "external_service";
    case FindingCode::kResourceMismatch:
      return "resource_mismatch";
    case FindingCode::kForbiddenAttribute:
      return "forbidden_attribute";
    case FindingCode::kConfiguration:
      return "config_error";
  }
  return "config_error";
}

std::string_view remediation_for(const FindingCode code) noexcept {
  switch (code) {
    case FindingCode::kNoMatchingSpan:
      return "Make sure the code under test is instrumented and its exporter is flushed before "
             "the process exits.";
    case FindingCode::kEdgeParentMissing:
    case FindingCode::kEdgeChildMissing:
      return "Emit both spans of the edge from the real execution path; a missing span means "
             "that step never ran.";
    case FindingCode::kParentMismatch:
    case FindingCode::kEdgeMissing:
      return "Start the child span inside the parent's context so parent_span_id is propagated.";
    case FindingCode::kKindMismatch:
      return "Set the span kind when the span is started.";
    case FindingCode::kAttributeMismatch:
      return "Record the expected attributes on the span, or correct the rule's values.";
    case FindingCode::kEventMissing:
      return "Add the expected event to the span at the point the work happens.";
    case FindingCode::kDurationOutOfBounds:
      return "Check that the span wraps the real work; adjust duration bounds only if the "
             "workload changed.";
    case FindingCode::kForbiddenEdge:
      return "Break the dependency between the two operations; they must stay isolated.";
    case FindingCode::kCycle:
      return "Fix context propagation; a span must never be its own ancestor.";
    case FindingCode::kCountOutOfBounds:
      return "Compare the emitted span counts with the rule; a shortfall usually means steps "
             "were skipped.";
    case FindingCode::kExternalService:
      return "Point the dependency at a local or internal endpoint so the run stays hermetic.";
    case FindingCode::kResourceMismatch:
      return "Configure the telemetry resource (service.name and friends) of the process under "
             "test.";
    case FindingCode::kForbiddenAttribute:
      return "Remove the code path that records this attribute; it signals a non-hermetic call.";
    case FindingCode::kConfiguration:
      return "Fix the rule definition; it could not be evaluated.";
  }
  return "Fix the rule definition; it could not be evaluated.";
}

}  // namespace spanproof::validation
