#include "spanproof/domain/span_record_json.h"

#include "spanproof/core/sha256.h"

namespace spanproof::domain {

nlohmann::json span_to_json(const SpanRecord& span) {
  using json = nlohmann::json;

  json j;
  j["name"] = span.name;
  j["trace_id"] = span.trace_id;
  j["span_id"] = span.span_id;
  if (span.parent_span_id.has_value()) {
    j["parent_span_id"] = span.parent_span_id.value();
  } else {
    j["parent_span_id"] = nullptr;
  }

  j["attributes"] = json::object();
  for (const auto& [key, value] : span.attributes) {
    j["attributes"][key] = value;
  }
  if (!span.resource_attributes.empty()) {
    j["resource_attributes"] = json::object();
    for (const auto& [key, value] : span.resource_attributes) {
      j["resource_attributes"][key] = value;
    }
  }

  if (span.start_time_unix_nano.has_value()) {
    j["start_time_unix_nano"] = std::to_string(span.start_time_unix_nano.value());
  }
  if (span.end_time_unix_nano.has_value()) {
    j["end_time_unix_nano"] = std::to_string(span.end_time_unix_nano.value());
  }
  if (span.kind.has_value()) {
    j["kind"] = span_kind_to_string(span.kind.value());
  }
  if (span.events.has_value()) {
    j["events"] = span.events.value();
  }

  return j;
}

std::string canonical_span_string(const SpanRecord& span) {
  // Replace invalid UTF-8 instead of throwing; extracted strings are already valid.
  return span_to_json(span).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string spans_digest(const std::vector<SpanRecord>& spans) {
  core::Sha256 hasher;
  for (const auto& span : spans) {
    hasher.update(canonical_span_string(span));
    hasher.update("\n");
  }
  return hasher.hex_digest();
}

}  // namespace spanproof::domain
