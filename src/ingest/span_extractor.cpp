#include "spanproof/ingest/span_extractor.h"

#include "spanproof/core/normalization.h"
#include "spanproof/core/result.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace spanproof::ingest {

namespace {

using json = nlohmann::json;
using domain::AttributeMap;
using domain::SpanRecord;

// Notes collected while reading optional fields of one span.
using FieldNotes = std::vector<std::string>;

bool is_span_like(const json& value) {
  return value.is_object() && value.contains("name") && value["name"].is_string() &&
         value.contains("trace_id") && value["trace_id"].is_string() &&
         value.contains("span_id") && value["span_id"].is_string();
}

bool is_otlp_envelope(const json& value) {
  return value.is_object() && value.contains("resourceSpans") &&
         value["resourceSpans"].is_array();
}

std::optional<std::uint64_t> parse_decimal_u64(const std::string& text) {
  if (text.empty()) {
    return std::nullopt;
  }
  std::uint64_t parsed = 0;
  const char* first = text.data();
  const char* last = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (ec != std::errc{} || ptr != last) {
    return std::nullopt;
  }
  return parsed;
}

// Timestamps: native unsigned integer or decimal string. null or missing means absent.
// Any other value is noted and treated as absent.
std::optional<std::uint64_t> read_timestamp(const json& object, const char* key,
                                            FieldNotes& notes) {
  if (!object.contains(key) || object[key].is_null()) {
    return std::nullopt;
  }
  const json& value = object[key];
  if (value.is_number_unsigned()) {
    return value.get<std::uint64_t>();
  }
  if (value.is_number_integer() && value.get<std::int64_t>() >= 0) {
    return static_cast<std::uint64_t>(value.get<std::int64_t>());
  }
  if (value.is_string()) {
    if (auto parsed = parse_decimal_u64(value.get<std::string>())) {
      return parsed;
    }
  }
  notes.push_back(std::string{"field '"} + key +
                  "' is not an unsigned integer or decimal string; treated as absent");
  return std::nullopt;
}

// Kind: canonical name (case-insensitive, optional SPAN_KIND_ prefix) or OTLP wire code.
// Unknown values leave the kind absent; they do not make the span malformed.
std::optional<domain::SpanKind> read_kind(const json& object, const char* key) {
  if (!object.contains(key)) {
    return std::nullopt;
  }
  const json& value = object[key];
  if (value.is_string()) {
    std::string name = value.get<std::string>();
    const std::string lower = core::normalize_ascii_lower(name);
    constexpr std::string_view kPrefix = "span_kind_";
    if (lower.starts_with(kPrefix)) {
      name = lower.substr(kPrefix.size());
    }
    return domain::span_kind_from_string(name);
  }
  if (value.is_number_integer()) {
    return domain::span_kind_from_wire(value.get<std::int64_t>());
  }
  return std::nullopt;
}

AttributeMap read_attribute_object(const json& object, const char* key, FieldNotes& notes) {
  AttributeMap attributes;
  if (!object.contains(key) || object[key].is_null()) {
    return attributes;
  }
  const json& value = object[key];
  if (!value.is_object()) {
    notes.push_back(std::string{"field '"} + key + "' is not an object; treated as empty");
    return attributes;
  }
  for (const auto& [attr_key, attr_value] : value.items()) {
    attributes.emplace(attr_key, attr_value);
  }
  return attributes;
}

// Events: array of names, or array of objects exposing a string "name".
// Elements of any other shape are ignored.
std::optional<std::vector<std::string>> read_events(const json& object, const char* key,
                                                    FieldNotes& notes) {
  if (!object.contains(key) || object[key].is_null()) {
    return std::nullopt;
  }
  const json& value = object[key];
  if (!value.is_array()) {
    notes.push_back(std::string{"field '"} + key + "' is not an array; treated as absent");
    return std::nullopt;
  }
  std::vector<std::string> events;
  events.reserve(value.size());
  for (const auto& event : value) {
    if (event.is_string()) {
      events.push_back(event.get<std::string>());
    } else if (event.is_object() && event.contains("name") && event["name"].is_string()) {
      events.push_back(event["name"].get<std::string>());
    }
  }
  return events;
}

std::optional<std::string> read_parent(const json& object, const char* key) {
  if (!object.contains(key) || !object[key].is_string()) {
    return std::nullopt;
  }
  std::string parent = object[key].get<std::string>();
  if (parent.empty()) {
    return std::nullopt;
  }
  return parent;
}

SpanRecord parse_flat_span(const json& value, FieldNotes& notes) {
  SpanRecord span;
  span.name = value["name"].get<std::string>();
  span.trace_id = value["trace_id"].get<std::string>();
  span.span_id = value["span_id"].get<std::string>();
  span.parent_span_id = read_parent(value, "parent_span_id");
  span.kind = read_kind(value, "kind");
  span.start_time_unix_nano = read_timestamp(value, "start_time_unix_nano", notes);
  span.end_time_unix_nano = read_timestamp(value, "end_time_unix_nano", notes);
  span.attributes = read_attribute_object(value, "attributes", notes);
  span.resource_attributes = read_attribute_object(value, "resource_attributes", notes);
  span.events = read_events(value, "events", notes);
  return span;
}

// OTLP AnyValue: {"stringValue": ...}, {"intValue": "42"}, {"boolValue": true}, ...
json unwrap_any_value(const json& any) {
  if (!any.is_object()) {
    return any;
  }
  if (any.contains("stringValue")) {
    return any["stringValue"];
  }
  if (any.contains("boolValue")) {
    return any["boolValue"];
  }
  if (any.contains("intValue")) {
    const json& int_value = any["intValue"];
    if (int_value.is_string()) {
      const std::string text = int_value.get<std::string>();
      if (!text.empty() && text.front() == '-') {
        std::int64_t parsed = 0;
        const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), parsed);
        if (ec == std::errc{} && ptr == text.data() + text.size()) {
          return parsed;
        }
      } else if (auto parsed = parse_decimal_u64(text)) {
        return *parsed;
      }
    }
    return int_value;
  }
  if (any.contains("doubleValue")) {
    return any["doubleValue"];
  }
  if (any.contains("arrayValue")) {
    json array = json::array();
    const json& array_value = any["arrayValue"];
    if (array_value.is_object() && array_value.contains("values") &&
        array_value["values"].is_array()) {
      for (const auto& element : array_value["values"]) {
        array.push_back(unwrap_any_value(element));
      }
    }
    return array;
  }
  if (any.contains("kvlistValue")) {
    json object = json::object();
    const json& kvlist = any["kvlistValue"];
    if (kvlist.is_object() && kvlist.contains("values") && kvlist["values"].is_array()) {
      for (const auto& kv : kvlist["values"]) {
        if (kv.is_object() && kv.contains("key") && kv["key"].is_string()) {
          object[kv["key"].get<std::string>()] =
              kv.contains("value") ? unwrap_any_value(kv["value"]) : json(nullptr);
        }
      }
    }
    return object;
  }
  return any;
}

// OTLP attribute list: [{"key": "...", "value": AnyValue}, ...]. Entries without a key are dropped.
AttributeMap read_otlp_attributes(const json& object, const char* key, FieldNotes& notes) {
  AttributeMap attributes;
  if (!object.contains(key) || object[key].is_null()) {
    return attributes;
  }
  const json& value = object[key];
  if (!value.is_array()) {
    notes.push_back(std::string{"field '"} + key + "' is not an array; treated as empty");
    return attributes;
  }
  for (const auto& entry : value) {
    if (entry.is_object() && entry.contains("key") && entry["key"].is_string()) {
      attributes[entry["key"].get<std::string>()] =
          entry.contains("value") ? unwrap_any_value(entry["value"]) : json(nullptr);
    }
  }
  return attributes;
}

// Only a missing name, traceId or spanId rejects an OTLP span.
core::Result<SpanRecord, std::string> parse_otlp_span(const json& value,
                                                      const AttributeMap& resource,
                                                      FieldNotes& notes) {
  using SpanResult = core::Result<SpanRecord, std::string>;

  if (!value.is_object()) {
    return SpanResult::err("OTLP span is not an object");
  }
  for (const char* required : {"name", "traceId", "spanId"}) {
    if (!value.contains(required) || !value[required].is_string()) {
      return SpanResult::err(std::string{"OTLP span missing string field '"} + required + "'");
    }
  }

  SpanRecord span;
  span.name = value["name"].get<std::string>();
  span.trace_id = value["traceId"].get<std::string>();
  span.span_id = value["spanId"].get<std::string>();
  span.parent_span_id = read_parent(value, "parentSpanId");
  span.kind = read_kind(value, "kind");
  span.resource_attributes = resource;
  span.start_time_unix_nano = read_timestamp(value, "startTimeUnixNano", notes);
  span.end_time_unix_nano = read_timestamp(value, "endTimeUnixNano", notes);
  span.attributes = read_otlp_attributes(value, "attributes", notes);
  span.events = read_events(value, "events", notes);
  return SpanResult::ok(std::move(span));
}

void record_notes(const std::size_t line_number, const std::string& span_name,
                  FieldNotes& notes, ExtractionResult& out) {
  for (auto& reason : notes) {
    out.coerced.push_back(CoercedField{line_number, span_name, std::move(reason)});
  }
  notes.clear();
}

// Walks resourceSpans -> scopeSpans (or legacy instrumentationLibrarySpans) -> spans.
void expand_otlp_envelope(const json& envelope, const std::size_t line_number,
                          ExtractionResult& out) {
  for (const auto& resource_spans : envelope["resourceSpans"]) {
    if (!resource_spans.is_object()) {
      continue;
    }

    AttributeMap resource;
    if (resource_spans.contains("resource") && resource_spans["resource"].is_object()) {
      FieldNotes resource_notes;
      resource = read_otlp_attributes(resource_spans["resource"], "attributes", resource_notes);
      record_notes(line_number, "resource", resource_notes, out);
    }

    for (const char* scope_key : {"scopeSpans", "instrumentationLibrarySpans"}) {
      if (!resource_spans.contains(scope_key) || !resource_spans[scope_key].is_array()) {
        continue;
      }
      for (const auto& scope : resource_spans[scope_key]) {
        if (!scope.is_object() || !scope.contains("spans") || !scope["spans"].is_array()) {
          continue;
        }
        for (const auto& span_json : scope["spans"]) {
          FieldNotes notes;
          auto parsed = parse_otlp_span(span_json, resource, notes);
          if (parsed.has_value()) {
            record_notes(line_number, parsed.value().name, notes, out);
            out.spans.push_back(std::move(parsed.value()));
          } else {
            out.skipped.push_back(SkippedSpan{line_number, parsed.error()});
          }
        }
      }
    }
  }
}

}  // namespace

ExtractionResult SpanExtractor::extract(const std::string_view text) const {
  ExtractionResult result;

  std::size_t line_number = 0;
  std::size_t cursor = 0;
  while (cursor <= text.size()) {
    const std::size_t newline = text.find('\n', cursor);
    const std::size_t line_end = newline == std::string_view::npos ? text.size() : newline;
    const std::string_view line = core::trim_view(text.substr(cursor, line_end - cursor));
    ++line_number;
    cursor = line_end + 1;

    if (line.empty()) {
      if (newline == std::string_view::npos) {
        break;
      }
      continue;
    }

    // Non-throwing parse: a discarded value means "not JSON", i.e. a log line.
    const json value = json::parse(line, nullptr, /*allow_exceptions=*/false);
    if (value.is_discarded()) {
      ++result.log_lines;
    } else if (is_span_like(value)) {
      FieldNotes notes;
      SpanRecord span = parse_flat_span(value, notes);
      record_notes(line_number, span.name, notes, result);
      result.spans.push_back(std::move(span));
    } else if (is_otlp_envelope(value)) {
      expand_otlp_envelope(value, line_number, result);
    } else {
      ++result.log_lines;
    }

    if (newline == std::string_view::npos) {
      break;
    }
  }

  return result;
}

std::vector<domain::SpanRecord> extract_spans(const std::string_view text) {
  return SpanExtractor{}.extract(text).spans;
}

std::string summarize(const ExtractionResult& result) {
  return "spans=" + std::to_string(result.spans.size()) +
         " skipped=" + std::to_string(result.skipped.size()) +
         " log_lines=" + std::to_string(result.log_lines);
}

std::vector<const domain::SpanRecord*> find_spans_by_name(
    const std::vector<domain::SpanRecord>& spans, const std::string_view name) {
  std::vector<const domain::SpanRecord*> found;
  for (const auto& span : spans) {
    if (span.name == name) {
      found.push_back(&span);
    }
  }
  return found;
}

bool has_span(const std::vector<domain::SpanRecord>& spans, const std::string_view name) {
  return std::any_of(spans.begin(), spans.end(),
                     [name](const domain::SpanRecord& span) { return span.name == name; });
}

std::size_t count_spans(const std::vector<domain::SpanRecord>& spans,
                        const std::string_view name) {
  return static_cast<std::size_t>(
      std::count_if(spans.begin(), spans.end(),
                    [name](const domain::SpanRecord& span) { return span.name == name; }));
}

}  // namespace spanproof::ingest
