#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace spanproof::domain {

// SpanKind mirrors the OpenTelemetry span kind. Wire codes are the OTLP integers.
enum class SpanKind {
  kInternal = 1,
  kServer = 2,
  kClient = 3,
  kProducer = 4,
  kConsumer = 5,
};

// Canonical lower-case names: "internal", "server", "client", "producer", "consumer".
[[nodiscard]] std::string span_kind_to_string(SpanKind kind);
// Case-insensitive; nullopt for anything else.
[[nodiscard]] std::optional<SpanKind> span_kind_from_string(std::string_view name);
[[nodiscard]] std::optional<SpanKind> span_kind_from_wire(std::int64_t code);
[[nodiscard]] constexpr int span_kind_to_wire(const SpanKind kind) noexcept {
  return static_cast<int>(kind);
}

// Attribute values are arbitrary JSON. std::map keeps key order stable for hashing and output.
using AttributeMap = std::map<std::string, nlohmann::json>;

// attribute_value_text renders an attribute for comparison against rule strings:
// JSON strings compare by content, everything else by its compact JSON text (true, 42, [1,2]).
[[nodiscard]] std::string attribute_value_text(const nlohmann::json& value);

// SpanRecord is one span as emitted by the process under test.
// Built once by the extractor and read-only afterwards.
//
// parent_span_id is a lookup key into the same span set, never an owning link:
// parent/child edges are resolved through validation::SpanIndex.
// resource_attributes is process-wide; only the first span's copy is authoritative.
struct SpanRecord {
  std::string name;
  std::string trace_id;
  std::string span_id;
  std::optional<std::string> parent_span_id;
  AttributeMap attributes;
  AttributeMap resource_attributes;
  std::optional<std::uint64_t> start_time_unix_nano;
  std::optional<std::uint64_t> end_time_unix_nano;
  std::optional<SpanKind> kind;
  std::optional<std::vector<std::string>> events;

  bool operator==(const SpanRecord&) const = default;

  // duration_ms truncates: (end - start) / 1'000'000 in integer arithmetic.
  // nullopt when a timestamp is missing or end precedes start.
  [[nodiscard]] std::optional<std::uint64_t> duration_ms() const;

  [[nodiscard]] std::size_t event_count() const noexcept { return events ? events->size() : 0; }

  // is_error: otel.status_code equals "ERROR" (ASCII case-insensitive) or error == true.
  [[nodiscard]] bool is_error() const;

  // string_attribute returns the attribute only when it holds a JSON string.
  [[nodiscard]] std::optional<std::string> string_attribute(const std::string& key) const;
};

}  // namespace spanproof::domain
