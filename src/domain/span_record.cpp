#include "spanproof/domain/span_record.h"

#include "spanproof/core/normalization.h"

namespace spanproof::domain {

namespace {

constexpr std::uint64_t kNanosPerMilli = 1'000'000;

}  // namespace

std::string span_kind_to_string(const SpanKind kind) {
  switch (kind) {
    case SpanKind::kInternal:
      return "internal";
    case SpanKind::kServer:
      return "server";
    case SpanKind::kClient:
      return "client";
    case SpanKind::kProducer:
      return "producer";
    case SpanKind::kConsumer:
      return "consumer";
  }
  return "internal";
}

std::optional<SpanKind> span_kind_from_string(const std::string_view name) {
  const std::string lower = core::normalize_ascii_lower(name);
  if (lower == "internal") {
    return SpanKind::kInternal;
  }
  if (lower == "server") {
    return SpanKind::kServer;
  }
  if (lower == "client") {
    return SpanKind::kClient;
  }
  if (lower == "producer") {
    return SpanKind::kProducer;
  }
  if (lower == "consumer") {
    return SpanKind::kConsumer;
  }
  return std::nullopt;
}

std::optional<SpanKind> span_kind_from_wire(const std::int64_t code) {
  if (code < span_kind_to_wire(SpanKind::kInternal) ||
      code > span_kind_to_wire(SpanKind::kConsumer)) {
    return std::nullopt;
  }
  return static_cast<SpanKind>(code);
}

std::string attribute_value_text(const nlohmann::json& value) {
  if (value.is_string()) {
    return value.get<std::string>();
  }
  return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::optional<std::uint64_t> SpanRecord::duration_ms() const {
  if (!start_time_unix_nano.has_value() || !end_time_unix_nano.has_value()) {
    return std::nullopt;
  }
  if (*end_time_unix_nano < *start_time_unix_nano) {
    return std::nullopt;
  }
  return (*end_time_unix_nano - *start_time_unix_nano) / kNanosPerMilli;
}

bool SpanRecord::is_error() const {
  const auto status = attributes.find("otel.status_code");
  if (status != attributes.end() && status->second.is_string() &&
      core::equals_ascii_ci(status->second.get_ref<const std::string&>(), "ERROR")) {
    return true;
  }

  const auto error = attributes.find("error");
  return error != attributes.end() && error->second.is_boolean() && error->second.get<bool>();
}

std::optional<std::string> SpanRecord::string_attribute(const std::string& key) const {
  const auto it = attributes.find(key);
  if (it == attributes.end() || !it->second.is_string()) {
    return std::nullopt;
  }
  return it->second.get<std::string>();
}

}  // namespace spanproof::domain
