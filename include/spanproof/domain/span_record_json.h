#pragma once

#include "spanproof/domain/span_record.h"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace spanproof::domain {

// span_to_json emits the flat line format the extractor accepts.
// Absent optionals are written as null (parent_span_id) or omitted (everything else).
// Timestamps are written as decimal strings so 64-bit values survive any JSON consumer.
nlohmann::json span_to_json(const SpanRecord& span);

// canonical_span_string is the compact JSON dump of span_to_json.
// nlohmann::json objects are std::map backed, so keys are sorted and the output is byte-stable.
std::string canonical_span_string(const SpanRecord& span);

// spans_digest is the lower-case hex SHA-256 over the canonical strings of all spans,
// in sequence order, each followed by '\n'. Identical sequences give identical digests.
std::string spans_digest(const std::vector<SpanRecord>& spans);

}  // namespace spanproof::domain
