#pragma once

#include "spanproof/domain/span_record.h"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace spanproof::ingest {

// SkippedSpan records an OTLP span entry without a string name, traceId or spanId.
struct SkippedSpan {
  std::size_t line_number{0};  // 1-based
  std::string reason;
};

// CoercedField records an optional field of a kept span that had the wrong JSON type and was
// read as absent (timestamps, events) or empty (attributes).
struct CoercedField {
  std::size_t line_number{0};  // 1-based
  std::string span_name;
  std::string reason;
};

// ExtractionResult is the extractor output plus its diagnostics.
// spans preserve input line order; spans expanded from one OTLP envelope keep envelope order.
struct ExtractionResult {
  std::vector<domain::SpanRecord> spans;
  std::vector<SkippedSpan> skipped;
  std::vector<CoercedField> coerced;
  std::size_t log_lines{0};  // non-empty lines that were not span-shaped
};

// SpanExtractor turns mixed process output into SpanRecords.
//
// Each line is trimmed; empty lines are ignored. A line is span-shaped when it parses as a
// JSON object with string fields name, trace_id and span_id, or when it is an OTLP collector
// envelope ({"resourceSpans": [...]}). Everything else is an ordinary log line and is counted,
// never reported as an error.
//
// Only name, trace_id and span_id are required. An optional field with the wrong JSON type
// (attributes not an object, events not an array, a timestamp that is neither an unsigned
// integer nor a decimal string) never drops the span: the field is read as absent or empty and
// noted in ExtractionResult::coerced.
//
// Pure and deterministic: the same text always yields an equal ExtractionResult.
class SpanExtractor {
 public:
  [[nodiscard]] ExtractionResult extract(std::string_view text) const;
};

// extract_spans is SpanExtractor{}.extract(text).spans.
[[nodiscard]] std::vector<domain::SpanRecord> extract_spans(std::string_view text);

// summarize returns "spans=N skipped=M log_lines=K" for collaborators that log extraction.
[[nodiscard]] std::string summarize(const ExtractionResult& result);

[[nodiscard]] std::vector<const domain::SpanRecord*> find_spans_by_name(
    const std::vector<domain::SpanRecord>& spans, std::string_view name);
[[nodiscard]] bool has_span(const std::vector<domain::SpanRecord>& spans, std::string_view name);
[[nodiscard]] std::size_t count_spans(const std::vector<domain::SpanRecord>& spans,
                                      std::string_view name);

}  // namespace spanproof::ingest
