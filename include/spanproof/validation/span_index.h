#pragma once

#include "spanproof/domain/span_record.h"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace spanproof::validation {

// SpanIndex resolves the parent relation of a span set by position.
//
// It holds a reference to the spans (no copy, no ownership) and stores only indices into
// that vector, so parent/child links can never form ownership cycles. The index must not
// outlive the vector it was built from.
//
// span_id is assumed unique; if it is not, the first span carrying the id wins.
class SpanIndex {
 public:
  explicit SpanIndex(const std::vector<domain::SpanRecord>& spans);

  SpanIndex(const SpanIndex&) = delete;
  SpanIndex& operator=(const SpanIndex&) = delete;
  SpanIndex(SpanIndex&&) = delete;
  SpanIndex& operator=(SpanIndex&&) = delete;
  ~SpanIndex() = default;

  [[nodiscard]] const std::vector<domain::SpanRecord>& spans() const noexcept { return spans_; }

  [[nodiscard]] std::optional<std::size_t> find_by_id(std::string_view span_id) const;

  // Positions of all spans with this exact name, in input order (empty if none).
  [[nodiscard]] const std::vector<std::size_t>& with_name(std::string_view name) const;

  // parent_of resolves parent_span_id; nullopt when the span has no parent or the id is unknown.
  [[nodiscard]] std::optional<std::size_t> parent_of(std::size_t position) const;

  // Inverse of the parent relation: positions whose parent resolves to `position`.
  [[nodiscard]] const std::vector<std::size_t>& children_of(std::size_t position) const;

 private:
  const std::vector<domain::SpanRecord>& spans_;
  std::unordered_map<std::string, std::size_t> by_id_;
  std::unordered_map<std::string, std::vector<std::size_t>> by_name_;
  std::vector<std::vector<std::size_t>> children_;
};

}  // namespace spanproof::validation
