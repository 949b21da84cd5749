#include "spanproof/validation/span_index.h"

namespace spanproof::validation {

namespace {

const std::vector<std::size_t>& empty_positions() {
  static const std::vector<std::size_t> kEmpty;
  return kEmpty;
}

}  // namespace

SpanIndex::SpanIndex(const std::vector<domain::SpanRecord>& spans)
    : spans_(spans), children_(spans.size()) {
  by_id_.reserve(spans.size());
  for (std::size_t i = 0; i < spans.size(); ++i) {
    by_id_.emplace(spans[i].span_id, i);
    by_name_[spans[i].name].push_back(i);
  }

  for (std::size_t i = 0; i < spans.size(); ++i) {
    if (const auto parent = parent_of(i)) {
      children_[*parent].push_back(i);
    }
  }
}

std::optional<std::size_t> SpanIndex::find_by_id(const std::string_view span_id) const {
  const auto it = by_id_.find(std::string{span_id});
  if (it == by_id_.end()) {
    return std::nullopt;
  }
  return it->second;
}

const std::vector<std::size_t>& SpanIndex::with_name(const std::string_view name) const {
  const auto it = by_name_.find(std::string{name});
  return it == by_name_.end() ? empty_positions() : it->second;
}

std::optional<std::size_t> SpanIndex::parent_of(const std::size_t position) const {
  const auto& parent_id = spans_.at(position).parent_span_id;
  if (!parent_id.has_value()) {
    return std::nullopt;
  }
  return find_by_id(*parent_id);
}

const std::vector<std::size_t>& SpanIndex::children_of(const std::size_t position) const {
  return children_.at(position);
}

}  // namespace spanproof::validation
