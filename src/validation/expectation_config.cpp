#include "spanproof/validation/expectation_config.h"

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace spanproof::validation {

namespace {

using json = nlohmann::json;

// Thrown by the readers below and converted to core::Error at the public boundary.
class RuleSetError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

[[noreturn]] void fail(const std::string& path, const std::string& problem) {
  throw RuleSetError(path + ": " + problem);
}

std::string index_path(const std::string& path, const std::size_t i) {
  return path + "[" + std::to_string(i) + "]";
}

void require_object(const json& j, const std::string& path) {
  if (!j.is_object()) {
    fail(path, "expected an object");
  }
}

void reject_unknown_keys(const json& j, const std::string& path,
                         const std::initializer_list<std::string_view> allowed) {
  for (const auto& [key, value] : j.items()) {
    bool known = false;
    for (const auto name : allowed) {
      known = known || key == name;
    }
    if (!known) {
      fail(path + "." + key, "unknown key");
    }
  }
}

std::string read_string(const json& j, const std::string& path) {
  if (!j.is_string()) {
    fail(path, "expected a string");
  }
  return j.get<std::string>();
}

bool read_bool(const json& j, const std::string& path) {
  if (!j.is_boolean()) {
    fail(path, "expected true or false");
  }
  return j.get<bool>();
}

std::uint64_t read_unsigned(const json& j, const std::string& path) {
  if (!j.is_number_unsigned()) {
    fail(path, "expected a non-negative integer");
  }
  return j.get<std::uint64_t>();
}

std::vector<std::string> read_string_array(const json& j, const std::string& path) {
  if (!j.is_array()) {
    fail(path, "expected an array of strings");
  }
  std::vector<std::string> values;
  for (std::size_t i = 0; i < j.size(); ++i) {
    values.push_back(read_string(j[i], index_path(path, i)));
  }
  return values;
}

// Scalar rule values are compared as text, so 200 and "200" mean the same thing.
std::map<std::string, std::string> read_value_map(const json& j, const std::string& path) {
  require_object(j, path);
  std::map<std::string, std::string> values;
  for (const auto& [key, value] : j.items()) {
    if (value.is_structured() || value.is_null()) {
      fail(path + "." + key, "expected a string, number or boolean");
    }
    values[key] = domain::attribute_value_text(value);
  }
  return values;
}

SpanExpectation read_span(const json& j, const std::string& path) {
  require_object(j, path);
  reject_unknown_keys(j, path, {"name", "parent", "kind", "attrs", "events", "duration_ms"});

  SpanExpectation span;
  if (!j.contains("name")) {
    fail(path + ".name", "missing required key");
  }
  span.name = read_string(j.at("name"), path + ".name");

  if (j.contains("parent")) {
    span.parent = read_string(j.at("parent"), path + ".parent");
  }
  if (j.contains("kind")) {
    const std::string name = read_string(j.at("kind"), path + ".kind");
    span.kind = domain::span_kind_from_string(name);
    if (!span.kind.has_value()) {
      fail(path + ".kind", "unknown span kind '" + name + "'");
    }
  }
  if (j.contains("attrs")) {
    const auto& attrs = j.at("attrs");
    const std::string attrs_path = path + ".attrs";
    require_object(attrs, attrs_path);
    reject_unknown_keys(attrs, attrs_path, {"all", "any"});
    if (attrs.contains("all")) {
      span.attrs_all = read_value_map(attrs.at("all"), attrs_path + ".all");
    }
    if (attrs.contains("any")) {
      span.attrs_any = read_string_array(attrs.at("any"), attrs_path + ".any");
    }
  }
  if (j.contains("events")) {
    const auto& events = j.at("events");
    const std::string events_path = path + ".events";
    require_object(events, events_path);
    reject_unknown_keys(events, events_path, {"any"});
    if (events.contains("any")) {
      span.events_any = read_string_array(events.at("any"), events_path + ".any");
    }
  }
  if (j.contains("duration_ms")) {
    const auto& duration = j.at("duration_ms");
    const std::string duration_path = path + ".duration_ms";
    require_object(duration, duration_path);
    reject_unknown_keys(duration, duration_path, {"min", "max"});
    if (duration.contains("min")) {
      span.duration_min_ms = read_unsigned(duration.at("min"), duration_path + ".min");
    }
    if (duration.contains("max")) {
      span.duration_max_ms = read_unsigned(duration.at("max"), duration_path + ".max");
    }
  }

  if (auto config = span.check_config(); !config.has_value()) {
    fail(path, config.error().message);
  }
  return span;
}

std::vector<Edge> read_edges(const json& j, const std::string& path) {
  if (!j.is_array()) {
    fail(path, "expected an array of [parent, child] pairs");
  }
  std::vector<Edge> edges;
  for (std::size_t i = 0; i < j.size(); ++i) {
    const std::string edge_path = index_path(path, i);
    const auto& pair = j[i];
    if (!pair.is_array() || pair.size() != 2) {
      fail(edge_path, "expected a [parent, child] pair");
    }
    edges.push_back(Edge{read_string(pair[0], edge_path + "[0]"),
                         read_string(pair[1], edge_path + "[1]")});
  }
  return edges;
}

GraphExpectation read_graph(const json& j, const std::string& path) {
  require_object(j, path);
  reject_unknown_keys(j, path, {"must_include", "must_not_cross", "acyclic"});

  GraphExpectation graph;
  if (j.contains("must_include")) {
    graph.must_include = read_edges(j.at("must_include"), path + ".must_include");
  }
  if (j.contains("must_not_cross")) {
    graph.must_not_cross = read_edges(j.at("must_not_cross"), path + ".must_not_cross");
  }
  if (j.contains("acyclic")) {
    graph.acyclic = read_bool(j.at("acyclic"), path + ".acyclic");
  }
  return graph;
}

CountBound read_bound(const json& j, const std::string& path) {
  require_object(j, path);
  reject_unknown_keys(j, path, {"gte", "lte", "eq"});
  if (j.empty()) {
    fail(path, "count bound needs at least one of gte, lte or eq");
  }

  const auto read_optional = [&j, &path](const char* key) -> std::optional<std::size_t> {
    if (!j.contains(key)) {
      return std::nullopt;
    }
    return static_cast<std::size_t>(read_unsigned(j.at(key), path + "." + key));
  };

  auto bound = CountBound::make(read_optional("gte"), read_optional("lte"), read_optional("eq"));
  if (!bound.has_value()) {
    fail(path, bound.error().message);
  }
  return bound.value();
}

CountExpectation read_counts(const json& j, const std::string& path) {
  require_object(j, path);
  reject_unknown_keys(j, path, {"spans_total", "events_total", "errors_total", "by_name"});

  CountExpectation counts;
  if (j.contains("spans_total")) {
    counts.spans_total = read_bound(j.at("spans_total"), path + ".spans_total");
  }
  if (j.contains("events_total")) {
    counts.events_total = read_bound(j.at("events_total"), path + ".events_total");
  }
  if (j.contains("errors_total")) {
    counts.errors_total = read_bound(j.at("errors_total"), path + ".errors_total");
  }
  if (j.contains("by_name")) {
    const auto& by_name = j.at("by_name");
    require_object(by_name, path + ".by_name");
    for (const auto& [name, bound] : by_name.items()) {
      counts.by_name.emplace(name, read_bound(bound, path + ".by_name." + name));
    }
  }
  return counts;
}

HermeticityExpectation read_hermeticity(const json& j, const std::string& path) {
  require_object(j, path);
  reject_unknown_keys(j, path, {"no_external_services", "resource_attrs", "span_attrs"});

  HermeticityExpectation hermeticity;
  if (j.contains("no_external_services")) {
    hermeticity.no_external_services =
        read_bool(j.at("no_external_services"), path + ".no_external_services");
  }
  if (j.contains("resource_attrs")) {
    const auto& resource = j.at("resource_attrs");
    const std::string resource_path = path + ".resource_attrs";
    require_object(resource, resource_path);
    reject_unknown_keys(resource, resource_path, {"must_match"});
    if (resource.contains("must_match")) {
      hermeticity.resource_attrs_must_match =
          read_value_map(resource.at("must_match"), resource_path + ".must_match");
    }
  }
  if (j.contains("span_attrs")) {
    const auto& span_attrs = j.at("span_attrs");
    const std::string span_attrs_path = path + ".span_attrs";
    require_object(span_attrs, span_attrs_path);
    reject_unknown_keys(span_attrs, span_attrs_path, {"forbid_keys"});
    if (span_attrs.contains("forbid_keys")) {
      hermeticity.span_attrs_forbid_keys =
          read_string_array(span_attrs.at("forbid_keys"), span_attrs_path + ".forbid_keys");
    }
  }
  return hermeticity;
}

ExpectationSet read_expect(const json& expect) {
  const std::string path = "expect";
  require_object(expect, path);
  reject_unknown_keys(expect, path, {"span", "graph", "counts", "hermeticity"});

  ExpectationSet expectations;
  if (expect.contains("span")) {
    const auto& spans = expect.at("span");
    if (!spans.is_array()) {
      fail(path + ".span", "expected an array of span rules");
    }
    for (std::size_t i = 0; i < spans.size(); ++i) {
      expectations.spans.push_back(read_span(spans[i], index_path(path + ".span", i)));
    }
  }
  if (expect.contains("graph")) {
    expectations.graph = read_graph(expect.at("graph"), path + ".graph");
  }
  if (expect.contains("counts")) {
    expectations.counts = read_counts(expect.at("counts"), path + ".counts");
  }
  if (expect.contains("hermeticity")) {
    expectations.hermeticity = read_hermeticity(expect.at("hermeticity"), path + ".hermeticity");
  }
  return expectations;
}

json bound_to_json(const CountBound& bound) {
  json j = json::object();
  if (bound.min()) {
    j["gte"] = *bound.min();
  }
  if (bound.max()) {
    j["lte"] = *bound.max();
  }
  if (bound.exact()) {
    j["eq"] = *bound.exact();
  }
  return j;
}

json edges_to_json(const std::vector<Edge>& edges) {
  json j = json::array();
  for (const auto& edge : edges) {
    j.push_back(json::array({edge.parent, edge.child}));
  }
  return j;
}

json span_expectation_to_json(const SpanExpectation& span) {
  json j;
  j["name"] = span.name;
  if (span.parent) {
    j["parent"] = *span.parent;
  }
  if (span.kind) {
    j["kind"] = domain::span_kind_to_string(*span.kind);
  }
  if (!span.attrs_all.empty() || !span.attrs_any.empty()) {
    json attrs = json::object();
    if (!span.attrs_all.empty()) {
      attrs["all"] = span.attrs_all;
    }
    if (!span.attrs_any.empty()) {
      attrs["any"] = span.attrs_any;
    }
    j["attrs"] = std::move(attrs);
  }
  if (!span.events_any.empty()) {
    j["events"] = json{{"any", span.events_any}};
  }
  if (span.duration_min_ms || span.duration_max_ms) {
    json duration = json::object();
    if (span.duration_min_ms) {
      duration["min"] = *span.duration_min_ms;
    }
    if (span.duration_max_ms) {
      duration["max"] = *span.duration_max_ms;
    }
    j["duration_ms"] = std::move(duration);
  }
  return j;
}

}  // namespace

core::Result<ExpectationSet> load_expectation_set(const nlohmann::json& document) {
  try {
    if (!document.is_object()) {
      fail("$", "rule set must be a JSON object");
    }
    const bool wrapped = document.contains("expect");
    return core::Result<ExpectationSet>::ok(read_expect(wrapped ? document.at("expect") : document));
  } catch (const RuleSetError& e) {
    return core::Result<ExpectationSet>::err(core::Error::configuration(e.what()));
  } catch (const json::exception& e) {
    return core::Result<ExpectationSet>::err(
        core::Error::configuration(std::string{"invalid rule set: "} + e.what()));
  }
}

core::Result<ExpectationSet> load_expectation_set_text(const std::string_view text) {
  const json document = json::parse(text, nullptr, false);
  if (document.is_discarded()) {
    return core::Result<ExpectationSet>::err(
        core::Error::configuration("rule set is not valid JSON"));
  }
  return load_expectation_set(document);
}

nlohmann::json expectation_set_to_json(const ExpectationSet& expectations) {
  json expect = json::object();

  if (!expectations.spans.empty()) {
    json spans = json::array();
    for (const auto& span : expectations.spans) {
      spans.push_back(span_expectation_to_json(span));
    }
    expect["span"] = std::move(spans);
  }

  if (expectations.graph) {
    const auto& graph = *expectations.graph;
    json j;
    j["must_include"] = edges_to_json(graph.must_include);
    j["must_not_cross"] = edges_to_json(graph.must_not_cross);
    j["acyclic"] = graph.acyclic;
    expect["graph"] = std::move(j);
  }

  if (expectations.counts) {
    const auto& counts = *expectations.counts;
    json j = json::object();
    if (counts.spans_total) {
      j["spans_total"] = bound_to_json(*counts.spans_total);
    }
    if (counts.events_total) {
      j["events_total"] = bound_to_json(*counts.events_total);
    }
    if (counts.errors_total) {
      j["errors_total"] = bound_to_json(*counts.errors_total);
    }
    if (!counts.by_name.empty()) {
      json by_name = json::object();
      for (const auto& [name, bound] : counts.by_name) {
        by_name[name] = bound_to_json(bound);
      }
      j["by_name"] = std::move(by_name);
    }
    expect["counts"] = std::move(j);
  }

  if (expectations.hermeticity) {
    const auto& hermeticity = *expectations.hermeticity;
    json j;
    j["no_external_services"] = hermeticity.no_external_services;
    j["resource_attrs"] = json{{"must_match", hermeticity.resource_attrs_must_match}};
    j["span_attrs"] = json{{"forbid_keys", hermeticity.span_attrs_forbid_keys}};
    expect["hermeticity"] = std::move(j);
  }

  json document;
  document["expect"] = std::move(expect);
  return document;
}

}  // namespace spanproof::validation
