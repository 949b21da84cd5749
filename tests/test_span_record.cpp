#include "spanproof/domain/span_record.h"
#include "spanproof/domain/span_record_json.h"

#include <catch2/catch_test_macros.hpp>

using namespace spanproof::domain;

namespace {

SpanRecord make_span(const std::string& name, const std::string& id) {
  SpanRecord span;
  span.name = name;
  span.trace_id = "trace-1";
  span.span_id = id;
  return span;
}

}  // namespace

TEST_CASE("SpanKind names and wire codes", "[domain][span]") {
  CHECK(span_kind_to_string(SpanKind::kServer) == "server");
  CHECK(span_kind_from_string("CLIENT") == SpanKind::kClient);
  CHECK(span_kind_from_string("Consumer") == SpanKind::kConsumer);
  CHECK_FALSE(span_kind_from_string("unspecified").has_value());

  CHECK(span_kind_to_wire(SpanKind::kInternal) == 1);
  CHECK(span_kind_to_wire(SpanKind::kConsumer) == 5);
  CHECK(span_kind_from_wire(4) == SpanKind::kProducer);
  CHECK_FALSE(span_kind_from_wire(0).has_value());
  CHECK_FALSE(span_kind_from_wire(6).has_value());
}

TEST_CASE("duration_ms truncates instead of rounding", "[domain][span]") {
  auto span = make_span("op", "s1");
  CHECK_FALSE(span.duration_ms().has_value());

  span.start_time_unix_nano = 1'000'000'000;
  span.end_time_unix_nano = 1'001'999'999;
  REQUIRE(span.duration_ms().has_value());
  CHECK(*span.duration_ms() == 1);

  span.end_time_unix_nano = 1'000'999'999;
  CHECK(*span.duration_ms() == 0);

  SECTION("end before start has no duration") {
    span.end_time_unix_nano = 999;
    CHECK_FALSE(span.duration_ms().has_value());
  }
}

TEST_CASE("is_error recognises status code and error flag", "[domain][span]") {
  auto span = make_span("op", "s1");
  CHECK_FALSE(span.is_error());

  span.attributes["otel.status_code"] = "error";
  CHECK(span.is_error());

  span.attributes["otel.status_code"] = "OK";
  CHECK_FALSE(span.is_error());

  span.attributes["error"] = true;
  CHECK(span.is_error());

  span.attributes["error"] = "true";
  CHECK_FALSE(span.is_error());
}

TEST_CASE("attribute_value_text compares strings by content", "[domain][span]") {
  CHECK(attribute_value_text(nlohmann::json("svc")) == "svc");
  CHECK(attribute_value_text(nlohmann::json(200)) == "200");
  CHECK(attribute_value_text(nlohmann::json(true)) == "true");
}

TEST_CASE("span_to_json writes the flat line format", "[domain][span]") {
  auto span = make_span("clnrm.run", "s1");
  span.start_time_unix_nano = 5;
  span.kind = SpanKind::kInternal;
  span.events = std::vector<std::string>{"started"};

  const auto j = span_to_json(span);
  CHECK(j["name"] == "clnrm.run");
  CHECK(j["parent_span_id"].is_null());
  CHECK(j["start_time_unix_nano"] == "5");
  CHECK_FALSE(j.contains("end_time_unix_nano"));
  CHECK(j["kind"] == "internal");
  CHECK(j["events"].size() == 1);
  CHECK_FALSE(j.contains("resource_attributes"));
}

TEST_CASE("spans_digest is stable and order sensitive", "[domain][span]") {
  const std::vector<SpanRecord> ab{make_span("a", "1"), make_span("b", "2")};
  const std::vector<SpanRecord> ba{make_span("b", "2"), make_span("a", "1")};

  CHECK(spans_digest(ab) == spans_digest(ab));
  CHECK(spans_digest(ab).size() == 64);
  CHECK(spans_digest(ab) != spans_digest(ba));
  // Empty sequence hashes the empty string.
  CHECK(spans_digest({}) == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}
