#include "spanproof/ingest/span_extractor.h"

#include <catch2/catch_test_macros.hpp>

#include <string>

using namespace spanproof::ingest;
using spanproof::domain::SpanKind;

TEST_CASE("Extractor separates spans from ordinary log lines", "[ingest][extractor]") {
  const std::string text =
      "Starting test run\n"
      "{\"name\":\"clnrm.run\",\"trace_id\":\"t\",\"span_id\":\"s1\",\"parent_span_id\":null,"
      "\"attributes\":{}}\n"
      "\n"
      "   \n"
      "{\"level\":\"info\",\"msg\":\"json log, not a span\"}\n"
      "not json {\n"
      "{\"name\":\"clnrm.step\",\"trace_id\":\"t\",\"span_id\":\"s2\",\"parent_span_id\":\"s1\"}";

  const auto result = SpanExtractor{}.extract(text);

  REQUIRE(result.spans.size() == 2);
  CHECK(result.spans[0].name == "clnrm.run");
  CHECK_FALSE(result.spans[0].parent_span_id.has_value());
  CHECK(result.spans[1].name == "clnrm.step");
  CHECK(result.spans[1].parent_span_id == "s1");
  CHECK(result.skipped.empty());
  CHECK(result.log_lines == 3);
  CHECK(summarize(result) == "spans=2 skipped=0 log_lines=3");
}

TEST_CASE("Extractor requires string name, trace_id and span_id", "[ingest][extractor]") {
  const std::string text =
      "{\"name\":\"a\",\"trace_id\":\"t\"}\n"
      "{\"name\":7,\"trace_id\":\"t\",\"span_id\":\"s\"}\n"
      "[1,2,3]\n";

  const auto result = SpanExtractor{}.extract(text);
  CHECK(result.spans.empty());
  CHECK(result.skipped.empty());
  CHECK(result.log_lines == 3);
}

TEST_CASE("Extractor reads optional fields in both encodings", "[ingest][extractor]") {
  SECTION("timestamps as strings or integers") {
    const auto spans = extract_spans(
        "{\"name\":\"a\",\"trace_id\":\"t\",\"span_id\":\"s\","
        "\"start_time_unix_nano\":\"1700000000000000000\",\"end_time_unix_nano\":1700000000250000000}");
    REQUIRE(spans.size() == 1);
    CHECK(spans[0].start_time_unix_nano == 1700000000000000000ULL);
    CHECK(spans[0].end_time_unix_nano == 1700000000250000000ULL);
    CHECK(spans[0].duration_ms() == 250);
  }

  SECTION("kind as name, prefixed name or wire code") {
    const auto spans = extract_spans(
        "{\"name\":\"a\",\"trace_id\":\"t\",\"span_id\":\"1\",\"kind\":\"server\"}\n"
        "{\"name\":\"b\",\"trace_id\":\"t\",\"span_id\":\"2\",\"kind\":\"SPAN_KIND_CLIENT\"}\n"
        "{\"name\":\"c\",\"trace_id\":\"t\",\"span_id\":\"3\",\"kind\":5}\n"
        "{\"name\":\"d\",\"trace_id\":\"t\",\"span_id\":\"4\",\"kind\":\"weird\"}\n");
    REQUIRE(spans.size() == 4);
    CHECK(spans[0].kind == SpanKind::kServer);
    CHECK(spans[1].kind == SpanKind::kClient);
    CHECK(spans[2].kind == SpanKind::kConsumer);
    CHECK_FALSE(spans[3].kind.has_value());
  }

  SECTION("events as names or objects") {
    const auto spans = extract_spans(
        "{\"name\":\"a\",\"trace_id\":\"t\",\"span_id\":\"1\",\"events\":[\"start\",\"stop\"]}\n"
        "{\"name\":\"b\",\"trace_id\":\"t\",\"span_id\":\"2\","
        "\"events\":[{\"name\":\"container.start\",\"attributes\":{}}]}\n"
        "{\"name\":\"c\",\"trace_id\":\"t\",\"span_id\":\"3\"}\n");
    REQUIRE(spans.size() == 3);
    REQUIRE(spans[0].events.has_value());
    CHECK(*spans[0].events == std::vector<std::string>{"start", "stop"});
    CHECK(*spans[1].events == std::vector<std::string>{"container.start"});
    CHECK_FALSE(spans[2].events.has_value());
    CHECK(spans[2].event_count() == 0);
  }

  SECTION("attributes and resource attributes") {
    const auto spans = extract_spans(
        "{\"name\":\"a\",\"trace_id\":\"t\",\"span_id\":\"1\","
        "\"attributes\":{\"http.status_code\":200,\"component\":\"db\"},"
        "\"resource_attributes\":{\"service.name\":\"clnrm\"}}");
    REQUIRE(spans.size() == 1);
    CHECK(spans[0].attributes.at("http.status_code") == 200);
    CHECK(spans[0].string_attribute("component") == "db");
    CHECK(spans[0].resource_attributes.at("service.name") == "clnrm");
  }

  SECTION("empty parent id means root") {
    const auto spans =
        extract_spans("{\"name\":\"a\",\"trace_id\":\"t\",\"span_id\":\"1\",\"parent_span_id\":\"\"}");
    REQUIRE(spans.size() == 1);
    CHECK_FALSE(spans[0].parent_span_id.has_value());
  }
}

TEST_CASE("Mistyped optional fields keep the span with defaulted fields",
          "[ingest][extractor]") {
  const std::string text =
      "{\"name\":\"bad1\",\"trace_id\":\"t\",\"span_id\":\"1\",\"attributes\":[1]}\n"
      "{\"name\":\"bad2\",\"trace_id\":\"t\",\"span_id\":\"2\",\"events\":\"boom\"}\n"
      "{\"name\":\"bad3\",\"trace_id\":\"t\",\"span_id\":\"3\",\"start_time_unix_nano\":\"soon\"}\n"
      "{\"name\":\"bad4\",\"trace_id\":\"t\",\"span_id\":\"4\",\"end_time_unix_nano\":-5}\n"
      "{\"name\":\"bad5\",\"trace_id\":\"t\",\"span_id\":\"5\",\"start_time_unix_nano\":1.7e18,"
      "\"attributes\":{\"net.peer.name\":\"api.example.com\"}}\n"
      "{\"name\":\"good\",\"trace_id\":\"t\",\"span_id\":\"6\"}\n";

  const auto result = SpanExtractor{}.extract(text);

  REQUIRE(result.spans.size() == 6);
  CHECK(result.skipped.empty());
  CHECK(summarize(result) == "spans=6 skipped=0 log_lines=0");

  CHECK(result.spans[0].name == "bad1");
  CHECK(result.spans[0].attributes.empty());
  CHECK_FALSE(result.spans[1].events.has_value());
  CHECK_FALSE(result.spans[2].start_time_unix_nano.has_value());
  CHECK_FALSE(result.spans[3].end_time_unix_nano.has_value());
  CHECK_FALSE(result.spans[4].start_time_unix_nano.has_value());
  CHECK(result.spans[4].attributes.at("net.peer.name") == "api.example.com");
  CHECK(result.spans[5].name == "good");

  REQUIRE(result.coerced.size() == 5);
  CHECK(result.coerced[0].line_number == 1);
  CHECK(result.coerced[0].span_name == "bad1");
  CHECK(result.coerced[0].reason.find("attributes") != std::string::npos);
  CHECK(result.coerced[1].line_number == 2);
  CHECK(result.coerced[1].reason.find("events") != std::string::npos);
  CHECK(result.coerced[2].line_number == 3);
  CHECK(result.coerced[3].line_number == 4);
  CHECK(result.coerced[4].span_name == "bad5");
}

TEST_CASE("Mistyped optional fields in OTLP spans keep the span", "[ingest][extractor][otlp]") {
  const std::string envelope =
      R"({"resourceSpans":[{"scopeSpans":[{"spans":[)"
      R"({"traceId":"t1","spanId":"a","name":"clnrm.run","attributes":{"k":"v"},)"
      R"("startTimeUnixNano":1.5,"events":"boot"}]}]}]})";

  const auto result = SpanExtractor{}.extract(envelope);

  REQUIRE(result.spans.size() == 1);
  CHECK(result.spans[0].name == "clnrm.run");
  CHECK(result.spans[0].attributes.empty());
  CHECK_FALSE(result.spans[0].start_time_unix_nano.has_value());
  CHECK_FALSE(result.spans[0].events.has_value());
  CHECK(result.skipped.empty());
  CHECK(result.coerced.size() == 3);
}

TEST_CASE("OTLP envelopes expand into spans", "[ingest][extractor][otlp]") {
  const std::string envelope =
      R"({"resourceSpans":[{"resource":{"attributes":[)"
      R"({"key":"service.name","value":{"stringValue":"clnrm"}}]},)"
      R"("scopeSpans":[{"spans":[)"
      R"({"traceId":"t1","spanId":"a","parentSpanId":"","name":"clnrm.run","kind":1,)"
      R"("startTimeUnixNano":"1000000","endTimeUnixNano":"3000000",)"
      R"("attributes":[{"key":"retries","value":{"intValue":"2"}},)"
      R"({"key":"ok","value":{"boolValue":true}}],)"
      R"("events":[{"name":"boot"}]},)"
      R"({"traceId":"t1","spanId":"b","parentSpanId":"a","name":"clnrm.step"},)"
      R"({"spanId":"broken"}]}]}]})";

  const auto result = SpanExtractor{}.extract("log before\n" + envelope + "\n");

  REQUIRE(result.spans.size() == 2);
  const auto& root = result.spans[0];
  CHECK(root.name == "clnrm.run");
  CHECK(root.trace_id == "t1");
  CHECK_FALSE(root.parent_span_id.has_value());
  CHECK(root.kind == SpanKind::kInternal);
  CHECK(root.duration_ms() == 2);
  CHECK(root.attributes.at("retries") == 2);
  CHECK(root.attributes.at("ok") == true);
  CHECK(root.resource_attributes.at("service.name") == "clnrm");
  REQUIRE(root.events.has_value());
  CHECK(root.events->front() == "boot");

  CHECK(result.spans[1].parent_span_id == "a");
  CHECK(result.spans[1].resource_attributes.at("service.name") == "clnrm");

  REQUIRE(result.skipped.size() == 1);
  CHECK(result.skipped[0].line_number == 2);
  CHECK(result.log_lines == 1);
}

TEST_CASE("Extraction is idempotent", "[ingest][extractor]") {
  const std::string text =
      "boot\n"
      "{\"name\":\"x\",\"trace_id\":\"t\",\"span_id\":\"1\",\"attributes\":{\"k\":[1,{\"z\":1}]}}\n"
      "{\"name\":\"y\",\"trace_id\":\"t\",\"span_id\":\"2\",\"parent_span_id\":\"1\"}\n";

  CHECK(extract_spans(text) == extract_spans(text));
}

TEST_CASE("Lookup helpers work on extracted spans", "[ingest][extractor]") {
  const auto spans = extract_spans(
      "{\"name\":\"step\",\"trace_id\":\"t\",\"span_id\":\"1\"}\n"
      "{\"name\":\"run\",\"trace_id\":\"t\",\"span_id\":\"2\"}\n"
      "{\"name\":\"step\",\"trace_id\":\"t\",\"span_id\":\"3\"}\n");

  CHECK(has_span(spans, "run"));
  CHECK_FALSE(has_span(spans, "missing"));
  CHECK(count_spans(spans, "step") == 2);

  const auto steps = find_spans_by_name(spans, "step");
  REQUIRE(steps.size() == 2);
  CHECK(steps[0]->span_id == "1");
  CHECK(steps[1]->span_id == "3");
}
