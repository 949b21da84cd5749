#include "spanproof/validation/graph_expectation.h"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using namespace spanproof::validation;
using spanproof::domain::SpanRecord;

namespace {

SpanRecord make_span(const std::string& name, const std::string& id,
                     const std::string& parent = "") {
  SpanRecord span;
  span.name = name;
  span.trace_id = "trace-1";
  span.span_id = id;
  if (!parent.empty()) {
    span.parent_span_id = parent;
  }
  return span;
}

GraphValidationResult run(const GraphExpectation& expectation,
                          const std::vector<SpanRecord>& spans) {
  const SpanIndex index{spans};
  auto result = expectation.validate(index);
  REQUIRE(result.has_value());
  return result.value();
}

}  // namespace

TEST_CASE("Required and forbidden edges between root and child", "[validation][graph]") {
  const std::vector<SpanRecord> spans{make_span("root", "s1"), make_span("child", "s2", "s1")};

  SECTION("must_include passes") {
    GraphExpectation expectation;
    expectation.must_include = {{"root", "child"}};
    const auto result = run(expectation, spans);
    CHECK(result.passed);
    CHECK(result.edges_checked == 1);
  }

  SECTION("must_not_cross fails on the same edge") {
    GraphExpectation expectation;
    expectation.must_not_cross = {{"root", "child"}};
    const auto result = run(expectation, spans);
    CHECK_FALSE(result.passed);
    REQUIRE(result.findings.size() == 1);
    CHECK(result.findings[0].code == FindingCode::kForbiddenEdge);
    CHECK(result.findings[0].rule_id == "graph.must_not_cross[root->child]");
  }

  SECTION("edge direction matters") {
    GraphExpectation expectation;
    expectation.must_include = {{"child", "root"}};
    const auto result = run(expectation, spans);
    REQUIRE(result.findings.size() == 1);
    CHECK(result.findings[0].code == FindingCode::kEdgeMissing);
  }
}

TEST_CASE("Missing endpoints are distinct findings", "[validation][graph]") {
  const std::vector<SpanRecord> spans{make_span("root", "s1")};

  GraphExpectation expectation;
  expectation.must_include = {{"clnrm.run", "clnrm.step"}, {"root", "clnrm.step"}};

  const auto result = run(expectation, spans);
  CHECK(result.edges_checked == 2);
  REQUIRE(result.findings.size() == 2);
  CHECK(result.findings[0].code == FindingCode::kEdgeParentMissing);
  CHECK(result.findings[0].message.find("parent not found") != std::string::npos);
  CHECK(result.findings[1].code == FindingCode::kEdgeChildMissing);
  CHECK(result.findings[1].message.find("child not found") != std::string::npos);
}

TEST_CASE("Edges match existentially across repeated names", "[validation][graph]") {
  // Two "run" spans; only the second one is the parent of "step".
  const std::vector<SpanRecord> spans{make_span("run", "r1"), make_span("run", "r2"),
                                      make_span("step", "c1", "r2")};

  GraphExpectation expectation;
  expectation.must_include = {{"run", "step"}};
  CHECK(run(expectation, spans).passed);
}

TEST_CASE("Forbidden edge with an absent endpoint is satisfied", "[validation][graph]") {
  const std::vector<SpanRecord> spans{make_span("root", "s1")};

  GraphExpectation expectation;
  expectation.must_not_cross = {{"root", "ghost"}, {"ghost", "root"}};

  const auto result = run(expectation, spans);
  CHECK(result.passed);
  CHECK(result.edges_checked == 2);
}

TEST_CASE("Acyclicity check", "[validation][graph]") {
  SECTION("a tree is acyclic") {
    const std::vector<SpanRecord> spans{make_span("a", "1"), make_span("b", "2", "1"),
                                        make_span("c", "3", "1"), make_span("d", "4", "3")};
    GraphExpectation expectation;
    expectation.acyclic = true;
    CHECK(run(expectation, spans).passed);
  }

  SECTION("a parent loop is reported once, naming both spans") {
    const std::vector<SpanRecord> spans{make_span("a", "1", "3"), make_span("b", "2", "1"),
                                        make_span("c", "3", "2")};
    GraphExpectation expectation;
    expectation.acyclic = true;
    const auto result = run(expectation, spans);
    REQUIRE(result.findings.size() == 1);
    CHECK(result.findings[0].code == FindingCode::kCycle);
    CHECK(result.findings[0].rule_id == "graph.acyclic");
    CHECK(result.findings[0].message.find("cycle detected") != std::string::npos);
    CHECK(result.findings[0].message.find("'a'") != std::string::npos);
    CHECK(result.findings[0].message.find("'c'") != std::string::npos);
  }

  SECTION("a loop listed after an unrelated root in reverse order") {
    const std::vector<SpanRecord> spans{make_span("root", "0"), make_span("c", "3", "2"),
                                        make_span("b", "2", "1"), make_span("a", "1", "3")};
    GraphExpectation expectation;
    expectation.acyclic = true;
    const auto result = run(expectation, spans);
    REQUIRE(result.findings.size() == 1);
    CHECK(result.findings[0].code == FindingCode::kCycle);
    CHECK(result.findings[0].message.find("'b'") != std::string::npos);
    CHECK(result.findings[0].message.find("'c'") != std::string::npos);
    CHECK(result.findings[0].message.find("'root'") == std::string::npos);
  }

  SECTION("a loop listed after an unrelated root in rotated order") {
    const std::vector<SpanRecord> spans{make_span("root", "0"), make_span("b", "2", "1"),
                                        make_span("c", "3", "2"), make_span("a", "1", "3")};
    GraphExpectation expectation;
    expectation.acyclic = true;
    const auto result = run(expectation, spans);
    REQUIRE(result.findings.size() == 1);
    CHECK(result.findings[0].code == FindingCode::kCycle);
    CHECK(result.findings[0].message.find("'a'") != std::string::npos);
    CHECK(result.findings[0].message.find("'b'") != std::string::npos);
    CHECK(result.findings[0].message.find("'root'") == std::string::npos);
  }

  SECTION("a span that is its own parent") {
    const std::vector<SpanRecord> spans{make_span("self", "1", "1")};
    GraphExpectation expectation;
    expectation.acyclic = true;
    const auto result = run(expectation, spans);
    REQUIRE(result.findings.size() == 1);
    CHECK(result.findings[0].message.find("'self'") != std::string::npos);
  }

  SECTION("cycles are ignored when the flag is off") {
    const std::vector<SpanRecord> spans{make_span("self", "1", "1")};
    CHECK(run(GraphExpectation{}, spans).passed);
  }
}

TEST_CASE("All graph checks accumulate", "[validation][graph]") {
  const std::vector<SpanRecord> spans{make_span("root", "s1"), make_span("child", "s2", "s1")};

  GraphExpectation expectation;
  expectation.must_include = {{"root", "missing"}};
  expectation.must_not_cross = {{"root", "child"}};

  const auto result = run(expectation, spans);
  CHECK(result.edges_checked == 2);
  CHECK(result.findings.size() == 2);
}
