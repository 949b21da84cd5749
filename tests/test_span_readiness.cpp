#include "spanproof/readiness/span_readiness.h"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <string>

using namespace spanproof::readiness;
using spanproof::core::ErrorKind;
using spanproof::core::ManualClock;
using spanproof::core::SystemClock;

namespace {

constexpr const char* kReadySpan =
    R"({"name":"service.ready","trace_id":"t","span_id":"s1"})";

}  // namespace

TEST_CASE("Readiness defaults", "[readiness]") {
  const ReadinessConfig config{"service.ready"};
  CHECK(config.timeout == std::chrono::seconds{30});
  CHECK(config.poll_interval == std::chrono::milliseconds{500});
}

TEST_CASE("Span already present succeeds on the first check", "[readiness]") {
  ManualClock clock;
  const ReadinessConfig config{"service.ready"};

  const auto result = wait_for_span(config, [] { return std::string{kReadySpan}; }, clock);
  REQUIRE(result.has_value());
  CHECK(result.value() == 1);
  CHECK(clock.sleep_count() == 0);
}

TEST_CASE("Span appearing later is found after polling", "[readiness]") {
  ManualClock clock;
  const ReadinessConfig config{"service.ready"};

  int calls = 0;
  const auto source = [&calls] {
    ++calls;
    std::string output = "booting...\n";
    if (calls >= 3) {
      output += kReadySpan;
    }
    return output;
  };

  const auto result = wait_for_span(config, source, clock);
  REQUIRE(result.has_value());
  CHECK(result.value() == 3);
  CHECK(clock.sleep_count() == 2);
}

TEST_CASE("Only an exact span name counts", "[readiness]") {
  ManualClock clock;
  const ReadinessConfig config{"service", std::chrono::milliseconds{1000},
                               std::chrono::milliseconds{500}};

  const auto result = wait_for_span(config, [] { return std::string{kReadySpan}; }, clock);
  REQUIRE_FALSE(result.has_value());
}

TEST_CASE("Deadline is checked at the top of each iteration", "[readiness]") {
  ManualClock clock;
  const ReadinessConfig config{"service.ready", std::chrono::milliseconds{2000},
                               std::chrono::milliseconds{500}};

  int calls = 0;
  const auto result = wait_for_span(
      config,
      [&calls] {
        ++calls;
        return std::string{"still starting"};
      },
      clock);

  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().kind == ErrorKind::kTimeout);
  CHECK(result.error().message.find("service.ready") != std::string::npos);
  CHECK(result.error().message.find("2000 ms") != std::string::npos);
  // Checks at 0, 500, 1000 and 1500 ms; at 2000 ms the deadline has passed.
  CHECK(calls == 4);
  CHECK(clock.sleep_count() == 4);
}

TEST_CASE("Zero timeout performs no check", "[readiness]") {
  ManualClock clock;
  const ReadinessConfig config{"service.ready", std::chrono::milliseconds{0},
                               std::chrono::milliseconds{500}};

  int calls = 0;
  const auto result = wait_for_span(
      config,
      [&calls] {
        ++calls;
        return std::string{kReadySpan};
      },
      clock);

  REQUIRE_FALSE(result.has_value());
  CHECK(calls == 0);
}

TEST_CASE("SystemClock is monotonic and sleeps at least the requested time", "[readiness][clock]") {
  SystemClock clock;
  const auto before = clock.now();
  clock.sleep_for(std::chrono::milliseconds{2});
  const auto after = clock.now();
  CHECK(after - before >= std::chrono::milliseconds{2});
}

TEST_CASE("Time spent reading the source counts against the deadline", "[readiness]") {
  ManualClock clock;
  const ReadinessConfig config{"service.ready", std::chrono::milliseconds{2000},
                               std::chrono::milliseconds{500}};

  int calls = 0;
  const auto slow_source = [&calls, &clock] {
    ++calls;
    clock.advance(std::chrono::milliseconds{1500});
    return std::string{"still starting"};
  };

  const auto result = wait_for_span(config, slow_source, clock);
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().kind == ErrorKind::kTimeout);
  CHECK(result.error().message.find("(1 checks)") != std::string::npos);
  CHECK(calls == 1);
  CHECK(clock.sleep_count() == 1);
}
