#pragma once

#include "spanproof/core/clock.h"
#include "spanproof/core/result.h"

#include <chrono>
#include <cstddef>
#include <functional>
#include <string>

namespace spanproof::readiness {

inline constexpr std::chrono::seconds kDefaultSpanWaitTimeout{30};
inline constexpr std::chrono::milliseconds kSpanPollInterval{500};

struct ReadinessConfig {
  std::string span_name;
  std::chrono::milliseconds timeout{kDefaultSpanWaitTimeout};
  std::chrono::milliseconds poll_interval{kSpanPollInterval};
};

// SpanSource returns everything the service has written so far.
using SpanSource = std::function<std::string()>;

// wait_for_span polls `source` until it contains a span named exactly config.span_name.
//
// The deadline is checked at the top of every iteration, never during a sleep, so a zero
// timeout performs no check at all. Each check runs the span extractor over the full text.
// Returns the number of checks performed, or a kTimeout error once the deadline has passed.
[[nodiscard]] core::Result<std::size_t> wait_for_span(const ReadinessConfig& config,
                                                      const SpanSource& source,
                                                      core::IClock& clock);

}  // namespace spanproof::readiness
