#include "spanproof/readiness/span_readiness.h"

#include "spanproof/ingest/span_extractor.h"

namespace spanproof::readiness {

core::Result<std::size_t> wait_for_span(const ReadinessConfig& config, const SpanSource& source,
                                        core::IClock& clock) {
  const auto deadline = clock.now() + config.timeout;
  std::size_t checks = 0;

  while (true) {
    if (clock.now() >= deadline) {
      return core::Result<std::size_t>::err(core::Error::timeout(
          "span '" + config.span_name + "' not detected within " +
          std::to_string(config.timeout.count()) + " ms (" + std::to_string(checks) +
          " checks)"));
    }

    ++checks;
    if (ingest::has_span(ingest::extract_spans(source()), config.span_name)) {
      return core::Result<std::size_t>::ok(checks);
    }
    clock.sleep_for(config.poll_interval);
  }
}

}  // namespace spanproof::readiness
