#pragma once

#include "spanproof/domain/span_record.h"
#include "spanproof/validation/expectation_set.h"
#include "spanproof/validation/expectation_validator.h"
#include "spanproof/validation/validation_report.h"

#include <memory>
#include <string_view>
#include <vector>

namespace spanproof::validation {

// ValidationOrchestrator runs every configured layer against one shared span sequence.
//
// Layers always run in the order Span -> Graph -> Counts -> Hermeticity, all of them, even after
// a failure. The first failed layer's first finding becomes ValidationReport::first_failure.
// The orchestrator is immutable after construction; validate() performs no I/O and may be
// called concurrently.
class ValidationOrchestrator {
 public:
  explicit ValidationOrchestrator(ExpectationSet expectations);

  [[nodiscard]] ValidationReport validate(const std::vector<domain::SpanRecord>& spans) const;

  // validate_text runs the span extractor first; skipped lines do not affect the verdict.
  [[nodiscard]] ValidationReport validate_text(std::string_view text) const;

  [[nodiscard]] const std::vector<std::unique_ptr<ExpectationValidator>>& validators() const {
    return validators_;
  }

 private:
  std::vector<std::unique_ptr<ExpectationValidator>> validators_;
};

}  // namespace spanproof::validation
