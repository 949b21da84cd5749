#pragma once

#include "spanproof/domain/span_record.h"
#include "spanproof/validation/count_expectation.h"
#include "spanproof/validation/finding.h"
#include "spanproof/validation/graph_expectation.h"
#include "spanproof/validation/hermeticity_expectation.h"
#include "spanproof/validation/span_expectation.h"
#include "spanproof/validation/span_index.h"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace spanproof::validation {

// Declaration order is the evaluation order of the orchestrator.
enum class ValidatorKind {
  kSpan,
  kGraph,
  kCounts,
  kHermeticity,
};

// "span", "graph", "counts", "hermeticity".
[[nodiscard]] std::string_view validator_kind_to_string(ValidatorKind kind) noexcept;

// ValidatorResult is the uniform per-layer outcome stored in a ValidationReport.
struct ValidatorResult {
  ValidatorKind kind{ValidatorKind::kSpan};
  std::string validator_name;
  bool passed{true};
  std::vector<Finding> findings;
  std::size_t items_checked{0};                  // units examined by the layer
  std::optional<ActualCounts> actual_counts;     // counts layer only
  std::vector<HermeticityViolation> violations;  // hermeticity layer only
};

// ExpectationValidator is the abstract base class for one validation layer.
// Implementations are stateless after construction; Validate() never fails. A rule that
// cannot be evaluated becomes a failed result with a single config_error finding.
class ExpectationValidator {
 public:
  virtual ~ExpectationValidator() = default;

  [[nodiscard]] virtual ValidatorKind kind() const noexcept = 0;
  [[nodiscard]] std::string_view validator_name() const noexcept {
    return validator_kind_to_string(kind());
  }

  [[nodiscard]] virtual ValidatorResult Validate(const std::vector<domain::SpanRecord>& spans,
                                                 const SpanIndex& index) const = 0;

 protected:
  ExpectationValidator() = default;
  ExpectationValidator(const ExpectationValidator&) = default;
  ExpectationValidator& operator=(const ExpectationValidator&) = default;
  ExpectationValidator(ExpectationValidator&&) = default;
  ExpectationValidator& operator=(ExpectationValidator&&) = default;
};

class SpanRulesValidator final : public ExpectationValidator {
 public:
  explicit SpanRulesValidator(std::vector<SpanExpectation> expectations);

  [[nodiscard]] ValidatorKind kind() const noexcept override { return ValidatorKind::kSpan; }
  [[nodiscard]] ValidatorResult Validate(const std::vector<domain::SpanRecord>& spans,
                                         const SpanIndex& index) const override;

 private:
  std::vector<SpanExpectation> expectations_;
};

class GraphRulesValidator final : public ExpectationValidator {
 public:
  explicit GraphRulesValidator(GraphExpectation expectation);

  [[nodiscard]] ValidatorKind kind() const noexcept override { return ValidatorKind::kGraph; }
  [[nodiscard]] ValidatorResult Validate(const std::vector<domain::SpanRecord>& spans,
                                         const SpanIndex& index) const override;

 private:
  GraphExpectation expectation_;
};

class CountRulesValidator final : public ExpectationValidator {
 public:
  explicit CountRulesValidator(CountExpectation expectation);

  [[nodiscard]] ValidatorKind kind() const noexcept override { return ValidatorKind::kCounts; }
  [[nodiscard]] ValidatorResult Validate(const std::vector<domain::SpanRecord>& spans,
                                         const SpanIndex& index) const override;

 private:
  CountExpectation expectation_;
};

class HermeticityRulesValidator final : public ExpectationValidator {
 public:
  explicit HermeticityRulesValidator(HermeticityExpectation expectation);

  [[nodiscard]] ValidatorKind kind() const noexcept override {
    return ValidatorKind::kHermeticity;
  }
  [[nodiscard]] ValidatorResult Validate(const std::vector<domain::SpanRecord>& spans,
                                         const SpanIndex& index) const override;

 private:
  HermeticityExpectation expectation_;
};

}  // namespace spanproof::validation
