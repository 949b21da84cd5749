#pragma once

#include "spanproof/core/result.h"
#include "spanproof/validation/expectation_set.h"

#include <nlohmann/json.hpp>

#include <string_view>

namespace spanproof::validation {

// Rule-set documents look like
//
//   {"expect": {"span": [...], "graph": {...}, "counts": {...}, "hermeticity": {...}}}
//
// Every section is optional, and the outer "expect" wrapper may be omitted. Unknown keys inside
// the expect object are rejected so that a misspelt section cannot silently switch a layer off.
// Errors are kConfiguration and name the offending JSON path, e.g. "expect.span[1].kind".
[[nodiscard]] core::Result<ExpectationSet> load_expectation_set(const nlohmann::json& document);

// Parses the text first; a JSON syntax error is a kConfiguration error as well.
[[nodiscard]] core::Result<ExpectationSet> load_expectation_set_text(std::string_view text);

// Writes {"expect": {...}} with only the configured sections; loading it gives back an equal set.
[[nodiscard]] nlohmann::json expectation_set_to_json(const ExpectationSet& expectations);

}  // namespace spanproof::validation
