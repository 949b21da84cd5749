#pragma once

namespace spanproof::core {

// kBuildVersion is written into every report as engine_version, so stored reports can be
// matched to the rule semantics that produced them.
constexpr const char* kBuildVersion = "0.3";

}  // namespace spanproof::core
