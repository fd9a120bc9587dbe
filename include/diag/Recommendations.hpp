#pragma once

#include "types/Diagnostic.hpp"

#include <string>
#include <vector>

namespace pw::diag {

inline constexpr const char* NO_ACTION_RECOMMENDATION = "Network appears healthy - no action required";

[[nodiscard]] const std::vector<std::string>& recommendationsFor(types::CauseKind kind);

// Concatenated per cause, first occurrence kept. Never empty.
[[nodiscard]] std::vector<std::string> recommend(const std::vector<types::Cause>& causes);

}
