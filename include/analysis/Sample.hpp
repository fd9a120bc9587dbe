#pragma once

#include <ctime>
#include <optional>

namespace pw::analysis {

// Missing timestamps and missing or zero values are skipped by every analyzer.
struct Sample {
    std::optional<std::time_t> timestamp;
    std::optional<double> value;

    [[nodiscard]] bool usable() const { return timestamp && value && *value != 0.0; }
};

}
