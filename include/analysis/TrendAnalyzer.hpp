#pragma once

#include "analysis/Sample.hpp"
#include "config/Config.hpp"
#include "types/Diagnostic.hpp"

#include <vector>

namespace pw::analysis {

class TrendAnalyzer {
public:
    explicit TrendAnalyzer(config::TrendConfig cfg = {});

    // Least-squares slope per hour over the most recent window_size usable samples.
    [[nodiscard]] types::TrendReport analyze(std::vector<Sample> samples) const;

private:
    config::TrendConfig cfg_;
};

}
