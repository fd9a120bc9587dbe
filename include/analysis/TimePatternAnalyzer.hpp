#pragma once

#include "analysis/Sample.hpp"
#include "config/Config.hpp"
#include "types/Diagnostic.hpp"

#include <vector>

namespace pw::analysis {

// Weekday/weekend and business/off-hours buckets. Business hours exist only on weekdays.
class TimePatternAnalyzer {
public:
    explicit TimePatternAnalyzer(config::TimePatternConfig cfg = {});

    [[nodiscard]] types::TimePatterns analyze(const std::vector<Sample>& samples) const;

private:
    config::TimePatternConfig cfg_;
};

}
