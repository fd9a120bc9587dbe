#pragma once

#include "analysis/TimePatternAnalyzer.hpp"
#include "analysis/TrendAnalyzer.hpp"
#include "config/Config.hpp"
#include "types/Diagnostic.hpp"
#include "types/NetworkPerf.hpp"

#include <optional>
#include <string>
#include <vector>

namespace pw::diag {

// Pure: identical inputs give identical diagnostics.
class DiagnosticEngine {
public:
    explicit DiagnosticEngine(config::DiagnosticsConfig cfg = {});

    // source/dest label the diagnostic when there is no current sample.
    [[nodiscard]] types::NetworkDiagnostic diagnose(const std::string& source,
                                                    const std::string& dest,
                                                    const std::optional<types::NetworkPerfSample>& current,
                                                    const std::vector<types::NetworkPerfSample>& history) const;

    [[nodiscard]] std::vector<types::Cause> analyzeCauses(const types::NetworkDiagnostic& diag) const;

private:
    config::DiagnosticsConfig cfg_;
    analysis::TrendAnalyzer trends_;
    analysis::TimePatternAnalyzer patterns_;
};

}
