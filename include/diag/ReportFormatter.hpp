#pragma once

#include "types/Diagnostic.hpp"

#include <string>

namespace pw::diag {

class ReportFormatter {
public:
    explicit ReportFormatter(bool color = true, size_t maxRecommendations = 6);

    // Multi-section terminal report.
    [[nodiscard]] std::string format(const types::NetworkDiagnostic& diag) const;

    [[nodiscard]] static std::string toJson(const types::NetworkDiagnostic& diag, int indent = 2);

private:
    bool color_;
    size_t maxRecommendations_;

    [[nodiscard]] std::string paint(const char* code, const std::string& text) const;
    [[nodiscard]] std::string bold(const std::string& text) const;
};

}
