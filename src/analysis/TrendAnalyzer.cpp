#include "analysis/TrendAnalyzer.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <cmath>

using namespace pw::analysis;
using namespace pw::types;

TrendAnalyzer::TrendAnalyzer(config::TrendConfig cfg) : cfg_(cfg) {}

TrendReport TrendAnalyzer::analyze(std::vector<Sample> samples) const {
    std::erase_if(samples, [](const Sample& s) { return !s.usable(); });
    std::stable_sort(samples.begin(), samples.end(),
                     [](const Sample& a, const Sample& b) { return *a.timestamp < *b.timestamp; });

    if (cfg_.window_size > 0 && samples.size() > cfg_.window_size)
        samples.erase(samples.begin(), samples.end() - static_cast<std::ptrdiff_t>(cfg_.window_size));

    TrendReport report;
    report.samples = samples.size();
    if (samples.empty()) return report;

    report.current = *samples.back().value;
    if (samples.size() < 2) return report;

    const auto t0 = *samples.front().timestamp;
    const double spanHours = static_cast<double>(*samples.back().timestamp - t0) / 3600.0;
    if (spanHours <= 0.0) return report;

    const auto n = static_cast<double>(samples.size());
    double sumX = 0, sumY = 0, sumXY = 0, sumXX = 0;
    for (const auto& s : samples) {
        const double x = static_cast<double>(*s.timestamp - t0) / 3600.0;
        const double y = *s.value;
        sumX += x;
        sumY += y;
        sumXY += x * y;
        sumXX += x * x;
    }

    const double denom = n * sumXX - sumX * sumX;
    if (denom == 0.0) return report;

    const double slope = (n * sumXY - sumX * sumY) / denom;
    const double mean = sumY / n;

    report.first_derivative = slope;
    report.relative_change = mean != 0.0 ? std::abs(slope) * spanHours / std::abs(mean) : 0.0;

    if (report.relative_change < cfg_.noise_threshold) report.trend = TrendDirection::Stable;
    else report.trend = slope > 0 ? TrendDirection::Increasing : TrendDirection::Decreasing;

    if (report.relative_change >= cfg_.critical_change) report.alert_level = AlertLevel::Critical;
    else if (report.relative_change >= cfg_.warning_change) report.alert_level = AlertLevel::Warning;

    log::Registry::analysis()->debug("[TrendAnalyzer] {} samples over {:.1f}h: slope {:.4f}/h, change {:.3f} -> {}",
                                     samples.size(), spanHours, slope, report.relative_change, to_string(report.trend));
    return report;
}
