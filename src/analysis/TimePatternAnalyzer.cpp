#include "analysis/TimePatternAnalyzer.hpp"

using namespace pw::analysis;
using namespace pw::types;

namespace {

struct Bucket {
    double sum{};
    size_t count{};

    void add(const double v) { sum += v; ++count; }
    [[nodiscard]] std::optional<double> mean() const {
        if (count == 0) return std::nullopt;
        return sum / static_cast<double>(count);
    }
};

}

TimePatternAnalyzer::TimePatternAnalyzer(config::TimePatternConfig cfg) : cfg_(cfg) {}

TimePatterns TimePatternAnalyzer::analyze(const std::vector<Sample>& samples) const {
    Bucket weekday, weekend, business, off;

    for (const auto& s : samples) {
        if (!s.usable()) continue;

        std::tm tm{};
        if (cfg_.utc) gmtime_r(&*s.timestamp, &tm);
        else localtime_r(&*s.timestamp, &tm);

        const bool isWeekday = tm.tm_wday >= 1 && tm.tm_wday <= 5;
        const bool isBusiness = isWeekday && tm.tm_hour >= cfg_.business_start_hour && tm.tm_hour < cfg_.business_end_hour;

        (isWeekday ? weekday : weekend).add(*s.value);
        (isBusiness ? business : off).add(*s.value);
    }

    TimePatterns out;
    out.weekday_avg = weekday.mean();
    out.weekend_avg = weekend.mean();
    out.business_hours_avg = business.mean();
    out.off_hours_avg = off.mean();
    out.weekday_count = weekday.count;
    out.weekend_count = weekend.count;
    out.business_hours_count = business.count;
    out.off_hours_count = off.count;
    return out;
}
