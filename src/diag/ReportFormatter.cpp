#include "diag/ReportFormatter.hpp"
#include "util/timestamp.hpp"

#include <fmt/core.h>
#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>

using namespace pw::diag;
using namespace pw::types;

namespace {

namespace ansi {
constexpr const char* RESET = "\033[0m";
constexpr const char* BOLD = "\033[1m";
constexpr const char* RED = "\033[91m";
constexpr const char* GREEN = "\033[92m";
constexpr const char* YELLOW = "\033[93m";
constexpr const char* CYAN = "\033[96m";
constexpr const char* GRAY = "\033[90m";
}

const std::string RULE = [] {
    std::string s = "  ";
    for (int i = 0; i < 56; ++i) s += "─";
    return s;
}();

std::string capitalize(std::string s) {
    if (!s.empty()) s[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(s[0])));
    return s;
}

}

ReportFormatter::ReportFormatter(const bool color, const size_t maxRecommendations)
    : color_(color), maxRecommendations_(maxRecommendations) {}

std::string ReportFormatter::paint(const char* code, const std::string& text) const {
    if (!color_) return text;
    return std::string(code) + text + ansi::RESET;
}

std::string ReportFormatter::bold(const std::string& text) const { return paint(ansi::BOLD, text); }

std::string ReportFormatter::format(const NetworkDiagnostic& diag) const {
    std::string out;
    const auto line = [&out](const std::string& s) { out += s; out += '\n'; };
    const auto section = [&](const std::string& title, const std::string& suffix = {}) {
        line("");
        line("  " + bold(title) + suffix);
        line(RULE);
    };

    line("");
    line(fmt::format("  {} — {}", bold("Network Diagnostic"),
                     paint(ansi::CYAN, diag.source_host + " → " + diag.dest_host)));
    line("  Path type: " + to_string(diag.path_type));
    line(RULE);

    const auto* statusColor = diag.current_status == "healthy" ? ansi::GREEN
                            : diag.current_status == "degraded" ? ansi::YELLOW : ansi::RED;
    line("");
    line("  " + bold("Status:") + " " + paint(statusColor, diag.current_status));
    if (diag.last_seen) line("  " + bold("Last Test:") + " " + util::formatLocal(*diag.last_seen));

    section("Current Metrics");
    const auto& cur = diag.current;
    const double latency = cur.latency_ms.value_or(0.0);
    const auto* latColor = latency > 50 ? ansi::RED : latency > 20 ? ansi::YELLOW : ansi::GREEN;
    line(fmt::format("    Latency:      {} (jitter: {:.1f} ms)",
                     paint(latColor, fmt::format("{:.1f} ms", latency)), cur.jitter_ms.value_or(0.0)));

    const double loss = cur.loss_pct.value_or(0.0);
    line("    Packet Loss:  " + paint(loss > 1 ? ansi::RED : ansi::GREEN, fmt::format("{:.1f}%", loss)));

    if (const double tp = cur.throughput_mbps.value_or(0.0); tp != 0.0) {
        const auto* tpColor = tp > 500 ? ansi::GREEN : tp > 100 ? ansi::YELLOW : ansi::RED;
        line("    Throughput:   " + paint(tpColor, fmt::format("{:.1f} Mbps", tp))
             + (cur.throughput_estimated ? paint(ansi::GRAY, " (estimated)") : ""));
    }

    if (const uint64_t retrans = cur.tcp_retrans.value_or(0); retrans != 0) {
        const auto* retColor = retrans > 50 ? ansi::RED : retrans > 10 ? ansi::YELLOW : ansi::GREEN;
        line("    Retransmits:  " + paint(retColor, std::to_string(retrans)));
    }

    if (diag.history.samples_count > 0) {
        section("Historical Summary", fmt::format(" ({} samples)", diag.history.samples_count));
        line(fmt::format("    Avg Throughput:  {:.1f} Mbps", diag.history.avg_throughput.value_or(0.0)));
        line(fmt::format("    Min/Max:         {:.1f} / {:.1f} Mbps",
                         diag.history.min_throughput.value_or(0.0), diag.history.max_throughput.value_or(0.0)));
    }

    const auto& tp = diag.time_patterns;
    if (tp.business_hours_avg || tp.off_hours_avg) {
        section("Time-based Analysis");

        if (tp.weekday_avg && tp.weekend_avg) {
            line(fmt::format("    Weekday Avg:      {:.1f} Mbps", *tp.weekday_avg));
            line(fmt::format("    Weekend Avg:      {:.1f} Mbps", *tp.weekend_avg));
        }

        if (tp.business_hours_avg && tp.off_hours_avg) {
            const double biz = *tp.business_hours_avg;
            const double off = *tp.off_hours_avg;
            const double diffPct = off > 0 ? (off - biz) / off * 100.0 : 0.0;

            const auto* bizColor = diffPct > 20 ? ansi::RED : diffPct > 10 ? ansi::YELLOW : ansi::GREEN;
            line("    Business Hours:   " + paint(bizColor, fmt::format("{:.1f} Mbps", biz)));
            line(fmt::format("    Off Hours:        {:.1f} Mbps", off));
            if (diffPct > 5)
                line("    " + paint(ansi::YELLOW, fmt::format("↓ {:.0f}% drop during business hours", diffPct)));
        }
    }

    if (!diag.trends.empty()) {
        section("Trends");
        for (const auto& [name, trend] : diag.trends) {
            // latency reads inversely
            const bool rising = trend.trend == TrendDirection::Increasing;
            const bool falling = trend.trend == TrendDirection::Decreasing;
            const bool bad = name == "latency" ? rising : falling;
            const bool good = name == "latency" ? falling : rising;
            const auto* color = bad ? ansi::RED : good ? ansi::GREEN : ansi::GRAY;
            auto text = to_string(trend.trend);
            if (trend.trend != TrendDirection::Unknown)
                text += fmt::format(" ({:+.2f} {}/h, {})", trend.first_derivative,
                                    name == "latency" ? "ms" : "Mbps", to_string(trend.alert_level));
            line(fmt::format("    {:<12} {}", capitalize(name), paint(color, text)));
        }
    }

    section("Potential Causes");
    for (const auto& cause : diag.causes) {
        const auto* confColor = cause.confidence == Confidence::High ? ansi::RED
                              : cause.confidence == Confidence::Medium ? ansi::YELLOW : ansi::GRAY;
        auto conf = to_string(cause.confidence);
        for (auto& c : conf) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        line("    " + paint(confColor, "[" + conf + "]") + " " + cause.cause);
        line("           " + paint(ansi::GRAY, cause.detail));
    }

    section("Recommendations");
    const auto shown = std::min(maxRecommendations_, diag.recommendations.size());
    for (size_t i = 0; i < shown; ++i)
        line("    " + paint(ansi::CYAN, "→") + " " + diag.recommendations[i]);

    return out;
}

std::string ReportFormatter::toJson(const NetworkDiagnostic& diag, const int indent) {
    return nlohmann::json(diag).dump(indent);
}
