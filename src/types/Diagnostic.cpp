#include "types/Diagnostic.hpp"
#include "util/timestamp.hpp"

#include <nlohmann/json.hpp>

using namespace pw::types;

namespace {

template<typename T>
nlohmann::json nullable(const std::optional<T>& v) {
    return v ? nlohmann::json(*v) : nlohmann::json(nullptr);
}

}

std::string pw::types::to_string(const CauseKind kind) {
    switch (kind) {
        case CauseKind::NoData: return "no_data";
        case CauseKind::CollectionFailed: return "collection_failed";
        case CauseKind::HighPacketLoss: return "high_packet_loss";
        case CauseKind::ElevatedPacketLoss: return "elevated_packet_loss";
        case CauseKind::HighLatency: return "high_latency";
        case CauseKind::ElevatedLatency: return "elevated_latency";
        case CauseKind::HighJitter: return "high_jitter";
        case CauseKind::ExcessiveRetransmits: return "excessive_retransmits";
        case CauseKind::ElevatedRetransmits: return "elevated_retransmits";
        case CauseKind::LowThroughput: return "low_throughput";
        case CauseKind::BusinessHoursCongestion: return "business_hours_congestion";
        case CauseKind::MildBusinessHoursImpact: return "mild_business_hours_impact";
        case CauseKind::DecliningThroughput: return "declining_throughput";
        case CauseKind::IncreasingLatency: return "increasing_latency";
        case CauseKind::NoIssues: return "no_issues";
    }
    return "unknown";
}

std::string pw::types::to_string(const Confidence confidence) {
    switch (confidence) {
        case Confidence::High: return "high";
        case Confidence::Medium: return "medium";
        default: return "low";
    }
}

std::string pw::types::to_string(const TrendDirection direction) {
    switch (direction) {
        case TrendDirection::Increasing: return "increasing";
        case TrendDirection::Decreasing: return "decreasing";
        case TrendDirection::Stable: return "stable";
        default: return "unknown";
    }
}

std::string pw::types::to_string(const AlertLevel level) {
    switch (level) {
        case AlertLevel::Warning: return "warning";
        case AlertLevel::Critical: return "critical";
        default: return "normal";
    }
}

std::optional<double> TimePatterns::businessHoursDrop() const {
    if (!business_hours_avg || !off_hours_avg || *off_hours_avg <= 0.0) return std::nullopt;
    return 1.0 - *business_hours_avg / *off_hours_avg;
}

void pw::types::to_json(nlohmann::json& j, const Cause& c) {
    j = {
        {"kind", to_string(c.kind)},
        {"cause", c.cause},
        {"confidence", to_string(c.confidence)},
        {"detail", c.detail}
    };
}

void pw::types::to_json(nlohmann::json& j, const TrendReport& t) {
    j = {
        {"current", nullable(t.current)},
        {"trend", to_string(t.trend)},
        {"first_derivative", t.first_derivative},
        {"relative_change", t.relative_change},
        {"alert_level", to_string(t.alert_level)},
        {"samples", t.samples}
    };
}

void pw::types::to_json(nlohmann::json& j, const TimePatterns& t) {
    j = {
        {"weekday_avg", nullable(t.weekday_avg)},
        {"weekend_avg", nullable(t.weekend_avg)},
        {"business_hours_avg", nullable(t.business_hours_avg)},
        {"off_hours_avg", nullable(t.off_hours_avg)},
        {"weekday_count", t.weekday_count},
        {"weekend_count", t.weekend_count},
        {"business_hours_count", t.business_hours_count},
        {"off_hours_count", t.off_hours_count}
    };
}

void pw::types::to_json(nlohmann::json& j, const NetworkDiagnostic& d) {
    nlohmann::json trends = nlohmann::json::object();
    for (const auto& [metric, report] : d.trends) trends[metric] = report;

    j = {
        {"source_host", d.source_host},
        {"dest_host", d.dest_host},
        {"path_type", to_string(d.path_type)},
        {"current_status", d.current_status},
        {"last_seen", d.last_seen ? nlohmann::json(util::timestampToString(*d.last_seen)) : nlohmann::json(nullptr)},
        {"current", {
            {"latency_ms", nullable(d.current.latency_ms)},
            {"jitter_ms", nullable(d.current.jitter_ms)},
            {"loss_pct", nullable(d.current.loss_pct)},
            {"throughput_mbps", nullable(d.current.throughput_mbps)},
            {"tcp_retrans", nullable(d.current.tcp_retrans)},
            {"throughput_estimated", d.current.throughput_estimated}
        }},
        {"history", {
            {"samples_count", d.history.samples_count},
            {"avg_throughput", nullable(d.history.avg_throughput)},
            {"min_throughput", nullable(d.history.min_throughput)},
            {"max_throughput", nullable(d.history.max_throughput)}
        }},
        {"time_patterns", d.time_patterns},
        {"trends", trends},
        {"causes", d.causes},
        {"recommendations", d.recommendations}
    };
}
