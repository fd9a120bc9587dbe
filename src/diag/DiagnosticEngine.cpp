#include "diag/DiagnosticEngine.hpp"
#include "diag/Recommendations.hpp"
#include "log/Registry.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <numeric>

using namespace pw::diag;
using namespace pw::types;
using pw::analysis::Sample;

namespace {

template<typename Getter>
std::vector<Sample> series(const std::vector<NetworkPerfSample>& history, Getter get) {
    std::vector<Sample> out;
    out.reserve(history.size());
    for (const auto& h : history) out.push_back({h.timestamp, get(h)});
    return out;
}

}

DiagnosticEngine::DiagnosticEngine(config::DiagnosticsConfig cfg)
    : cfg_(std::move(cfg)), trends_(cfg_.trend), patterns_(cfg_.time_patterns) {}

NetworkDiagnostic DiagnosticEngine::diagnose(const std::string& source,
                                             const std::string& dest,
                                             const std::optional<NetworkPerfSample>& current,
                                             const std::vector<NetworkPerfSample>& history) const {
    NetworkDiagnostic diag;

    if (current) {
        diag.source_host = current->source_host;
        diag.dest_host = current->dest_host;
        diag.path_type = current->path_type;
        diag.current_status = to_string(current->status);
        diag.last_seen = current->timestamp;

        diag.current.latency_ms = current->ping_avg_ms;
        diag.current.jitter_ms = current->ping_mdev_ms;
        diag.current.loss_pct = current->ping_loss_pct;
        diag.current.throughput_mbps = current->throughput_mbps;
        diag.current.tcp_retrans = current->tcp_retrans;
        diag.current.throughput_estimated = current->throughput_estimated;
    } else {
        diag.source_host = source.empty() ? "unknown" : source;
        diag.dest_host = dest.empty() ? "unknown" : dest;
    }

    std::vector<double> throughputs;
    for (const auto& h : history)
        if (h.throughput_mbps && *h.throughput_mbps != 0.0) throughputs.push_back(*h.throughput_mbps);

    if (!throughputs.empty()) {
        diag.history.samples_count = throughputs.size();
        diag.history.avg_throughput = std::accumulate(throughputs.begin(), throughputs.end(), 0.0)
                                      / static_cast<double>(throughputs.size());
        diag.history.min_throughput = *std::min_element(throughputs.begin(), throughputs.end());
        diag.history.max_throughput = *std::max_element(throughputs.begin(), throughputs.end());
    }

    const auto throughputSeries = series(history, [](const NetworkPerfSample& s) { return s.throughput_mbps; });
    diag.time_patterns = patterns_.analyze(throughputSeries);
    diag.trends["throughput"] = trends_.analyze(throughputSeries);
    diag.trends["latency"] = trends_.analyze(series(history, [](const NetworkPerfSample& s) { return s.ping_avg_ms; }));

    diag.causes = analyzeCauses(diag);
    diag.recommendations = recommend(diag.causes);

    log::Registry::diag()->debug("[DiagnosticEngine] {} -> {}: {} cause(s), {} history row(s)",
                                 diag.source_host, diag.dest_host, diag.causes.size(), history.size());
    return diag;
}

std::vector<Cause> DiagnosticEngine::analyzeCauses(const NetworkDiagnostic& diag) const {
    std::vector<Cause> causes;

    if (!diag.hasData()) {
        causes.push_back({CauseKind::NoData, "No network data available", Confidence::High,
                          "No recent measurements found for this path"});
        return causes;
    }

    const auto& t = cfg_.thresholds;
    const auto& cur = diag.current;

    // error rows from a failed collection carry no ping data
    if (diag.current_status == to_string(PathStatus::Error) && !cur.loss_pct)
        causes.push_back({CauseKind::CollectionFailed, "Measurement Failed", Confidence::High,
                          "Latest collection for this path produced no measurements"});

    const double loss = cur.loss_pct.value_or(0.0);
    if (loss > t.loss_high_pct)
        causes.push_back({CauseKind::HighPacketLoss, "High Packet Loss", Confidence::High,
                          fmt::format("{:.1f}% packet loss - indicates network instability", loss)});
    else if (loss > t.loss_medium_pct)
        causes.push_back({CauseKind::ElevatedPacketLoss, "Elevated Packet Loss", Confidence::Medium,
                          fmt::format("{:.1f}% packet loss - minor network issues", loss)});

    const double latency = cur.latency_ms.value_or(0.0);
    if (latency > t.latency_high_ms)
        causes.push_back({CauseKind::HighLatency, "High Latency", Confidence::High,
                          fmt::format("{:.1f}ms average latency - significantly impacts performance", latency)});
    else if (latency > t.latency_medium_ms)
        causes.push_back({CauseKind::ElevatedLatency, "Elevated Latency", Confidence::Medium,
                          fmt::format("{:.1f}ms average latency", latency)});

    const double jitter = cur.jitter_ms.value_or(0.0);
    if (jitter > t.jitter_high_ms)
        causes.push_back({CauseKind::HighJitter, "High Jitter", Confidence::High,
                          fmt::format("{:.1f}ms jitter - indicates network congestion or instability", jitter)});

    const uint64_t retrans = cur.tcp_retrans.value_or(0);
    if (retrans > t.retrans_high)
        causes.push_back({CauseKind::ExcessiveRetransmits, "Excessive TCP Retransmits", Confidence::High,
                          fmt::format("{} retransmits - significant packet loss or corruption", retrans)});
    else if (retrans > t.retrans_medium)
        causes.push_back({CauseKind::ElevatedRetransmits, "Elevated TCP Retransmits", Confidence::Medium,
                          fmt::format("{} retransmits", retrans)});

    const double throughput = cur.throughput_mbps.value_or(0.0);
    if (throughput > 0.0 && throughput < t.throughput_low_mbps)
        causes.push_back({CauseKind::LowThroughput, "Low Throughput", Confidence::Medium,
                          fmt::format("{:.1f} Mbps - below expected performance{}", throughput,
                                      cur.throughput_estimated ? " (estimated)" : "")});

    if (const auto drop = diag.time_patterns.businessHoursDrop()) {
        const auto& hours = cfg_.time_patterns;
        if (*drop >= t.business_drop_high)
            causes.push_back({CauseKind::BusinessHoursCongestion, "Business Hours Congestion", Confidence::High,
                              fmt::format("{:.0f}% throughput drop during {:02d}:00-{:02d}:00 weekdays",
                                          *drop * 100.0, hours.business_start_hour, hours.business_end_hour)});
        else if (*drop >= t.business_drop_medium)
            causes.push_back({CauseKind::MildBusinessHoursImpact, "Mild Business Hours Impact", Confidence::Medium,
                              fmt::format("{:.0f}% throughput drop during business hours", *drop * 100.0)});
    }

    if (const auto it = diag.trends.find("throughput"); it != diag.trends.end() && it->second.trend == TrendDirection::Decreasing)
        causes.push_back({CauseKind::DecliningThroughput, "Declining Throughput Trend", Confidence::High,
                          fmt::format("Throughput has been decreasing over time ({:+.2f} Mbps/h)", it->second.first_derivative)});

    if (const auto it = diag.trends.find("latency"); it != diag.trends.end() && it->second.trend == TrendDirection::Increasing)
        causes.push_back({CauseKind::IncreasingLatency, "Increasing Latency Trend", Confidence::High,
                          fmt::format("Latency has been increasing over time ({:+.2f} ms/h)", it->second.first_derivative)});

    if (causes.empty())
        causes.push_back({CauseKind::NoIssues, "No obvious issues detected", Confidence::Low, "Network path appears healthy"});

    return causes;
}
