#pragma once

#include "types/NetworkPerf.hpp"

#include <ctime>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace pw::types {

enum class CauseKind {
    NoData,
    CollectionFailed,
    HighPacketLoss,
    ElevatedPacketLoss,
    HighLatency,
    ElevatedLatency,
    HighJitter,
    ExcessiveRetransmits,
    ElevatedRetransmits,
    LowThroughput,
    BusinessHoursCongestion,
    MildBusinessHoursImpact,
    DecliningThroughput,
    IncreasingLatency,
    NoIssues
};

enum class Confidence { High, Medium, Low };

std::string to_string(CauseKind kind);
std::string to_string(Confidence confidence);

struct Cause {
    CauseKind kind{CauseKind::NoIssues};
    std::string cause;
    Confidence confidence{Confidence::Low};
    std::string detail;

    bool operator==(const Cause&) const = default;
};

enum class TrendDirection { Increasing, Decreasing, Stable, Unknown };
enum class AlertLevel { Normal, Warning, Critical };

std::string to_string(TrendDirection direction);
std::string to_string(AlertLevel level);

struct TrendReport {
    std::optional<double> current;
    TrendDirection trend{TrendDirection::Unknown};
    double first_derivative{};     // units per hour
    double relative_change{};      // |slope| * span / |mean|
    AlertLevel alert_level{AlertLevel::Normal};
    size_t samples{};
};

struct TimePatterns {
    std::optional<double> weekday_avg, weekend_avg, business_hours_avg, off_hours_avg;
    size_t weekday_count{}, weekend_count{}, business_hours_count{}, off_hours_count{};

    // 1 - business/off; empty unless both buckets are populated
    [[nodiscard]] std::optional<double> businessHoursDrop() const;
};

struct CurrentMetrics {
    std::optional<double> latency_ms;
    std::optional<double> jitter_ms;
    std::optional<double> loss_pct;
    std::optional<double> throughput_mbps;
    std::optional<uint64_t> tcp_retrans;
    bool throughput_estimated{false};
};

struct HistoricalSummary {
    size_t samples_count{};
    std::optional<double> avg_throughput, min_throughput, max_throughput;
};

struct NetworkDiagnostic {
    std::string source_host;
    std::string dest_host;
    PathType path_type{PathType::Unknown};

    std::string current_status{"no_data"};
    std::optional<std::time_t> last_seen;

    CurrentMetrics current;
    HistoricalSummary history;
    TimePatterns time_patterns;
    std::map<std::string, TrendReport> trends;   // "throughput", "latency"

    std::vector<Cause> causes;
    std::vector<std::string> recommendations;

    [[nodiscard]] bool hasData() const { return current_status != "no_data"; }
};

void to_json(nlohmann::json& j, const Cause& c);
void to_json(nlohmann::json& j, const TrendReport& t);
void to_json(nlohmann::json& j, const TimePatterns& t);
void to_json(nlohmann::json& j, const NetworkDiagnostic& d);

}
