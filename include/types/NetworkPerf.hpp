#pragma once

#include <cstdint>
#include <ctime>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace pqxx {
class row;
class params;
}

namespace pw::config { struct HealthThresholds; }

namespace pw::types {

enum class PathType { Direct, Switch, Nfs, Unknown };

std::string to_string(PathType type);
PathType pathTypeFromString(const std::string& str);

enum class PathStatus { Healthy, Degraded, Error, Unknown };

std::string to_string(PathStatus status);
PathStatus pathStatusFromString(const std::string& str);

struct PingStats {
    double min_ms{};
    double avg_ms{};
    double max_ms{};
    double mdev_ms{};   // jitter
    double loss_pct{};

    // Probe could not run at all: fully degraded, every other field left at zero.
    static PingStats failed();
};

struct ThroughputStats {
    uint64_t bytes_transferred{};
    double rate_mbps{};
    double duration_sec{};
    uint64_t tcp_retrans{};
    bool estimated{false};  // duration assumed, not timed
};

// bits per second over wall time, in megabits; zero for non-positive durations
double rateMbps(uint64_t bytes, double seconds);

struct NetworkPerfRecord {
    std::string source_host;
    std::string dest_host;
    PathType path_type{PathType::Unknown};
    std::time_t timestamp{};

    std::optional<PingStats> ping;

    std::optional<ThroughputStats> cold;   // cold cache
    std::optional<ThroughputStats> hot;    // hot cache, averaged over runs
    std::optional<ThroughputStats> write;  // true write

    PathStatus status{PathStatus::Unknown};

    // Identity and timestamp only, for a path whose collection threw.
    static NetworkPerfRecord errorRecord(std::string source, std::string dest, PathType type, std::time_t ts);

    // hot if present, else cold
    [[nodiscard]] const std::optional<ThroughputStats>& representativeThroughput() const;
};

[[nodiscard]] bool isHealthy(const NetworkPerfRecord& record, const config::HealthThresholds& limits);
[[nodiscard]] PathStatus deriveStatus(const NetworkPerfRecord& record, const config::HealthThresholds& limits);

// One persisted row of the network_perf table.
struct NetworkPerfSample {
    unsigned int id{};
    std::time_t timestamp{};
    std::string source_host;
    std::string dest_host;
    PathType path_type{PathType::Unknown};
    PathStatus status{PathStatus::Unknown};

    std::optional<double> ping_min_ms, ping_avg_ms, ping_max_ms, ping_mdev_ms, ping_loss_pct;

    std::optional<double> throughput_mbps;
    std::optional<uint64_t> bytes_transferred;
    std::optional<uint64_t> tcp_retrans;

    std::optional<double> cold_mbps;
    std::optional<double> write_mbps;
    bool throughput_estimated{false};

    NetworkPerfSample() = default;
    explicit NetworkPerfSample(const NetworkPerfRecord& record);
    explicit NetworkPerfSample(const pqxx::row& row);

    [[nodiscard]] pqxx::params getParams() const;
};

void to_json(nlohmann::json& j, const PingStats& p);
void to_json(nlohmann::json& j, const ThroughputStats& t);
void to_json(nlohmann::json& j, const NetworkPerfRecord& r);
void to_json(nlohmann::json& j, const NetworkPerfSample& s);
void to_json(nlohmann::json& j, const std::vector<NetworkPerfSample>& samples);

}
