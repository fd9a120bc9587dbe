#include "types/NetworkPerf.hpp"
#include "config/Config.hpp"
#include "util/timestamp.hpp"

#include <nlohmann/json.hpp>
#include <pqxx/row>
#include <pqxx/params>

#include <stdexcept>

using namespace pw::types;

namespace {

template<typename T>
std::optional<T> optionalField(const pqxx::row& row, const char* column) {
    const auto field = row[column];
    if (field.is_null()) return std::nullopt;
    return field.as<T>();
}

template<typename T>
nlohmann::json nullable(const std::optional<T>& v) {
    return v ? nlohmann::json(*v) : nlohmann::json(nullptr);
}

}

std::string pw::types::to_string(const PathType type) {
    switch (type) {
        case PathType::Direct: return "direct";
        case PathType::Switch: return "switch";
        case PathType::Nfs: return "nfs";
        default: return "unknown";
    }
}

PathType pw::types::pathTypeFromString(const std::string& str) {
    if (str == "direct") return PathType::Direct;
    if (str == "switch") return PathType::Switch;
    if (str == "nfs") return PathType::Nfs;
    if (str == "unknown" || str.empty()) return PathType::Unknown;
    throw std::invalid_argument("Invalid PathType: " + str);
}

std::string pw::types::to_string(const PathStatus status) {
    switch (status) {
        case PathStatus::Healthy: return "healthy";
        case PathStatus::Degraded: return "degraded";
        case PathStatus::Error: return "error";
        default: return "unknown";
    }
}

PathStatus pw::types::pathStatusFromString(const std::string& str) {
    if (str == "healthy") return PathStatus::Healthy;
    if (str == "degraded") return PathStatus::Degraded;
    if (str == "error") return PathStatus::Error;
    if (str == "unknown" || str.empty()) return PathStatus::Unknown;
    throw std::invalid_argument("Invalid PathStatus: " + str);
}

PingStats PingStats::failed() {
    PingStats p;
    p.loss_pct = 100.0;
    return p;
}

double pw::types::rateMbps(const uint64_t bytes, const double seconds) {
    if (seconds <= 0.0) return 0.0;
    return static_cast<double>(bytes) * 8.0 / seconds / 1e6;
}

NetworkPerfRecord NetworkPerfRecord::errorRecord(std::string source, std::string dest, const PathType type, const std::time_t ts) {
    NetworkPerfRecord r;
    r.source_host = std::move(source);
    r.dest_host = std::move(dest);
    r.path_type = type;
    r.timestamp = ts;
    r.status = PathStatus::Error;
    return r;
}

const std::optional<ThroughputStats>& NetworkPerfRecord::representativeThroughput() const {
    return hot ? hot : cold;
}

bool pw::types::isHealthy(const NetworkPerfRecord& record, const config::HealthThresholds& limits) {
    if (!record.ping) return false;
    const auto& p = *record.ping;
    if (p.loss_pct > limits.max_loss_pct) return false;
    if (p.avg_ms > limits.max_latency_ms) return false;
    if (p.mdev_ms > limits.max_jitter_ms) return false;
    if (record.hot && record.hot->rate_mbps < limits.min_hot_throughput_mbps) return false;
    return true;
}

PathStatus pw::types::deriveStatus(const NetworkPerfRecord& record, const config::HealthThresholds& limits) {
    if (isHealthy(record, limits)) return PathStatus::Healthy;
    if (record.ping && record.ping->loss_pct < limits.error_loss_pct) return PathStatus::Degraded;
    return PathStatus::Error;
}

NetworkPerfSample::NetworkPerfSample(const NetworkPerfRecord& record)
    : timestamp(record.timestamp),
      source_host(record.source_host),
      dest_host(record.dest_host),
      path_type(record.path_type),
      status(record.status) {
    if (record.ping) {
        ping_min_ms = record.ping->min_ms;
        ping_avg_ms = record.ping->avg_ms;
        ping_max_ms = record.ping->max_ms;
        ping_mdev_ms = record.ping->mdev_ms;
        ping_loss_pct = record.ping->loss_pct;
    }

    if (const auto& rep = record.representativeThroughput()) {
        throughput_mbps = rep->rate_mbps;
        bytes_transferred = rep->bytes_transferred;
        tcp_retrans = rep->tcp_retrans;
        throughput_estimated = rep->estimated;
    }

    if (record.cold) cold_mbps = record.cold->rate_mbps;
    if (record.write) write_mbps = record.write->rate_mbps;
}

NetworkPerfSample::NetworkPerfSample(const pqxx::row& row)
    : id(row["id"].as<unsigned int>()),
      timestamp(util::parsePostgresTimestamp(row["timestamp"].c_str())),
      source_host(row["source_host"].as<std::string>()),
      dest_host(row["dest_host"].as<std::string>()),
      path_type(pathTypeFromString(row["path_type"].is_null() ? "" : row["path_type"].as<std::string>())),
      status(pathStatusFromString(row["status"].is_null() ? "" : row["status"].as<std::string>())),
      ping_min_ms(optionalField<double>(row, "ping_min_ms")),
      ping_avg_ms(optionalField<double>(row, "ping_avg_ms")),
      ping_max_ms(optionalField<double>(row, "ping_max_ms")),
      ping_mdev_ms(optionalField<double>(row, "ping_mdev_ms")),
      ping_loss_pct(optionalField<double>(row, "ping_loss_pct")),
      throughput_mbps(optionalField<double>(row, "throughput_mbps")),
      bytes_transferred(optionalField<uint64_t>(row, "bytes_transferred")),
      tcp_retrans(optionalField<uint64_t>(row, "tcp_retrans")),
      cold_mbps(optionalField<double>(row, "cold_mbps")),
      write_mbps(optionalField<double>(row, "write_mbps")),
      throughput_estimated(row["throughput_estimated"].as<bool>(false)) {}

pqxx::params NetworkPerfSample::getParams() const {
    return pqxx::params{
        static_cast<int64_t>(timestamp),
        source_host,
        dest_host,
        to_string(path_type),
        to_string(status),
        ping_min_ms,
        ping_avg_ms,
        ping_max_ms,
        ping_mdev_ms,
        ping_loss_pct,
        throughput_mbps,
        bytes_transferred ? std::optional<int64_t>(static_cast<int64_t>(*bytes_transferred)) : std::nullopt,
        tcp_retrans ? std::optional<int64_t>(static_cast<int64_t>(*tcp_retrans)) : std::nullopt,
        cold_mbps,
        write_mbps,
        throughput_estimated
    };
}

void pw::types::to_json(nlohmann::json& j, const PingStats& p) {
    j = {
        {"min_ms", p.min_ms},
        {"avg_ms", p.avg_ms},
        {"max_ms", p.max_ms},
        {"mdev_ms", p.mdev_ms},
        {"loss_pct", p.loss_pct}
    };
}

void pw::types::to_json(nlohmann::json& j, const ThroughputStats& t) {
    j = {
        {"bytes_transferred", t.bytes_transferred},
        {"rate_mbps", t.rate_mbps},
        {"duration_sec", t.duration_sec},
        {"tcp_retrans", t.tcp_retrans},
        {"estimated", t.estimated}
    };
}

void pw::types::to_json(nlohmann::json& j, const NetworkPerfRecord& r) {
    j = {
        {"source_host", r.source_host},
        {"dest_host", r.dest_host},
        {"path_type", to_string(r.path_type)},
        {"timestamp", util::timestampToString(r.timestamp)},
        {"ping", nullable(r.ping)},
        {"throughput_cold", nullable(r.cold)},
        {"throughput_hot", nullable(r.hot)},
        {"throughput_write", nullable(r.write)},
        {"status", to_string(r.status)}
    };
}

void pw::types::to_json(nlohmann::json& j, const NetworkPerfSample& s) {
    j = {
        {"id", s.id},
        {"timestamp", util::timestampToString(s.timestamp)},
        {"source_host", s.source_host},
        {"dest_host", s.dest_host},
        {"path_type", to_string(s.path_type)},
        {"status", to_string(s.status)},
        {"ping_min_ms", nullable(s.ping_min_ms)},
        {"ping_avg_ms", nullable(s.ping_avg_ms)},
        {"ping_max_ms", nullable(s.ping_max_ms)},
        {"ping_mdev_ms", nullable(s.ping_mdev_ms)},
        {"ping_loss_pct", nullable(s.ping_loss_pct)},
        {"throughput_mbps", nullable(s.throughput_mbps)},
        {"bytes_transferred", nullable(s.bytes_transferred)},
        {"tcp_retrans", nullable(s.tcp_retrans)},
        {"cold_mbps", nullable(s.cold_mbps)},
        {"write_mbps", nullable(s.write_mbps)},
        {"throughput_estimated", s.throughput_estimated}
    };
}

void pw::types::to_json(nlohmann::json& j, const std::vector<NetworkPerfSample>& samples) {
    j = nlohmann::json::array();
    for (const auto& s : samples) j.push_back(s);
}
