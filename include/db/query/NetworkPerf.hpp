#pragma once

#include "types/NetworkPerf.hpp"

#include <cstdint>
#include <ctime>
#include <optional>
#include <string>
#include <vector>

namespace pw::db::query {

struct PathSummary {
    std::string source_host;
    std::string dest_host;
    types::PathType path_type{types::PathType::Unknown};
    uint64_t samples{};
    std::time_t last_seen{};
};

// Append-only access to the network_perf table. Empty source/dest strings match any host.
class NetworkPerf {
public:
    static constexpr const char* SELECT_COLUMNS =
        "id, to_char(timestamp AT TIME ZONE 'UTC', 'YYYY-MM-DD HH24:MI:SS') AS timestamp, "
        "source_host, dest_host, path_type, status, "
        "ping_min_ms, ping_avg_ms, ping_max_ms, ping_mdev_ms, ping_loss_pct, "
        "throughput_mbps, bytes_transferred, tcp_retrans, cold_mbps, write_mbps, throughput_estimated";

    static unsigned int insert(const types::NetworkPerfSample& sample);
    static void insert(const std::vector<types::NetworkPerfRecord>& records);

    static std::optional<types::NetworkPerfSample> getLatest(const std::string& source, const std::string& dest);
    static std::optional<types::NetworkPerfSample> getLatest();

    // Oldest first.
    static std::vector<types::NetworkPerfSample> getHistory(const std::string& source, const std::string& dest, unsigned int hours);
    static std::vector<types::NetworkPerfSample> getHistory(unsigned int hours);

    static std::vector<PathSummary> listPaths();

    // Rows removed.
    static uint64_t purgeOlderThan(unsigned int days);
};

}
