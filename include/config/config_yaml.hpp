#pragma once

#include "config/Config.hpp"
#include <algorithm>
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace pw::config;

template<>
struct convert<DatabaseConfig> {
    static bool decode(const Node& node, DatabaseConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.host = node["host"].as<std::string>("localhost");
        rhs.port = node["port"].as<uint16_t>(5432);
        rhs.name = node["name"].as<std::string>("pathwatch");
        rhs.user = node["user"].as<std::string>("pathwatch");
        rhs.password_file = node["password_file"].as<std::string>("");
        rhs.pool_size = node["pool_size"].as<unsigned int>(4);
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.pathwatch = spdlog::level::from_str(node["pathwatch"].as<std::string>("info"));
        rhs.exec = spdlog::level::from_str(node["exec"].as<std::string>("warn"));
        rhs.probe = spdlog::level::from_str(node["probe"].as<std::string>("warn"));
        rhs.bench = spdlog::level::from_str(node["bench"].as<std::string>("info"));
        rhs.collector = spdlog::level::from_str(node["collector"].as<std::string>("info"));
        rhs.analysis = spdlog::level::from_str(node["analysis"].as<std::string>("warn"));
        rhs.diag = spdlog::level::from_str(node["diag"].as<std::string>("warn"));
        rhs.db = spdlog::level::from_str(node["db"].as<std::string>("err"));
        rhs.shell = spdlog::level::from_str(node["shell"].as<std::string>("warn"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("debug"));
        if (node["subsystem_levels"]) rhs.subsystem_levels = node["subsystem_levels"].as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("/var/log/pathwatch");
        if (node["log_levels"]) rhs.levels = node["log_levels"].as<LogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<PathConfig> {
    static bool decode(const Node& node, PathConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.source = node["source"].as<std::string>("");
        rhs.dest = node["dest"].as<std::string>("");
        rhs.path_type = pw::types::pathTypeFromString(node["path_type"].as<std::string>("unknown"));
        rhs.user = node["user"].as<std::string>("");
        rhs.identity_file = node["identity_file"].as<std::string>("");
        return true;
    }
};

template<>
struct convert<HealthThresholds> {
    static bool decode(const Node& node, HealthThresholds& rhs) {
        if (!node.IsMap()) return false;
        rhs.max_loss_pct = node["max_loss_pct"].as<double>(1.0);
        rhs.max_latency_ms = node["max_latency_ms"].as<double>(50.0);
        rhs.max_jitter_ms = node["max_jitter_ms"].as<double>(20.0);
        rhs.min_hot_throughput_mbps = node["min_hot_throughput_mbps"].as<double>(100.0);
        rhs.error_loss_pct = node["error_loss_pct"].as<double>(10.0);
        return true;
    }
};

template<>
struct convert<NetworkPerfConfig> {
    static bool decode(const Node& node, NetworkPerfConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.paths.clear();
        if (const auto paths = node["paths"]; paths && paths.IsSequence())
            for (const auto& p : paths) rhs.paths.push_back(p.as<PathConfig>());

        rhs.ping_count = node["ping_count"].as<unsigned int>(10);
        rhs.iperf_duration = node["iperf_duration"].as<unsigned int>(10);
        rhs.full_test = node["full_test"].as<bool>(false);
        rhs.num_files = node["num_files"].as<unsigned int>(3);
        rhs.file_size_mb = node["file_size_mb"].as<unsigned int>(10);
        rhs.work_dir = node["work_dir"].as<std::string>("/tmp");
        rhs.hot_runs = node["hot_runs"].as<unsigned int>(3);
        rhs.hot_run_pause = std::chrono::seconds(node["hot_run_pause_seconds"].as<unsigned int>(5));
        rhs.transfer_timeout = std::chrono::seconds(node["transfer_timeout_seconds"].as<unsigned int>(300));
        rhs.ssh_fallback_size_mb = node["ssh_fallback_size_mb"].as<unsigned int>(50);
        rhs.ssh_connect_timeout = std::chrono::seconds(node["ssh_connect_timeout_seconds"].as<unsigned int>(10));
        rhs.max_parallel_paths = std::max(1u, node["max_parallel_paths"].as<unsigned int>(1));
        if (node["health"]) rhs.health = node["health"].as<HealthThresholds>();
        return true;
    }
};

template<>
struct convert<TrendConfig> {
    static bool decode(const Node& node, TrendConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.window_size = node["window_size"].as<size_t>(168);
        rhs.noise_threshold = node["noise_threshold"].as<double>(0.05);
        rhs.warning_change = node["warning_change"].as<double>(0.20);
        rhs.critical_change = node["critical_change"].as<double>(0.50);
        return true;
    }
};

template<>
struct convert<TimePatternConfig> {
    static bool decode(const Node& node, TimePatternConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.business_start_hour = node["business_start_hour"].as<int>(9);
        rhs.business_end_hour = node["business_end_hour"].as<int>(17);
        rhs.utc = node["utc"].as<bool>(false);
        return true;
    }
};

template<>
struct convert<DiagnosticThresholds> {
    static bool decode(const Node& node, DiagnosticThresholds& rhs) {
        if (!node.IsMap()) return false;
        rhs.loss_high_pct = node["loss_high_pct"].as<double>(5.0);
        rhs.loss_medium_pct = node["loss_medium_pct"].as<double>(1.0);
        rhs.latency_high_ms = node["latency_high_ms"].as<double>(100.0);
        rhs.latency_medium_ms = node["latency_medium_ms"].as<double>(50.0);
        rhs.jitter_high_ms = node["jitter_high_ms"].as<double>(20.0);
        rhs.retrans_high = node["retrans_high"].as<uint64_t>(100);
        rhs.retrans_medium = node["retrans_medium"].as<uint64_t>(10);
        rhs.throughput_low_mbps = node["throughput_low_mbps"].as<double>(100.0);
        rhs.business_drop_high = node["business_drop_high"].as<double>(0.30);
        rhs.business_drop_medium = node["business_drop_medium"].as<double>(0.15);
        return true;
    }
};

template<>
struct convert<DiagnosticsConfig> {
    static bool decode(const Node& node, DiagnosticsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.history_hours = node["history_hours"].as<unsigned int>(168);
        rhs.max_recommendations = node["max_recommendations"].as<size_t>(6);
        if (node["thresholds"]) rhs.thresholds = node["thresholds"].as<DiagnosticThresholds>();
        if (node["trend"]) rhs.trend = node["trend"].as<TrendConfig>();
        if (node["time_patterns"]) rhs.time_patterns = node["time_patterns"].as<TimePatternConfig>();
        return true;
    }
};

template<>
struct convert<ServicesConfig> {
    static bool decode(const Node& node, ServicesConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.collector_interval = std::chrono::minutes(node["collector_interval_minutes"].as<unsigned int>(60));
        rhs.retention_days = node["retention_days"].as<unsigned int>(90);
        rhs.janitor_interval = std::chrono::minutes(node["janitor_interval_minutes"].as<unsigned int>(360));
        return true;
    }
};

}
