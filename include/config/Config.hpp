#pragma once

#include "types/NetworkPerf.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

namespace pw::config {

struct DatabaseConfig {
    std::string host = "localhost";
    uint16_t port = 5432;
    std::string name = "pathwatch";
    std::string user = "pathwatch";
    std::filesystem::path password_file{};   // empty: rely on .pgpass / trust auth
    unsigned int pool_size = 4;
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum pathwatch = spdlog::level::info;   // startup, shutdown, cycle summaries
    spdlog::level::level_enum exec      = spdlog::level::warn;   // every spawned command at debug
    spdlog::level::level_enum probe     = spdlog::level::warn;
    spdlog::level::level_enum bench     = spdlog::level::info;   // phase timings
    spdlog::level::level_enum collector = spdlog::level::info;
    spdlog::level::level_enum analysis  = spdlog::level::warn;
    spdlog::level::level_enum diag      = spdlog::level::warn;
    spdlog::level::level_enum db        = spdlog::level::err;    // only failed transactions
    spdlog::level::level_enum shell     = spdlog::level::warn;
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::debug;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir = "/var/log/pathwatch";
    LogLevelsConfig levels;
};

struct PathConfig {
    std::string source{};          // empty: local hostname
    std::string dest{};
    types::PathType path_type = types::PathType::Unknown;
    std::string user{};
    std::string identity_file{};
};

// A path is healthy only while every limit holds; see types::deriveStatus().
struct HealthThresholds {
    double max_loss_pct = 1.0;
    double max_latency_ms = 50.0;
    double max_jitter_ms = 20.0;
    double min_hot_throughput_mbps = 100.0;
    double error_loss_pct = 10.0;              // at or above this an unhealthy path is an error
};

struct NetworkPerfConfig {
    std::vector<PathConfig> paths;
    unsigned int ping_count = 10;
    unsigned int iperf_duration = 10;          // seconds
    bool full_test = false;
    unsigned int num_files = 3;
    unsigned int file_size_mb = 10;
    std::filesystem::path work_dir = "/tmp";
    unsigned int hot_runs = 3;
    std::chrono::seconds hot_run_pause{5};
    std::chrono::seconds transfer_timeout{300};
    unsigned int ssh_fallback_size_mb = 50;
    std::chrono::seconds ssh_connect_timeout{10};
    unsigned int max_parallel_paths = 1;
    HealthThresholds health;
};

struct TrendConfig {
    size_t window_size = 168;
    double noise_threshold = 0.05;   // relative change over the window treated as flat
    double warning_change = 0.20;
    double critical_change = 0.50;
};

struct TimePatternConfig {
    int business_start_hour = 9;
    int business_end_hour = 17;      // exclusive
    bool utc = false;
};

struct DiagnosticThresholds {
    double loss_high_pct = 5.0;
    double loss_medium_pct = 1.0;
    double latency_high_ms = 100.0;
    double latency_medium_ms = 50.0;
    double jitter_high_ms = 20.0;
    uint64_t retrans_high = 100;
    uint64_t retrans_medium = 10;
    double throughput_low_mbps = 100.0;
    double business_drop_high = 0.30;
    double business_drop_medium = 0.15;
};

struct DiagnosticsConfig {
    unsigned int history_hours = 168;
    size_t max_recommendations = 6;
    DiagnosticThresholds thresholds;
    TrendConfig trend;
    TimePatternConfig time_patterns;
};

struct ServicesConfig {
    std::chrono::minutes collector_interval{60};
    unsigned int retention_days = 90;          // 0 keeps everything
    std::chrono::minutes janitor_interval{360};
};

struct Config {
    DatabaseConfig database;
    LoggingConfig logging;
    NetworkPerfConfig network_perf;
    DiagnosticsConfig diagnostics;
    ServicesConfig services;
};

Config loadConfig(const std::filesystem::path& path);
Config loadConfigFromString(const std::string& yaml);

} // namespace pw::config
