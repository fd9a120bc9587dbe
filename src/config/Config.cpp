#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace pw::config {

namespace {

Config decodeRoot(const YAML::Node& root) {
    Config cfg;
    if (!root || root.IsNull()) return cfg;
    if (!root.IsMap()) throw std::runtime_error("Config root must be a mapping");

    if (auto node = root["database"]) YAML::convert<DatabaseConfig>::decode(node, cfg.database);
    if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);
    if (auto node = root["network_perf"]) YAML::convert<NetworkPerfConfig>::decode(node, cfg.network_perf);
    if (auto node = root["diagnostics"]) YAML::convert<DiagnosticsConfig>::decode(node, cfg.diagnostics);
    if (auto node = root["services"]) YAML::convert<ServicesConfig>::decode(node, cfg.services);

    if (cfg.diagnostics.time_patterns.business_start_hour < 0 ||
        cfg.diagnostics.time_patterns.business_end_hour > 24 ||
        cfg.diagnostics.time_patterns.business_start_hour >= cfg.diagnostics.time_patterns.business_end_hour)
        throw std::invalid_argument("diagnostics.time_patterns: business hours must satisfy 0 <= start < end <= 24");

    if (cfg.network_perf.ping_count == 0) throw std::invalid_argument("network_perf.ping_count must be positive");
    if (cfg.network_perf.hot_runs == 0) throw std::invalid_argument("network_perf.hot_runs must be positive");

    return cfg;
}

}

Config loadConfig(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path))
        throw std::runtime_error("Config file not found: " + path.string());

    try {
        return decodeRoot(YAML::LoadFile(path.string()));
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Failed to parse config " + path.string() + ": " + e.what());
    }
}

Config loadConfigFromString(const std::string& yaml) {
    try {
        return decodeRoot(YAML::Load(yaml));
    } catch (const YAML::Exception& e) {
        throw std::runtime_error(std::string("Failed to parse config: ") + e.what());
    }
}

}
