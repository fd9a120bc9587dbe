#pragma once

#include "config/Config.hpp"

#include <filesystem>
#include <mutex>

namespace pw::config {

inline constexpr const char* DEFAULT_CONFIG_PATH = "/etc/pathwatch/config.yaml";
inline constexpr const char* CONFIG_PATH_ENV = "PATHWATCH_CONFIG";

// --config wins, then $PATHWATCH_CONFIG, then the system default.
std::filesystem::path resolveConfigPath(const std::string& cliOverride = {});

class ConfigRegistry {
public:
    static void init(const std::filesystem::path& path);
    static void init(Config cfg);
    static const Config& get();

    [[nodiscard]] static bool isInitialized();

private:
    static void ensureInitialized();

    static inline Config config_;
    static inline bool initialized_ = false;
    static inline std::once_flag init_flag_;
};

} // namespace pw::config
