#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <filesystem>

namespace pw::config { struct LoggingConfig; }

namespace pw::log {

class Registry {
public:
    // Initialize all loggers with sinks/levels.
    static void init(const config::LoggingConfig& cfg);

    // Console-only setup for tools and tests that have no log directory.
    static void initConsoleOnly(spdlog::level::level_enum level = spdlog::level::warn);

    // Generic access by name
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Subsystem shorthands
    static std::shared_ptr<spdlog::logger> pathwatch() { return get("pathwatch"); }
    static std::shared_ptr<spdlog::logger> exec()      { return get("exec"); }
    static std::shared_ptr<spdlog::logger> probe()     { return get("probe"); }
    static std::shared_ptr<spdlog::logger> bench()     { return get("bench"); }
    static std::shared_ptr<spdlog::logger> collector() { return get("collector"); }
    static std::shared_ptr<spdlog::logger> analysis()  { return get("analysis"); }
    static std::shared_ptr<spdlog::logger> diag()      { return get("diag"); }
    static std::shared_ptr<spdlog::logger> db()        { return get("db"); }
    static std::shared_ptr<spdlog::logger> shell()     { return get("shell"); }

    [[nodiscard]] static bool isInitialized();

    static void reopenMainLog();

private:
    static constexpr const auto* LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

    static inline bool initialized_ = false;

    static inline std::filesystem::path log_dir_;
    static inline std::filesystem::path main_log_path_;

    // keep the shared sinks so we can swap them later
    static inline std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> console_sink_;
    static inline std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> main_file_sink_;

    static inline size_t main_max_bytes_ = 10 * 1024 * 1024; // 10 MiB
    static inline size_t main_max_files_ = 5;

    static void registerLogger_(const std::string& name, spdlog::level::level_enum lvl);

    static void replaceSinkEverywhere_(const std::shared_ptr<spdlog::sinks::sink>& old_sink,
                                       const std::shared_ptr<spdlog::sinks::sink>& new_sink);
};

}
