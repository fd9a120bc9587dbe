#include "config/ConfigRegistry.hpp"
#include "log/Registry.hpp"
#include "shell/commands.hpp"
#include "shell/Parser.hpp"
#include "shell/Router.hpp"
#include "shell/Token.hpp"
#include "util/exec.hpp"

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>

using namespace pw;
using namespace pw::config;
using namespace pw::shell;

namespace {
std::atomic shouldExit = false;
std::atomic reopenLogs = false;

void signalHandler(const int signum) {
    if (signum == SIGHUP) reopenLogs = true;
    else shouldExit = true;
}

bool needsConfig(const std::string& command) {
    return command != "help" && command != "h" && command != "version";
}

void initLogging(const LoggingConfig& cfg) {
    try {
        log::Registry::init(cfg);
    } catch (const std::filesystem::filesystem_error& e) {
        log::Registry::initConsoleOnly(cfg.levels.console_log_level);
        log::Registry::pathwatch()->warn("[main] Cannot write to {}, logging to console only: {}",
                                         cfg.log_dir.string(), e.what());
    } catch (const spdlog::spdlog_ex& e) {
        log::Registry::initConsoleOnly(cfg.levels.console_log_level);
        log::Registry::pathwatch()->warn("[main] Cannot open log file in {}, logging to console only: {}",
                                         cfg.log_dir.string(), e.what());
    }
}
}

int main(const int argc, char** argv) {
    const std::vector<std::string> args(argv + 1, argv + argc);
    auto call = parseTokens(tokenize(args), Router::booleanFlags());

    if (call.name.empty()) {
        if (hasFlag(call, "version")) call.name = "version";
        else if (hasFlag(call, "help") || hasFlag(call, "h")) call.name = "help";
    }

    try {
        if (needsConfig(call.name)) {
            ConfigRegistry::init(resolveConfigPath(optVal(call, "config").value_or("")));
            initLogging(ConfigRegistry::get().logging);
        } else {
            log::Registry::initConsoleOnly();
        }

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);
        std::signal(SIGHUP, signalHandler);

        CommandContext ctx;
        ctx.runner = std::make_shared<util::exec::ProcessRunner>();
        ctx.stopRequested = [] {
            if (reopenLogs.exchange(false)) log::Registry::reopenMainLog();
            return shouldExit.load();
        };

        const auto router = std::make_shared<Router>();
        registerAllCommands(router, ctx);

        const auto result = router->execute(call);
        if (!result.stdout_text.empty()) std::cout << result.stdout_text << std::flush;
        if (!result.stderr_text.empty()) std::cerr << result.stderr_text << std::endl;
        return result.exit_code;
    } catch (const std::exception& e) {
        if (log::Registry::isInitialized()) log::Registry::pathwatch()->error("[main] {}", e.what());
        std::cerr << "pathwatch: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }
}
