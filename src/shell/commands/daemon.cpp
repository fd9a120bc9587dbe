#include "shell/commands.hpp"
#include "shell/Router.hpp"
#include "helpers.hpp"
#include "collectors/NetworkPathCollector.hpp"
#include "config/ConfigRegistry.hpp"
#include "db/Janitor.hpp"
#include "db/query/NetworkPerf.hpp"
#include "log/Registry.hpp"
#include "services/CollectorService.hpp"

#include <fmt/format.h>
#include <thread>

namespace pw::shell {

static CommandResult handle_daemon(const CommandCall&, const CommandContext& ctx) {
    const auto& cfg = config::ConfigRegistry::get();
    if (cfg.network_perf.paths.empty())
        return failure("No paths configured under network_perf.paths");

    ensureDatabase(cfg.database);

    auto collector = std::make_shared<collectors::NetworkPathCollector>(ctx.runner, cfg.network_perf);
    services::CollectorService collectorService(collector, cfg.services.collector_interval,
                                                [](const std::vector<types::NetworkPerfRecord>& records) {
                                                    db::query::NetworkPerf::insert(records);
                                                });
    db::Janitor janitor(cfg.services.retention_days, cfg.services.janitor_interval);

    log::Registry::pathwatch()->info("[daemon] Starting: {} path(s), every {} min, retention {} day(s)",
                                     cfg.network_perf.paths.size(), cfg.services.collector_interval.count(),
                                     cfg.services.retention_days);

    collectorService.start();
    if (cfg.services.retention_days > 0) janitor.start();

    while (!ctx.stopRequested || !ctx.stopRequested())
        std::this_thread::sleep_for(std::chrono::seconds(1));

    log::Registry::pathwatch()->info("[daemon] Shutdown requested, waiting for the current cycle");
    janitor.stop();
    collectorService.stop();

    log::Registry::pathwatch()->info("[daemon] Stopped");
    return ok();
}

void registerDaemonCommands(const std::shared_ptr<Router>& r, const CommandContext& ctx) {
    r->registerCommand("daemon", "daemon",
                       "Collect on a schedule and purge expired rows until SIGINT/SIGTERM",
                       {"run"},
                       [ctx](const CommandCall& call) { return handle_daemon(call, ctx); });
}

}
