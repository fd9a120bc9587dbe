#include "shell/commands.hpp"
#include "shell/Parser.hpp"
#include "shell/Router.hpp"
#include "helpers.hpp"
#include "collectors/NetworkPathCollector.hpp"
#include "config/ConfigRegistry.hpp"
#include "db/query/NetworkPerf.hpp"
#include "log/Registry.hpp"

#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace pw::shell {

static CommandResult handle_collect(const CommandCall& call, const CommandContext& ctx) {
    auto cfg = config::ConfigRegistry::get();
    if (hasFlag(call, "full")) cfg.network_perf.full_test = true;
    const bool dryRun = hasFlag(call, "dry-run");

    if (cfg.network_perf.paths.empty())
        return failure("No paths configured under network_perf.paths");

    const collectors::NetworkPathCollector collector(ctx.runner, cfg.network_perf);
    const auto records = collector.collect();

    std::string out;
    for (const auto& r : records) out += summaryLine(r) + '\n';

    if (!dryRun && !records.empty()) {
        ensureDatabase(cfg.database);
        db::query::NetworkPerf::insert(records);
        out += fmt::format("Stored {} record(s)\n", records.size());
    }

    auto res = ok(std::move(out));
    res.data = records;
    res.has_data = true;
    return res;
}

void registerCollectCommands(const std::shared_ptr<Router>& r, const CommandContext& ctx) {
    r->registerCommand("collect", "collect [--full] [--dry-run]",
                       "Measure every configured path once and store the results",
                       {"c"},
                       [ctx](const CommandCall& call) { return handle_collect(call, ctx); });
}

}
