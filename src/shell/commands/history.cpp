#include "shell/commands.hpp"
#include "shell/Parser.hpp"
#include "shell/Router.hpp"
#include "shell/Table.hpp"
#include "helpers.hpp"
#include "config/ConfigRegistry.hpp"
#include "db/query/NetworkPerf.hpp"
#include "util/timestamp.hpp"

#include <fmt/format.h>
#include <nlohmann/json.hpp>

using namespace pw::db::query;

namespace pw::shell {

static std::string fmtCount(const std::optional<uint64_t>& v) {
    return v ? std::to_string(*v) : "-";
}

static CommandResult handle_history(const CommandCall& call) {
    const auto& cfg = config::ConfigRegistry::get();

    const auto source = optVal(call, "source").value_or("");
    const auto dest = optVal(call, "dest").value_or("");
    const auto hours = optUInt(call, "hours").value_or(24);

    ensureDatabase(cfg.database);
    const auto rows = NetworkPerf::getHistory(source, dest, hours);

    if (rows.empty()) {
        auto res = ok(fmt::format("No measurements in the last {} hour(s)\n", hours));
        res.data = rows;
        res.has_data = true;
        return res;
    }

    Table table({
        {"Time"},
        {"Source", Align::Left, 6, 24, true},
        {"Dest", Align::Left, 4, 24, true},
        {"Type"},
        {"Status"},
        {"Loss %", Align::Right},
        {"Avg ms", Align::Right},
        {"Jitter", Align::Right},
        {"Mbps", Align::Right},
        {"Retrans", Align::Right},
    });

    for (const auto& s : rows)
        table.add_row({
            util::formatLocal(s.timestamp),
            s.source_host,
            s.dest_host,
            types::to_string(s.path_type),
            types::to_string(s.status),
            fmtOpt(s.ping_loss_pct, 1),
            fmtOpt(s.ping_avg_ms, 2),
            fmtOpt(s.ping_mdev_ms, 2),
            fmtOpt(s.throughput_mbps, 1, s.throughput_estimated ? "~" : ""),
            fmtCount(s.tcp_retrans),
        });

    auto res = ok(table.render());
    res.data = rows;
    res.has_data = true;
    return res;
}

static CommandResult handle_paths(const CommandCall&) {
    const auto& cfg = config::ConfigRegistry::get();
    ensureDatabase(cfg.database);

    const auto paths = NetworkPerf::listPaths();
    if (paths.empty()) return ok("No paths recorded\n");

    Table table({
        {"Source", Align::Left, 6, 32, true},
        {"Dest", Align::Left, 4, 32, true},
        {"Type"},
        {"Samples", Align::Right},
        {"Last seen"},
    });
    for (const auto& p : paths)
        table.add_row({p.source_host, p.dest_host, types::to_string(p.path_type),
                       std::to_string(p.samples), util::formatLocal(p.last_seen)});
    return ok(table.render());
}

void registerHistoryCommands(const std::shared_ptr<Router>& r) {
    r->registerCommand("history", "history [--source S] [--dest D] [--hours N]",
                       "Show stored measurements, oldest first", {"hist"}, handle_history);
    r->registerCommand("paths", "paths", "List every measured path with its sample count", {}, handle_paths);
}

}
