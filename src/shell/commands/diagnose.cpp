#include "shell/commands.hpp"
#include "shell/Parser.hpp"
#include "shell/Router.hpp"
#include "helpers.hpp"
#include "config/ConfigRegistry.hpp"
#include "db/query/NetworkPerf.hpp"
#include "diag/DiagnosticEngine.hpp"
#include "diag/ReportFormatter.hpp"
#include "log/Registry.hpp"

#include <nlohmann/json.hpp>
#include <unistd.h>

using namespace pw::db::query;

namespace pw::shell {

static CommandResult handle_diagnose(const CommandCall& call) {
    const auto& cfg = config::ConfigRegistry::get();

    const auto source = optVal(call, "source").value_or("");
    const auto dest = optVal(call, "dest").value_or("");
    const auto hours = optUInt(call, "hours").value_or(cfg.diagnostics.history_hours);

    ensureDatabase(cfg.database);

    const auto current = NetworkPerf::getLatest(source, dest);
    const auto history = NetworkPerf::getHistory(source, dest, hours);

    log::Registry::shell()->debug("[diagnose] {} -> {}: {} sample(s) over {}h, current {}",
                                  source.empty() ? "*" : source, dest.empty() ? "*" : dest,
                                  history.size(), hours, current ? "present" : "absent");

    const diag::DiagnosticEngine engine(cfg.diagnostics);
    const auto diagnostic = engine.diagnose(source, dest, current, history);

    CommandResult res;
    if (hasFlag(call, "json")) {
        res = ok(diag::ReportFormatter::toJson(diagnostic) + '\n');
    } else {
        const bool color = !hasFlag(call, "no-color") && ::isatty(STDOUT_FILENO);
        const diag::ReportFormatter formatter(color, cfg.diagnostics.max_recommendations);
        res = ok(formatter.format(diagnostic));
    }
    res.data = diagnostic;
    res.has_data = true;
    return res;
}

void registerDiagnoseCommands(const std::shared_ptr<Router>& r) {
    r->registerCommand("diagnose", "diagnose [--source S] [--dest D] [--hours N] [--json] [--no-color]",
                       "Analyze recent measurements and suggest likely causes",
                       {"diag", "d"}, handle_diagnose);
}

}
