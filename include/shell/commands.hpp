#pragma once

#include <functional>
#include <memory>

namespace pw::util::exec { class Runner; }

namespace pw::shell {

class Router;

struct CommandContext {
    std::shared_ptr<util::exec::Runner> runner;
    std::function<bool()> stopRequested;   // polled by long-running commands
};

void registerCollectCommands(const std::shared_ptr<Router>& r, const CommandContext& ctx);
void registerDiagnoseCommands(const std::shared_ptr<Router>& r);
void registerHistoryCommands(const std::shared_ptr<Router>& r);
void registerDaemonCommands(const std::shared_ptr<Router>& r, const CommandContext& ctx);
void registerSystemCommands(const std::shared_ptr<Router>& r);

inline void registerAllCommands(const std::shared_ptr<Router>& r, const CommandContext& ctx) {
    registerCollectCommands(r, ctx);
    registerDiagnoseCommands(r);
    registerHistoryCommands(r);
    registerDaemonCommands(r, ctx);
    registerSystemCommands(r);
}

}
