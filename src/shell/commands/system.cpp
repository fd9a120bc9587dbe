#include "shell/commands.hpp"
#include "shell/Router.hpp"

namespace pw::shell {

void registerSystemCommands(const std::shared_ptr<Router>& r) {
    const std::weak_ptr<Router> weak = r;
    r->registerCommand("help", "help", "Show this message", {"h"},
                       [weak](const CommandCall&) {
                           const auto router = weak.lock();
                           return ok(router ? router->helpText() : std::string{});
                       });
    r->registerCommand("version", "version", "Print the pathwatch version", {},
                       [](const CommandCall&) { return ok(std::string("pathwatch v") + PATHWATCH_VERSION + "\n"); });
}

}
