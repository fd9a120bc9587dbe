#include "shell/Router.hpp"
#include "log/Registry.hpp"

#include <fmt/core.h>
#include <cctype>

using namespace pw::shell;

const std::vector<std::string>& Router::booleanFlags() {
    static const std::vector<std::string> flags{"full", "dry-run", "json", "no-color", "help", "h", "version"};
    return flags;
}

void Router::registerCommand(const std::string& name,
                             const std::string& usage,
                             const std::string& description,
                             const std::unordered_set<std::string>& aliases,
                             CommandHandler handler) {
    const std::string key = normalize(name);

    CommandInfo info{usage, description.empty() ? "No description provided." : description, std::move(handler), {}};

    for (const auto& alias : aliases) {
        const auto a = normalize(alias);
        if (aliasMap_.contains(a) && aliasMap_.at(a) != key) {
            log::Registry::shell()->warn("[Router] Alias '{}' already mapped to '{}'; skipping duplicate for '{}'",
                                         a, aliasMap_.at(a), key);
            continue;
        }
        info.aliases.insert(a);
        aliasMap_[a] = key;
    }

    if (!commands_.contains(key)) order_.push_back(key);
    commands_[key] = std::move(info);
}

std::string Router::canonicalFor(const std::string& nameOrAlias) const {
    const std::string n = normalize(nameOrAlias);
    if (commands_.contains(n)) return n;
    if (aliasMap_.contains(n)) return aliasMap_.at(n);
    return n;
}

CommandResult Router::execute(const CommandCall& call) const {
    if (call.name.empty()) return invalid("No command provided.\n\n" + helpText());

    const auto canonical = canonicalFor(call.name);
    if (!commands_.contains(canonical))
        return invalid(fmt::format("Unknown command or alias: {}\n\n{}", call.name, helpText()));

    log::Registry::shell()->debug("[Router] Executing command: '{}'", canonical);

    try {
        return commands_.at(canonical).handler(call);
    } catch (const std::invalid_argument& e) {
        return invalid(fmt::format("{}: {}\nusage: pathwatch {}", canonical, e.what(), commands_.at(canonical).usage));
    } catch (const std::exception& e) {
        log::Registry::shell()->error("[Router] Command '{}' failed: {}", canonical, e.what());
        return failure(fmt::format("{}: {}", canonical, e.what()));
    }
}

std::string Router::helpText() const {
    std::string out = "usage: pathwatch [--config FILE] <command> [options]\n\ncommands:\n";
    for (const auto& key : order_) {
        const auto& info = commands_.at(key);
        out += fmt::format("  {:<58} {}\n", info.usage, info.description);
    }
    return out;
}

std::string Router::normalize(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (const unsigned char c : s) out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}
