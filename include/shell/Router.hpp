#pragma once

#include "shell/types.hpp"

#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace pw::shell {

class Router {
public:
    void registerCommand(const std::string& name,
                         const std::string& usage,
                         const std::string& description,
                         const std::unordered_set<std::string>& aliases,
                         CommandHandler handler);

    // Unknown commands yield exit code 2; handler exceptions are caught and reported with exit code 1.
    CommandResult execute(const CommandCall& call) const;

    [[nodiscard]] std::string helpText() const;

    // Flags that never take a value, across every registered command.
    static const std::vector<std::string>& booleanFlags();

private:
    std::unordered_map<std::string, CommandInfo> commands_;
    std::unordered_map<std::string, std::string> aliasMap_; // alias -> canonical
    std::vector<std::string> order_;

    std::string canonicalFor(const std::string& nameOrAlias) const;

    static std::string normalize(const std::string& s);
};

} // namespace pw::shell
