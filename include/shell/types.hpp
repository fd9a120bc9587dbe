#pragma once

#include <functional>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>
#include <nlohmann/json.hpp>

namespace pw::shell {

struct FlagKV {
    std::string key;
    std::optional<std::string> value;
};

struct CommandCall {
    std::string name;
    std::vector<FlagKV> options;
    std::vector<std::string> positionals;
};

struct CommandResult {
    int exit_code = 0;                 // 0 = success
    std::string stdout_text;           // CLI stdout
    std::string stderr_text;           // CLI stderr
    nlohmann::json data;               // optional machine-readable payload
    bool has_data = false;
};

using CommandHandler = std::function<CommandResult(const CommandCall&)>;

struct CommandInfo {
    std::string usage;                       // "diagnose [--source S] ..."
    std::string description;
    CommandHandler handler;
    std::unordered_set<std::string> aliases;
};

inline CommandResult ok(std::string out = {}) { return {0, std::move(out), {}, {}, false}; }
inline CommandResult invalid(std::string err) { return {2, {}, std::move(err), {}, false}; }
inline CommandResult failure(std::string err) { return {1, {}, std::move(err), {}, false}; }

}
