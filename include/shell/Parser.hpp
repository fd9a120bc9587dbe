#pragma once

#include "shell/Token.hpp"
#include "shell/types.hpp"

#include <algorithm>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace pw::shell {

// Upsert a flag (last wins)
inline void setOpt(CommandCall& c, const std::string& key, const std::optional<std::string>& val) {
    for (auto& [k, v] : c.options) if (k == key) { v = val; return; }
    c.options.push_back(FlagKV{key, val});
}

// Boolean flags never consume the following word.
inline CommandCall parseTokens(const std::vector<Token>& toks,
                               const std::vector<std::string>& booleanFlags = {}) {
    CommandCall call;

    size_t i = 0;
    for (; i < toks.size(); ++i) {
        if (toks[i].type == TokenType::Word) {
            call.name = toks[i].text;
            ++i;
            break;
        }
        // leading flags before the command name
        setOpt(call, toks[i].text, std::nullopt);
        if (i + 1 < toks.size() && toks[i + 1].type == TokenType::Word &&
            std::find(booleanFlags.begin(), booleanFlags.end(), toks[i].text) == booleanFlags.end()) {
            setOpt(call, toks[i].text, toks[i + 1].text);
            ++i;
        }
    }

    bool stop_flags = false;
    for (; i < toks.size(); ++i) {
        const Token& t = toks[i];

        if (!stop_flags && t.type == TokenType::Word && t.text == "--") {
            stop_flags = true;
            continue;
        }

        if (!stop_flags && t.type == TokenType::Flag) {
            const bool boolean = std::find(booleanFlags.begin(), booleanFlags.end(), t.text) != booleanFlags.end();
            if (!boolean && i + 1 < toks.size() && toks[i + 1].type == TokenType::Word) {
                setOpt(call, t.text, toks[i + 1].text);
                ++i;
            } else {
                setOpt(call, t.text, std::nullopt);
            }
            continue;
        }

        call.positionals.push_back(t.text);
    }

    return call;
}

inline bool hasFlag(const CommandCall& c, const std::string& key) {
    for (const auto& [k, v] : c.options) if (k == key) return true;
    return false;
}

inline std::optional<std::string> optVal(const CommandCall& c, const std::string& key) {
    for (const auto& [k, v] : c.options) if (k == key) return v;
    return std::nullopt;
}

inline std::optional<unsigned int> optUInt(const CommandCall& c, const std::string& key) {
    const auto v = optVal(c, key);
    if (!v) {
        if (hasFlag(c, key)) throw std::invalid_argument("--" + key + " requires a value");
        return std::nullopt;
    }
    try {
        size_t pos = 0;
        const auto n = std::stoul(*v, &pos);
        if (pos != v->size()) throw std::invalid_argument(*v);
        return static_cast<unsigned int>(n);
    } catch (const std::exception&) {
        throw std::invalid_argument("--" + key + " expects a non-negative integer, got '" + *v + "'");
    }
}

}
