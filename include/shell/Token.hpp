#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace pw::shell {

enum class TokenType { Word, Flag };

struct Token {
    TokenType type;
    std::string text;
};

inline bool looks_negative_number(std::string_view s) {
    if (s.size() < 2 || s[0] != '-') return false;
    bool dot = false, digit = false;
    for (size_t i = 1; i < s.size(); ++i) {
        const char c = s[i];
        if (c >= '0' && c <= '9') { digit = true; continue; }
        if (c == '.' && !dot) { dot = true; continue; }
        return false;
    }
    return digit;
}

inline void pushFlag(std::vector<Token>& out, std::string k) {
    while (!k.empty() && k[0] == '-') k.erase(k.begin());
    out.push_back({TokenType::Flag, std::move(k)});
}

inline void pushWord(std::vector<Token>& out, std::string v) {
    out.push_back({TokenType::Word, std::move(v)});
}

// One already-split argument: "--key", "--key=value", "-k", "--", or a word.
inline void classify(std::string arg, std::vector<Token>& out) {
    if (arg == "--" || arg == "-" || looks_negative_number(arg) || arg.empty() || arg[0] != '-') {
        pushWord(out, std::move(arg));
        return;
    }

    if (arg.rfind("--", 0) == 0) {
        const auto eq = arg.find('=');
        if (eq == std::string::npos) pushFlag(out, arg.substr(2));
        else {
            pushFlag(out, arg.substr(2, eq - 2));
            pushWord(out, arg.substr(eq + 1));
        }
        return;
    }

    // short bundle "-abc" expands to a, b, c
    for (size_t i = 1; i < arg.size(); ++i) pushFlag(out, std::string(1, arg[i]));
}

inline std::vector<Token> tokenize(const std::vector<std::string>& args) {
    std::vector<Token> out;
    for (const auto& a : args) classify(a, out);
    return out;
}

}
