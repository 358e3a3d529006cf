#pragma once

#include <algorithm>
#include <string>
#include <string_view>
#include <vector>

namespace pawup::shell {

enum class TokenType { Word, Flag };

struct Token {
    TokenType type;
    std::string text;

    bool operator==(const Token&) const = default;
};

inline void pushFlag(std::vector<Token>& out, std::string k) {
    while (!k.empty() && k[0] == '-') k.erase(k.begin());
    out.push_back({TokenType::Flag, std::move(k)});
}
inline void pushWord(std::vector<Token>& out, std::string v) {
    out.push_back({TokenType::Word, std::move(v)});
}

// One pre-split argument: "--key", "--key=value", "-k", "--" or a plain word.
// Selectors start with ':' and never look like flags.
inline void tokenizeAtom(std::string atom, std::vector<Token>& out) {
    if (atom == "--") { pushWord(out, std::move(atom)); return; }

    if (atom.starts_with("--") && !out.empty()) {
        const auto eq = atom.find('=');
        if (eq == std::string::npos) pushFlag(out, atom.substr(2));
        else {
            pushFlag(out, atom.substr(2, eq - 2));
            pushWord(out, atom.substr(eq + 1));
        }
        return;
    }

    if (atom.size() >= 2 && atom[0] == '-' && atom[1] != '-' && !out.empty()) {
        // "-abc" is a bundle of short flags
        for (const char c : std::string_view(atom).substr(1)) pushFlag(out, std::string(1, c));
        return;
    }

    // a leading "--help" or "-h" stays a word so it can name a command
    pushWord(out, std::move(atom));
}

/// Tokenizes arguments the OS has already split (argv).
inline std::vector<Token> tokenize(const std::vector<std::string>& args) {
    std::vector<Token> out;
    out.reserve(args.size());
    bool stop_flags = false;
    for (const auto& a : args) {
        if (stop_flags) { pushWord(out, a); continue; }
        if (a == "--") stop_flags = true;
        tokenizeAtom(a, out);
    }
    return out;
}

inline std::string to_string(const Token& t) {
    switch (t.type) {
    case TokenType::Word: return "Word(" + t.text + ")";
    case TokenType::Flag: return "Flag(" + t.text + ")";
    }
    return "UnknownToken";
}

inline std::string to_string(const std::vector<Token>& tokens) {
    std::string out;
    for (const auto& t : tokens) {
        if (!out.empty()) out += " ";
        out += to_string(t);
    }
    return out;
}

}
