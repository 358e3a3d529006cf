#pragma once

#include "shell/Token.hpp"
#include "shell/types.hpp"

#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace pawup::shell {

// Upsert a flag (last wins)
inline void setOpt(CommandCall& c, const std::string& key, const std::optional<std::string>& val) {
    for (auto& [k, v] : c.options) if (k == key) { v = val; return; }
    c.options.push_back(FlagKV{key, val});
}

/// First word names the command. A flag takes the following word as its value unless it is
/// listed in `switches`. Everything after "--" is positional.
inline CommandCall parseTokens(const std::vector<Token>& toks, const std::unordered_set<std::string>& switches = {}) {
    CommandCall call;

    size_t i = 0;
    for (; i < toks.size(); ++i) {
        if (toks[i].type == TokenType::Word) {
            call.name = toks[i].text;
            ++i;
            break;
        }
        // flags ahead of the command still count
        setOpt(call, toks[i].text, std::nullopt);
    }

    bool stop_flags = false;
    for (; i < toks.size(); ++i) {
        const Token& t = toks[i];

        if (!stop_flags && t.type == TokenType::Word && t.text == "--") {
            stop_flags = true;
            continue;
        }

        if (!stop_flags && t.type == TokenType::Flag) {
            if (!switches.contains(t.text) && i + 1 < toks.size() && toks[i + 1].type == TokenType::Word &&
                toks[i + 1].text != "--") {
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

}
