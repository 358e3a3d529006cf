#include "shell/Router.hpp"
#include "shell/Parser.hpp"
#include "shell/Token.hpp"
#include "shell/helpers.hpp"
#include "error/Errors.hpp"
#include "logging/LogRegistry.hpp"

#include <cctype>
#include <fmt/core.h>

using namespace pawup::shell;
using namespace pawup::logging;

void Router::registerCommand(const CommandUsage& usage, CommandHandler handler) {
    const std::string key = normalize(usage.command);

    for (const auto& alias : usage.aliases) {
        const auto a = normalize(alias);
        if (aliasMap_.contains(a) && aliasMap_.at(a) != key) {
            LogRegistry::shell()->warn("Alias '{}' already mapped to '{}'; skipping duplicate for '{}'",
                                       a, aliasMap_.at(a), key);
            continue;
        }
        aliasMap_[a] = key;
    }

    for (auto& s : usage.switches()) switches_.insert(std::move(s));

    commands_[key] = std::move(handler);
}

std::string Router::canonicalFor(const std::string& nameOrAlias) const {
    const auto n = normalize(nameOrAlias);
    if (commands_.contains(n)) return n;
    if (aliasMap_.contains(n)) return aliasMap_.at(n);
    return n;
}

CommandResult Router::execute(const std::vector<std::string>& args) const {
    const auto tokens = tokenize(args);
    LogRegistry::shell()->debug("[Router] Tokens: {}", to_string(tokens));
    return dispatch(parseTokens(tokens, switches_));
}

CommandResult Router::dispatch(CommandCall call) const {
    if (call.name.empty()) return usage();

    const auto canonical = canonicalFor(call.name);
    if (!commands_.contains(canonical))
        return invalid(fmt::format("Unknown command: {}. Run 'pawup help' for a list of commands.", call.name));

    LogRegistry::shell()->debug("[Router] Executing command: '{}'", canonical);
    call.name = canonical;

    try {
        return commands_.at(canonical)(call);
    } catch (const error::Error& e) {
        LogRegistry::shell()->error("[Router] {} failed: {}", canonical, e.what());
        return fatal(e.what());
    } catch (const std::exception& e) {
        LogRegistry::shell()->error("[Router] {} failed unexpectedly: {}", canonical, e.what());
        return fatal(e.what());
    }
}

std::string Router::normalize(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (const unsigned char c : s) out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}
