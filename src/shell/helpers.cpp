#include "shell/helpers.hpp"
#include "shell/usage/PawupUsage.hpp"

#include <algorithm>
#include <fmt/core.h>

using namespace pawup::shell;

CommandResult pawup::shell::ok(std::string out) { return {0, std::move(out), ""}; }
CommandResult pawup::shell::invalid(std::string msg) { return {2, "", std::move(msg) + "\n"}; }

CommandResult pawup::shell::usage(const std::string& command) {
    const auto book = PawupUsage::all();
    if (!command.empty()) {
        if (const auto* cmd = book.find(command)) return ok(cmd->toText());
        return invalid(fmt::format("Unknown command: {}", command));
    }
    return ok(book.toText());
}

CommandResult pawup::shell::fatal(const std::string& msg) {
    return {1, "", fmt::format("Fatal error: {}\n", msg)};
}

bool pawup::shell::hasKey(const CommandCall& c, const std::string& key) {
    return std::ranges::any_of(c.options, [&key](const auto& kv) { return kv.key == key; });
}

bool pawup::shell::hasSwitch(const CommandCall& c, const std::string& name, const std::string& shortName) {
    return hasKey(c, name) || hasKey(c, shortName);
}

std::optional<std::string> pawup::shell::positional(const CommandCall& c, const size_t index) {
    if (index >= c.positionals.size()) return std::nullopt;
    return c.positionals[index];
}

std::optional<CommandResult> pawup::shell::checkPositionals(const CommandCall& c, const size_t min, const size_t max) {
    const auto n = c.positionals.size();
    if (n >= min && n <= max) return std::nullopt;

    auto help = usage(c.name);
    help.exit_code = 2;
    help.stderr_text = n < min ? fmt::format("{}: missing argument\n", c.name)
                               : fmt::format("{}: too many arguments\n", c.name);
    return help;
}
