#pragma once

#include "shell/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace pawup::shell {

CommandResult ok(std::string out);
CommandResult invalid(std::string msg);
CommandResult usage(const std::string& command = {});

/// Exit code 1 with "Fatal error: <msg>".
CommandResult fatal(const std::string& msg);

[[nodiscard]] bool hasKey(const CommandCall& c, const std::string& key);

/// True if either spelling of a switch is present.
[[nodiscard]] bool hasSwitch(const CommandCall& c, const std::string& name, const std::string& shortName);

std::optional<std::string> positional(const CommandCall& c, size_t index);

/// invalid() with the command's help text if more than `max` positionals were given.
std::optional<CommandResult> checkPositionals(const CommandCall& c, size_t min, size_t max);

}
