#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace pawup::shell {

// A labeled option or argument, e.g. {"--redownload", "Download even if installed"}.
struct Entry {
    std::string label;
    std::string desc;
    std::vector<std::string> aliases;
};

struct Example {
    std::string cmd;
    std::string note;
};

class CommandUsage {
public:
    std::string command;                         // e.g. "update"
    std::vector<std::string> aliases;            // e.g. {"up"}
    std::string description;
    std::optional<std::string> synopsis;         // synthesized when empty

    std::vector<Entry> positionals;              // ordered; appear in the synopsis
    std::vector<Entry> optional;                 // flags
    std::vector<Example> examples;

    int term_width = 100;
    std::size_t max_key_col = 28;

    /// Flags that never take a value.
    [[nodiscard]] std::vector<std::string> switches() const;

    [[nodiscard]] std::string synopsisStr() const;

    /// Full help page for this command.
    [[nodiscard]] std::string toText() const;

    /// One line for the command overview.
    [[nodiscard]] std::string summaryLine(std::size_t nameWidth) const;
};

class CommandBook {
public:
    std::string title;
    std::vector<CommandUsage> commands;

    [[nodiscard]] const CommandUsage* find(const std::string& nameOrAlias) const;

    [[nodiscard]] std::string toText() const;
};

}
