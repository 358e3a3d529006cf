#pragma once

#include "shell/CommandUsage.hpp"
#include "shell/types.hpp"

#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace pawup::shell {

class Router {
public:
    void registerCommand(const CommandUsage& usage, CommandHandler handler);

    /// Runs argv[1..]. Failures thrown by a handler become exit code 1 with "Fatal error: ..." on stderr.
    CommandResult execute(const std::vector<std::string>& args) const;

private:
    std::unordered_map<std::string, CommandHandler> commands_;
    std::unordered_map<std::string, std::string> aliasMap_; // alias -> canonical
    std::unordered_set<std::string> switches_;

    CommandResult dispatch(CommandCall call) const;
    [[nodiscard]] std::string canonicalFor(const std::string& nameOrAlias) const;

    static std::string normalize(const std::string& s);
};

}
