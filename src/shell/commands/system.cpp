#include "shell/commands.hpp"
#include "shell/Router.hpp"
#include "shell/helpers.hpp"
#include "shell/usage/PawupUsage.hpp"

#include <version.h>

namespace pawup::shell {

static CommandResult handle_help(const CommandCall& call) {
    if (auto bad = checkPositionals(call, 0, 1)) return *bad;
    return usage(positional(call, 0).value_or(""));
}

static CommandResult handle_version(const CommandCall&) {
    return ok("pawup " + std::string(PAWUP_VERSION) + "\n");
}

void registerSystemCommands(const std::shared_ptr<Router>& r) {
    r->registerCommand(PawupUsage::help(), handle_help);
    r->registerCommand(PawupUsage::version(), handle_version);
}

}
