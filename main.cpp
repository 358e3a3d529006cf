#include "config/ConfigFile.hpp"
#include "error/Errors.hpp"
#include "logging/LogRegistry.hpp"
#include "shell/Router.hpp"
#include "shell/commands.hpp"

#include <fmt/core.h>
#include <memory>
#include <string>
#include <vector>

using namespace pawup::config;
using namespace pawup::logging;
using namespace pawup::shell;

namespace {

// Logging settings come from the config file, but a broken file must not keep the
// command from running far enough to report it.
LoggingConfig loggingSettings() {
    try {
        return ConfigFile::openDefault().data().logging;
    } catch (const pawup::error::Error&) {
        return {};
    }
}

}

int main(int argc, char** argv) {
    try {
        LogRegistry::init(loggingSettings());
    } catch (const std::exception& e) {
        fmt::print(stderr, "Fatal error: failed to initialize logging: {}\n", e.what());
        return 1;
    }

    const auto router = std::make_shared<Router>();
    registerAllCommands(router);

    const std::vector<std::string> args(argv + 1, argv + argc);
    const auto res = router->execute(args);

    if (!res.stdout_text.empty()) fmt::print("{}", res.stdout_text);
    if (!res.stderr_text.empty()) fmt::print(stderr, "{}", res.stderr_text);

    LogRegistry::shutdown();
    return res.exit_code;
}
