#include "config/ConfigFile.hpp"
#include "error/Errors.hpp"
#include "logging/LogRegistry.hpp"
#include "toolchain/Launcher.hpp"
#include "toolchain/Locator.hpp"
#include "toolchain/Selector.hpp"
#include "toolchain/compiler.hpp"

#include <fmt/core.h>
#include <string>
#include <vector>

using namespace pawup::config;
using namespace pawup::error;
using namespace pawup::logging;
using namespace pawup::toolchain;

namespace {

int run(const std::vector<std::string>& args) {
    const auto cfg = ConfigFile::openDefault();
    LogRegistry::init(cfg.data().logging);

    const auto [selectorText, source] = currentToolchain(cfg.data());
    const auto selector = Selector::parse(selectorText);

    FoundToolchain found;
    try {
        found = Locator().findToolchain(selector, cfg.data());
    } catch (const ToolchainNotFound& e) {
        throw NotFoundError(describeMissing(e, source));
    }

    const auto exe = found.path() / COMPILER_EXE;
    LogRegistry::toolchain()->debug("[spcomp] {} -> {}", selector.str(), exe.string());
    return runCompiler(exe, args);
}

}

int main(int argc, char** argv) {
    const std::string self = argc > 0 ? argv[0] : "pawup-spcomp";
    try {
        const int code = run(std::vector<std::string>(argv + 1, argv + argc));
        LogRegistry::shutdown();
        return code;
    } catch (const std::exception& e) {
        fmt::print(stderr, "{}: {}\n", self, e.what());
        return 1;
    }
}
