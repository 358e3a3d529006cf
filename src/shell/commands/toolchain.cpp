#include "shell/commands.hpp"
#include "shell/Router.hpp"
#include "shell/helpers.hpp"
#include "shell/usage/PawupUsage.hpp"
#include "config/ConfigFile.hpp"
#include "error/Errors.hpp"
#include "logging/LogRegistry.hpp"
#include "paths/paths.hpp"
#include "toolchain/Locator.hpp"

#include <fmt/core.h>
#include <iterator>
#include <set>
#include <system_error>

using namespace pawup::config;
using namespace pawup::error;
using namespace pawup::logging;
using namespace pawup::toolchain;

namespace fs = std::filesystem;

namespace pawup::shell {

namespace {

// Only downloaded toolchains are ever deleted.
fs::path cacheHome() {
    auto home = paths::toolchainHome();
    if (!home) throw FilesystemError("couldn't get toolchain destination directory", {});
    return *home;
}

}

fs::path toolchainDestination(const std::string& version) {
    if (!paths::isPlainComponent(version))
        throw FilesystemError(fmt::format("refusing to use '{}' as a toolchain directory name", version), {});
    return cacheHome() / version;
}

static CommandResult handle_show(const CommandCall& call) {
    if (auto bad = checkPositionals(call, 0, 0)) return *bad;

    std::string out;
    for (const auto& root : Locator().installedToolchains()) {
        fmt::format_to(std::back_inserter(out), "{}:\n", root.home.string());
        if (!root.exists) continue;
        for (const auto& name : root.names)
            fmt::format_to(std::back_inserter(out), "  {} => {}\n", name, (root.home / name).string());
    }
    return ok(out);
}

static CommandResult handle_remove(const CommandCall& call) {
    if (auto bad = checkPositionals(call, 1, 1)) return *bad;

    const auto cfg = ConfigFile::openDefault();
    const auto selector = Selector::parse(call.positionals[0]);
    const auto home = cacheHome();

    std::string out;
    for (const auto& name : Locator::dirNames(home)) {
        if (!selector.test(cfg.data().aliases, name)) continue;

        const auto path = home / name;
        fmt::format_to(std::back_inserter(out), "{} => {}\n", name, path.string());

        std::error_code ec;
        fs::remove_all(path, ec);
        if (ec) {
            LogRegistry::toolchain()->error("[remove] Failed to delete {}: {}", path.string(), ec.message());
            fmt::format_to(std::back_inserter(out), "failed to recursively delete toolchain at {}: {}\n",
                           path.string(), ec.message());
            continue;
        }
        LogRegistry::toolchain()->info("[remove] Deleted {}", path.string());
    }
    return ok(out);
}

static CommandResult handle_purge(const CommandCall& call) {
    if (auto bad = checkPositionals(call, 0, 0)) return *bad;

    const auto cfg = ConfigFile::openDefault();
    const bool dryRun = hasSwitch(call, "dry-run", "n");
    const auto home = cacheHome();

    const auto names = Locator::dirNames(home);
    std::set<std::string> unused(names.begin(), names.end());

    try {
        const auto inUse = Locator().findToolchain(Selector::parse(cfg.data().default_selector), cfg.data());
        unused.erase(inUse.name);
    } catch (const NotFoundError& e) {
        LogRegistry::toolchain()->debug("[purge] Default toolchain not installed: {}", e.what());
    } catch (const ResolutionError& e) {
        LogRegistry::toolchain()->debug("[purge] Default toolchain unresolved: {}", e.what());
    }
    for (const auto& [alias, version] : cfg.data().aliases) unused.erase(version);

    std::string out;
    for (const auto& name : unused) {
        const auto path = home / name;
        fmt::format_to(std::back_inserter(out), "{} => {}\n", name, path.string());
        if (dryRun) continue;

        std::error_code ec;
        fs::remove_all(path, ec);
        if (ec) throw FilesystemError(fmt::format("failed to recursively delete toolchain at {}: {}",
                                                  path.string(), ec.message()), path);
        LogRegistry::toolchain()->info("[purge] Deleted {}", path.string());
    }
    return ok(out);
}

void registerToolchainCommands(const std::shared_ptr<Router>& r) {
    r->registerCommand(PawupUsage::show(), handle_show);
    r->registerCommand(PawupUsage::remove(), handle_remove);
    r->registerCommand(PawupUsage::purge(), handle_purge);
}

}
