#include "toolchain/Locator.hpp"
#include "version/Version.hpp"
#include "paths/paths.hpp"
#include "error/Errors.hpp"
#include "logging/LogRegistry.hpp"

#include <fmt/core.h>

namespace fs = std::filesystem;

using namespace pawup::toolchain;
using namespace pawup::logging;
using namespace pawup::error;

ToolchainHomes ToolchainHomes::fromEnvironment() {
    return {paths::customToolchainHome(), paths::toolchainHome()};
}

std::vector<fs::path> ToolchainHomes::ranked() const {
    std::vector<fs::path> out;
    if (custom) out.push_back(*custom);
    if (cache) out.push_back(*cache);
    return out;
}

Locator::Locator(ToolchainHomes homes) : homes_(std::move(homes)) {}

std::vector<std::string> Locator::dirNames(const fs::path& dir) {
    std::error_code ec;
    if (!fs::exists(dir, ec)) return {};

    fs::directory_iterator it(dir, ec);
    if (ec) throw FilesystemError(fmt::format("couldn't read {}: {}", dir.string(), ec.message()), dir);

    std::vector<std::string> names;
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        std::error_code typeEc;
        if (it->is_directory(typeEc)) names.push_back(it->path().filename().string());
    }
    if (ec) throw FilesystemError(fmt::format("encountered error while iterating over {}: {}",
                                              dir.string(), ec.message()), dir);
    return names;
}

std::optional<fs::path> Locator::homeOf(const std::string& version) const {
    if (!paths::isPlainComponent(version)) return std::nullopt;
    for (const auto& home : homes_.ranked()) {
        std::error_code ec;
        if (fs::is_directory(home / version, ec)) return home;
    }
    return std::nullopt;
}

std::optional<fs::path> Locator::findToolchainPath(const std::string& version) const {
    if (auto home = homeOf(version)) return *home / version;
    return std::nullopt;
}

std::optional<FoundToolchain> Locator::findLatestToolchainOf(const std::string_view superVersion) const {
    std::optional<FoundToolchain> best;

    for (const auto& home : homes_.ranked()) {
        std::vector<std::string> names;
        try {
            names = dirNames(home);
        } catch (const FilesystemError& e) {
            LogRegistry::toolchain()->debug("[Locator] Skipping unreadable root: {}", e.what());
            continue;
        }

        for (auto& name : names) {
            if (!version::isSubVersionOf(name, superVersion)) continue;
            if (!best || version::versionOrd(name, best->name) >= 0)
                best = FoundToolchain{std::move(name), home};
        }
    }

    if (best) LogRegistry::toolchain()->debug("[Locator] Latest of {} is {} in {}",
                                              superVersion, best->name, best->home.string());
    return best;
}

bool Locator::isInstalled(const std::string& version) const {
    return findToolchainPath(version).has_value();
}

FoundToolchain Locator::findToolchain(const Selector& selector, const config::Config& cfg) const {
    if (selector.isSuperVersion()) {
        auto found = findLatestToolchainOf(selector.value());
        if (!found) throw ToolchainNotFound::latestCompatibleWith(selector.value());
        return *found;
    }

    const auto* version = cfg.alias(selector.value());
    if (!version) throw ResolutionError::noAliasDefault(selector.value());

    auto home = homeOf(*version);
    if (!home) throw ToolchainNotFound::aliased(*version, selector.value());
    return {*version, std::move(*home)};
}

std::vector<InstalledRoot> Locator::installedToolchains() const {
    std::vector<InstalledRoot> out;
    for (const auto& home : homes_.ranked()) {
        std::error_code ec;
        InstalledRoot root{home, {}, fs::is_directory(home, ec)};
        if (root.exists) root.names = dirNames(home);
        out.push_back(std::move(root));
    }
    return out;
}
