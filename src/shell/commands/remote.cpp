#include "shell/commands.hpp"
#include "shell/InstallPlan.hpp"
#include "shell/Router.hpp"
#include "shell/helpers.hpp"
#include "shell/usage/PawupUsage.hpp"
#include "archive/Installer.hpp"
#include "catalog/BranchSelector.hpp"
#include "catalog/Client.hpp"
#include "config/ConfigFile.hpp"
#include "logging/LogRegistry.hpp"
#include "toolchain/Locator.hpp"

#include <fmt/core.h>
#include <iterator>

using namespace pawup::catalog;
using namespace pawup::config;
using namespace pawup::logging;
using namespace pawup::toolchain;

namespace pawup::shell {

namespace {

const char* yesNo(const bool b) { return b ? "Yes" : "No"; }

void download(std::string& out, const RelevantUrl& remote, const Config& cfg) {
    const auto destination = toolchainDestination(remote.version());
    fmt::format_to(std::back_inserter(out), "Destination: {}\n", destination.string());

    const auto stats = archive::installFromUrl(remote.url(), cfg.source.max_download_size, destination);
    LogRegistry::pawup()->info("[download] Installed {} ({} files)", remote.version(), stats.written);
}

}

static CommandResult handle_update(const CommandCall& call) {
    if (auto bad = checkPositionals(call, 0, 2)) return *bad;

    auto cfg = ConfigFile::openDefault();
    const auto selectorText = positional(call, 0).value_or(cfg.data().default_selector);
    const auto selector = Selector::parse(selectorText);
    const bool redownload = hasSwitch(call, "redownload", "r");

    std::string out;
    const Client client(ClientParams::fromConfig(cfg.data()));
    const auto branch = client.selectBranch(selector, cfg.data().aliases);
    fmt::format_to(std::back_inserter(out), "Remote branch: {}\n", branch.name);

    const auto urls = client.relevantUrls(branch);
    const auto remote = selectVersion(urls, Selector::alias(ALIAS_LATEST), cfg.data().aliases, branch);
    fmt::format_to(std::back_inserter(out), "Remote version: {}\n", remote.version());
    fmt::format_to(std::back_inserter(out), "Remote URL: {}\n", remote.url());

    const Locator locator;
    const auto installed = locator.findLatestToolchainOf(branch.name);
    if (installed) fmt::format_to(std::back_inserter(out), "Installed version: {}\n", installed->name);

    const auto plan = planUpdate({
        .installedLatest = installed ? std::optional(installed->name) : std::nullopt,
        .remoteVersion = remote.version(),
        .remoteInstalled = locator.isInstalled(remote.version()),
        .redownload = redownload,
        .selector = selector,
        .aliasArg = positional(call, 1),
    });
    fmt::format_to(std::back_inserter(out), "Is upgrade: {}\n", yesNo(plan.upgrading));
    fmt::format_to(std::back_inserter(out), "Needs download: {}\n", yesNo(plan.needsDownload));
    if (plan.needsDownload) download(out, remote, cfg.data());

    if (plan.alias) {
        fmt::format_to(std::back_inserter(out), "Alias: {}\n", *plan.alias);
        cfg.setAlias(*plan.alias, remote.version());
    }
    cfg.save();

    return ok(out);
}

static CommandResult handle_install(const CommandCall& call) {
    if (auto bad = checkPositionals(call, 1, 1)) return *bad;

    const auto cfg = ConfigFile::openDefault();
    const auto selector = Selector::parse(call.positionals[0]);
    const bool redownload = hasSwitch(call, "redownload", "r");

    std::string out;
    const Client client(ClientParams::fromConfig(cfg.data()));
    const auto branch = client.selectBranch(selector, cfg.data().aliases);
    fmt::format_to(std::back_inserter(out), "Remote branch: {}\n", branch.name);

    const auto remote = selectVersion(client.relevantUrls(branch), selector, cfg.data().aliases, branch);
    fmt::format_to(std::back_inserter(out), "Remote version: {}\n", remote.version());
    fmt::format_to(std::back_inserter(out), "Remote URL: {}\n", remote.url());

    const auto plan = planInstall(Locator().isInstalled(remote.version()), redownload);
    fmt::format_to(std::back_inserter(out), "Needs download: {}\n", yesNo(plan.needsDownload));
    if (plan.needsDownload) download(out, remote, cfg.data());

    return ok(out);
}

void registerRemoteCommands(const std::shared_ptr<Router>& r) {
    r->registerCommand(PawupUsage::update(), handle_update);
    r->registerCommand(PawupUsage::install(), handle_install);
}

}
