#include "shell/commands.hpp"
#include "shell/Router.hpp"
#include "shell/helpers.hpp"
#include "shell/usage/PawupUsage.hpp"
#include "config/ConfigFile.hpp"
#include "toolchain/Selector.hpp"

#include <fmt/core.h>
#include <nlohmann/json.hpp>

using namespace pawup::config;
using pawup::toolchain::Selector;

namespace pawup::shell {

static CommandResult handle_config(const CommandCall& call) {
    if (auto bad = checkPositionals(call, 0, 0)) return *bad;

    const auto cfg = ConfigFile::openDefault();
    const nlohmann::json j = cfg.data();

    return ok(fmt::format("@{}\n{}\n", cfg.path().string(), j.dump(2)));
}

static CommandResult handle_default(const CommandCall& call) {
    if (auto bad = checkPositionals(call, 0, 1)) return *bad;

    auto cfg = ConfigFile::openDefault();
    const auto newDefault = positional(call, 0);
    if (!newDefault) return ok(cfg.data().default_selector + "\n");

    const auto old = cfg.data().default_selector;
    if (old != *newDefault) {
        cfg.setDefault(*newDefault);
        cfg.save();
    }
    return ok(fmt::format("{} => {}\n", old, *newDefault));
}

static CommandResult handle_alias(const CommandCall& call) {
    if (auto bad = checkPositionals(call, 1, 2)) return *bad;

    const auto& name = call.positionals[0];
    if (!Selector::parse(name).isAlias()) return fatal(fmt::format("alias name \"{}\" is invalid", name));

    auto cfg = ConfigFile::openDefault();
    if (const auto version = positional(call, 1)) {
        cfg.setAlias(name, *version);
        cfg.save();
        return ok("");
    }

    if (const auto* version = cfg.data().alias(name)) return ok(fmt::format("={}\n", *version));
    return ok("");
}

void registerConfigCommands(const std::shared_ptr<Router>& r) {
    r->registerCommand(PawupUsage::config(), handle_config);
    r->registerCommand(PawupUsage::defaultSelector(), handle_default);
    r->registerCommand(PawupUsage::alias(), handle_alias);
}

}
