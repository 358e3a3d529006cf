#include "config/ConfigFile.hpp"
#include "error/Errors.hpp"
#include "paths/paths.hpp"
#include "logging/LogRegistry.hpp"

#include <cstdlib>
#include <fmt/core.h>

using namespace pawup::logging;

namespace pawup::config {

ConfigFile ConfigFile::openDefault() {
    const auto path = paths::configPath();
    if (!path) throw error::ConfigError("couldn't get config path");

    namespace fs = std::filesystem;
    std::error_code ec;
    if (!fs::exists(*path, ec)) {
        fs::create_directories(path->parent_path(), ec);
        if (ec) throw error::ConfigError(fmt::format("failed to create config home directory at {}: {}",
                                                     path->parent_path().string(), ec.message()));
        saveConfig(Config{}, *path);
        if (LogRegistry::isInitialized())
            LogRegistry::config()->info("[ConfigFile] Wrote default configuration to {}", path->string());
    }

    return open(*path);
}

ConfigFile ConfigFile::open(const std::filesystem::path& path) {
    return {path, loadConfig(path)};
}

void ConfigFile::setDefault(std::string selector) {
    data_.default_selector = std::move(selector);
}

void ConfigFile::setAlias(const std::string& alias, std::string version) {
    data_.aliases[alias] = std::move(version);
}

void ConfigFile::save() const {
    saveConfig(data_, path_);
    if (LogRegistry::isInitialized())
        LogRegistry::config()->debug("[ConfigFile] Saved {}", path_.string());
}

std::pair<std::string, ToolchainSource> currentToolchain(const Config& cfg) {
    if (const char* env = std::getenv(ENV_TOOLCHAIN); env && *env) return {env, ToolchainSource::Env};
    return {cfg.default_selector, ToolchainSource::Config};
}

}
