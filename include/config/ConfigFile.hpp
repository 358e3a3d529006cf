#pragma once

#include "config/Config.hpp"

#include <filesystem>
#include <string>
#include <utility>

namespace pawup::config {

enum class ToolchainSource { Env, Config };

constexpr const auto* ENV_TOOLCHAIN = "PAWUP_TOOLCHAIN";

// An opened configuration file: its path plus the parsed data. Each command opens its own.
class ConfigFile {
public:
    ConfigFile(std::filesystem::path path, Config data) : path_(std::move(path)), data_(std::move(data)) {}

    /// Opens the file at paths::configPath(), writing the defaults first if it doesn't exist.
    static ConfigFile openDefault();
    static ConfigFile open(const std::filesystem::path& path);

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }
    [[nodiscard]] const Config& data() const { return data_; }

    void setDefault(std::string selector);
    void setAlias(const std::string& alias, std::string version);

    void save() const;

private:
    std::filesystem::path path_;
    Config data_;
};

/// Selector the proxy should use: $PAWUP_TOOLCHAIN if set, the configured default otherwise.
std::pair<std::string, ToolchainSource> currentToolchain(const Config& cfg);

}
