#pragma once

#include <filesystem>
#include <optional>
#include <string_view>

namespace pawup::paths {

constexpr const auto* HOME_DIR = "pawup";
constexpr const auto* TOOLCHAINS_DIR = "toolchains";
constexpr const auto* CONFIG_FILE = "config.yaml";

constexpr const auto* ENV_CONFIG_HOME = "PAWUP_CONFIG_HOME";
constexpr const auto* ENV_TOOLCHAIN_HOME = "PAWUP_TOOLCHAIN_HOME";
constexpr const auto* ENV_CUSTOM_TOOLCHAIN_HOME = "PAWUP_CUSTOM_TOOLCHAIN_HOME";

// Per-user platform directories (XDG on Linux, Known Folders via env on Windows,
// ~/Library on macOS). Empty when the home directory cannot be determined.
std::optional<std::filesystem::path> configDir();
std::optional<std::filesystem::path> dataDir();
std::optional<std::filesystem::path> cacheDir();

/// <base>/pawup/toolchains
std::filesystem::path toolchainHomeUnder(const std::filesystem::path& base);

/// Toolchains fetched from the remote server live here ("cache" root).
std::optional<std::filesystem::path> toolchainHome();

/// Hand-installed toolchains, searched before the cache root ("custom" root).
std::optional<std::filesystem::path> customToolchainHome();

std::optional<std::filesystem::path> configPath();

/// True if `name` is a single normal path component: not empty, "." or "..", and free of
/// '/' and '\\'. Toolchain directory names must pass this before they are joined to a root.
[[nodiscard]] bool isPlainComponent(std::string_view name);

/// Default directory for the rotating log file.
std::optional<std::filesystem::path> logDir();

}
