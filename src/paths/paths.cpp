#include "paths/paths.hpp"

#include <cstdlib>
#include <string>

namespace fs = std::filesystem;

namespace pawup::paths {

namespace {

std::optional<fs::path> envPath(const char* name) {
    const char* v = std::getenv(name);
    if (!v || !*v) return std::nullopt;
    return fs::path(v);
}

std::optional<fs::path> userHome() {
#ifdef _WIN32
    return envPath("USERPROFILE");
#else
    return envPath("HOME");
#endif
}

// XDG variables must be absolute to be honoured.
std::optional<fs::path> xdgOr(const char* var, const fs::path& fallback) {
    if (auto p = envPath(var); p && p->is_absolute()) return p;
    if (const auto home = userHome()) return *home / fallback;
    return std::nullopt;
}

std::optional<fs::path> overrideOr(const char* var, const std::optional<fs::path>& platformDir) {
    if (auto p = envPath(var)) return p;
    return platformDir;
}

}

std::optional<fs::path> configDir() {
#if defined(_WIN32)
    return envPath("APPDATA");
#elif defined(__APPLE__)
    if (const auto home = userHome()) return *home / "Library" / "Application Support";
    return std::nullopt;
#else
    return xdgOr("XDG_CONFIG_HOME", ".config");
#endif
}

std::optional<fs::path> dataDir() {
#if defined(_WIN32)
    return envPath("APPDATA");
#elif defined(__APPLE__)
    return configDir();
#else
    return xdgOr("XDG_DATA_HOME", fs::path(".local") / "share");
#endif
}

std::optional<fs::path> cacheDir() {
#if defined(_WIN32)
    return envPath("LOCALAPPDATA");
#elif defined(__APPLE__)
    if (const auto home = userHome()) return *home / "Library" / "Caches";
    return std::nullopt;
#else
    return xdgOr("XDG_CACHE_HOME", ".cache");
#endif
}

fs::path toolchainHomeUnder(const fs::path& base) {
    return base / HOME_DIR / TOOLCHAINS_DIR;
}

std::optional<fs::path> toolchainHome() {
    const auto base = overrideOr(ENV_TOOLCHAIN_HOME, cacheDir());
    if (!base) return std::nullopt;
    return toolchainHomeUnder(*base);
}

std::optional<fs::path> customToolchainHome() {
    const auto base = overrideOr(ENV_CUSTOM_TOOLCHAIN_HOME, dataDir());
    if (!base) return std::nullopt;
    return toolchainHomeUnder(*base);
}

std::optional<fs::path> configPath() {
    const auto base = overrideOr(ENV_CONFIG_HOME, configDir());
    if (!base) return std::nullopt;
    return *base / HOME_DIR / CONFIG_FILE;
}

bool isPlainComponent(const std::string_view name) {
    if (name.empty() || name == "." || name == "..") return false;
    return name.find_first_of("/\\") == std::string_view::npos;
}

std::optional<fs::path> logDir() {
    const auto base = cacheDir();
    if (!base) return std::nullopt;
    return *base / HOME_DIR / "logs";
}

}
