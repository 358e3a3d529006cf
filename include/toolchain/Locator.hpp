#pragma once

#include "config/Config.hpp"
#include "toolchain/Selector.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pawup::toolchain {

// The two roots toolchains are installed under, in search order.
struct ToolchainHomes {
    std::optional<std::filesystem::path> custom;   // explicit override, else per-user data dir
    std::optional<std::filesystem::path> cache;    // explicit override, else per-user cache dir

    static ToolchainHomes fromEnvironment();

    /// Roots that could be determined, custom first.
    [[nodiscard]] std::vector<std::filesystem::path> ranked() const;
};

struct FoundToolchain {
    std::string name;
    std::filesystem::path home;

    [[nodiscard]] std::filesystem::path path() const { return home / name; }
};

struct InstalledRoot {
    std::filesystem::path home;
    std::vector<std::string> names;
    bool exists = false;
};

class Locator {
public:
    explicit Locator(ToolchainHomes homes = ToolchainHomes::fromEnvironment());

    /// `<custom>/<version>` if present, otherwise `<cache>/<version>`. The first root holding
    /// the version wins even when both do. Names that aren't a single path component never match.
    [[nodiscard]] std::optional<std::filesystem::path> findToolchainPath(const std::string& version) const;

    /// Newest installed toolchain that is `superVersion` or a refinement of it, pooled across
    /// both roots. Roots that are missing or unreadable are skipped. Candidates that compare
    /// equal under versionOrd (a version and its refinements) resolve to the last one seen.
    [[nodiscard]] std::optional<FoundToolchain> findLatestToolchainOf(std::string_view superVersion) const;

    [[nodiscard]] bool isInstalled(const std::string& version) const;

    /// Throws ToolchainNotFound, or ResolutionError for an alias with no version set.
    [[nodiscard]] FoundToolchain findToolchain(const Selector& selector, const config::Config& cfg) const;

    /// Installed toolchains per root, custom first.
    [[nodiscard]] std::vector<InstalledRoot> installedToolchains() const;

    [[nodiscard]] const ToolchainHomes& homes() const { return homes_; }

    /// Names of subdirectories of `dir`; empty if `dir` doesn't exist.
    /// Throws FilesystemError if it exists but can't be read.
    static std::vector<std::string> dirNames(const std::filesystem::path& dir);

private:
    ToolchainHomes homes_;

    /// Root holding `<root>/<version>`, custom first.
    [[nodiscard]] std::optional<std::filesystem::path> homeOf(const std::string& version) const;
};

}
