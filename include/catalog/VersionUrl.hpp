#pragma once

#include "toolchain/compiler.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace pawup::catalog {

// URL of a packaged release, named `<product>-<version>-<target>.<ext>`,
// e.g. ".../1.12/sourcemod-1.12.0-git7192-linux.tar.gz".
class VersionUrl {
public:
    explicit VersionUrl(std::string url) : url_(std::move(url)) {}

    [[nodiscard]] const std::string& str() const { return url_; }

    /// Everything after the last '/'.
    [[nodiscard]] std::string_view fileName() const;

    /// "linux" for the example above: after the last '-', up to the first '.'.
    [[nodiscard]] std::optional<std::string_view> target() const;

    /// "1.12.0-git7192" for the example above: between the first and the last '-'.
    [[nodiscard]] std::optional<std::string_view> versionStr() const;

    bool operator==(const VersionUrl&) const = default;

private:
    std::string url_;
};

/// Rewrites a trailing "-git<N>" into a ".<N>" part: "1.12.0-git7192" -> "1.12.0.7192".
std::string normalizeVersion(std::string_view raw);

// A VersionUrl built for the running platform, carrying its normalized version.
class RelevantUrl {
public:
    static constexpr std::string_view LATEST = "latest";

    /// None unless the url targets `platform` and names a real version (not "latest") that is
    /// usable as a directory name.
    static std::optional<RelevantUrl> from(VersionUrl url, std::string_view platform = toolchain::PLATFORM_TARGET);

    [[nodiscard]] const std::string& url() const { return url_.str(); }
    [[nodiscard]] const std::string& version() const { return version_; }

private:
    RelevantUrl(VersionUrl url, std::string version) : url_(std::move(url)), version_(std::move(version)) {}

    VersionUrl url_;
    std::string version_;
};

}
