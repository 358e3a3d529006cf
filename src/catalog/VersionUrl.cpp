#include "catalog/VersionUrl.hpp"
#include "paths/paths.hpp"
#include "version/Version.hpp"

using namespace pawup::catalog;

namespace {
constexpr std::string_view GIT_MARKER = "-git";
}

std::string_view VersionUrl::fileName() const {
    const std::string_view url = url_;
    const auto slash = url.rfind('/');
    return slash == std::string_view::npos ? url : url.substr(slash + 1);
}

std::optional<std::string_view> VersionUrl::target() const {
    const auto name = fileName();
    const auto dash = name.rfind('-');
    if (dash == std::string_view::npos) return std::nullopt;
    const auto suffix = name.substr(dash + 1);
    return suffix.substr(0, suffix.find('.'));
}

std::optional<std::string_view> VersionUrl::versionStr() const {
    const auto name = fileName();
    const auto first = name.find('-');
    if (first == std::string_view::npos) return std::nullopt;
    const auto rest = name.substr(first + 1);
    const auto last = rest.rfind('-');
    if (last == std::string_view::npos) return std::nullopt;
    return rest.substr(0, last);
}

std::string pawup::catalog::normalizeVersion(const std::string_view raw) {
    const auto pos = raw.rfind(GIT_MARKER);
    if (pos == std::string_view::npos) return std::string(raw);

    std::string out(raw.substr(0, pos));
    out += pawup::version::SEPARATOR;
    out += raw.substr(pos + GIT_MARKER.size());
    return out;
}

std::optional<RelevantUrl> RelevantUrl::from(VersionUrl url, const std::string_view platform) {
    const auto target = url.target();
    if (!target || *target != platform) return std::nullopt;

    const auto raw = url.versionStr();
    if (!raw || *raw == LATEST || raw->empty()) return std::nullopt;

    auto version = normalizeVersion(*raw);
    // becomes a directory name under the toolchain root
    if (!paths::isPlainComponent(version)) return std::nullopt;
    return RelevantUrl(std::move(url), std::move(version));
}
