#include "catalog/BranchSelector.hpp"
#include "error/Errors.hpp"
#include "logging/LogRegistry.hpp"
#include "version/Version.hpp"

#include <algorithm>
#include <fmt/core.h>

using namespace pawup::catalog;
using namespace pawup::error;
using namespace pawup::logging;
using pawup::toolchain::Selector;

namespace {

// Last element with the greatest versionOrd key. Prefix-related keys compare equal, so
// the result among them depends on input order.
template <typename It, typename Key>
It lastMax(It begin, It end, Key key) {
    auto best = begin;
    for (auto it = begin; it != end; ++it)
        if (pawup::version::versionOrd(key(*it), key(*best)) >= 0) best = it;
    return best;
}

const std::string& aliasedVersion(const Selector& selector, const pawup::config::AliasTable& aliases) {
    const auto it = aliases.find(selector.value());
    if (it == aliases.end()) throw ResolutionError::noAliasDefault(selector.value());
    return it->second;
}

}

Branch pawup::catalog::selectBranch(const std::vector<Branch>& branches, const Selector& selector,
                                    const config::AliasTable& aliases) {
    const auto name = [](const Branch& b) -> const std::string& { return b.name; };

    if (selector.isAlias() && selector.value() == ALIAS_LATEST) {
        if (branches.empty()) throw ResolutionError("couldn't select latest branch", selector.str());
        return *lastMax(branches.begin(), branches.end(), name);
    }

    if (selector.isAlias() && selector.value() == ALIAS_STABLE) {
        if (branches.size() < 2) throw ResolutionError("couldn't select latest stable branch", selector.str());
        auto sorted = branches;
        std::ranges::stable_sort(sorted, [](const Branch& a, const Branch& b) {
            return version::versionLess(a.name, b.name);
        });
        return sorted[sorted.size() - 2];
    }

    const std::string& wanted = selector.isAlias() ? aliasedVersion(selector, aliases) : selector.value();
    const auto it = std::ranges::find_if(branches, [&wanted](const Branch& b) {
        return version::isSubVersionOf(wanted, b.name);
    });
    if (it == branches.end()) {
        if (selector.isAlias())
            throw ResolutionError(fmt::format("couldn't find a branch for version '{}' of alias '{}'",
                                              wanted, selector.value()), selector.str(), selector.value());
        throw ResolutionError(fmt::format("couldn't select branch with selector '{}'", selector.str()),
                              selector.str());
    }

    LogRegistry::catalog()->debug("[BranchSelector] {} -> branch {}", selector.str(), it->name);
    return *it;
}

RelevantUrl pawup::catalog::selectVersion(const std::vector<RelevantUrl>& urls, const Selector& selector,
                                          const config::AliasTable& aliases, const Branch& branch) {
    std::vector<const RelevantUrl*> candidates;
    candidates.reserve(urls.size());

    const bool newest = selector.isAlias() && (selector.value() == ALIAS_LATEST || selector.value() == ALIAS_STABLE);
    if (newest) {
        for (const auto& u : urls) candidates.push_back(&u);
    } else {
        const std::string& prefix = selector.isAlias() ? aliasedVersion(selector, aliases) : selector.value();
        for (const auto& u : urls)
            if (version::isSubVersionOf(u.version(), prefix)) candidates.push_back(&u);
    }

    if (candidates.empty()) {
        if (newest)
            throw ResolutionError(fmt::format("received no versions for branch '{}'", branch.name), selector.str());
        throw ResolutionError(fmt::format("couldn't find version '{}' in branch '{}'", selector.str(), branch.name),
                              selector.str(), selector.isAlias() ? selector.value() : std::string{});
    }

    const auto best = lastMax(candidates.begin(), candidates.end(),
                               [](const RelevantUrl* u) -> const std::string& { return u->version(); });
    LogRegistry::catalog()->debug("[BranchSelector] {} in {} -> {}", selector.str(), branch.name, (*best)->version());
    return **best;
}
