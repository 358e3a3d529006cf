#pragma once

#include "catalog/Branch.hpp"
#include "catalog/VersionUrl.hpp"
#include "config/Config.hpp"
#include "toolchain/Selector.hpp"

#include <vector>

namespace pawup::catalog {

constexpr const auto* ALIAS_LATEST = "latest";
constexpr const auto* ALIAS_STABLE = "stable";

/// Maps a selector onto one of the remote branches.
///  - `latest`: the newest branch.
///  - `stable`: the branch before the newest; needs at least two.
///  - other aliases: the first branch the aliased version belongs to.
///  - `:prefix`: the first branch the prefix belongs to.
/// Throws ResolutionError when nothing qualifies.
Branch selectBranch(const std::vector<Branch>& branches, const toolchain::Selector& selector,
                    const config::AliasTable& aliases);

/// Newest downloadable version of `branch` satisfying the selector. Throws ResolutionError.
RelevantUrl selectVersion(const std::vector<RelevantUrl>& urls, const toolchain::Selector& selector,
                          const config::AliasTable& aliases, const Branch& branch);

}
