#pragma once

#include "catalog/Listing.hpp"
#include "catalog/VersionUrl.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace pawup::catalog {

// A top-level directory of the remote server, named like a version ("1.12").
struct Branch {
    std::string name;

    /// `<root><name>/`; `root` must end in '/'.
    [[nodiscard]] std::string url(std::string_view root) const;

    bool operator==(const Branch&) const = default;
};

/// Directory entries of the root listing, minus absolute links (the parent directory),
/// with the trailing '/' removed and percent-escapes decoded.
std::vector<Branch> branchesFromListing(const std::vector<DirectoryItem>& items);

/// File entries of a branch listing, resolved against `branchUrl`.
std::vector<VersionUrl> versionsFromListing(const std::vector<DirectoryItem>& items, std::string_view branchUrl);

std::string urlDecode(std::string_view text);

}
