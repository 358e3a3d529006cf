#pragma once

#include "catalog/Branch.hpp"
#include "catalog/Listing.hpp"
#include "catalog/VersionUrl.hpp"
#include "config/Config.hpp"
#include "toolchain/Selector.hpp"

#include <string>
#include <vector>

namespace pawup::catalog {

struct ClientParams {
    std::string root_url = config::DEFAULT_ROOT_URL;

    static ClientParams fromConfig(const config::Config& cfg);
};

// Reads the release tree of an autoindex file server: branches at the root, packaged
// releases one level below. Every call is a fresh GET; nothing is cached.
class Client {
public:
    /// Throws ConfigError if the root URL doesn't end in '/'.
    explicit Client(ClientParams params);

    [[nodiscard]] const std::string& rootUrl() const { return params_.root_url; }

    [[nodiscard]] std::vector<Branch> branches() const;
    [[nodiscard]] std::vector<VersionUrl> versions(const Branch& branch) const;

    /// versions() narrowed to this platform, with normalized version strings.
    [[nodiscard]] std::vector<RelevantUrl> relevantUrls(const Branch& branch) const;

    /// selectBranch() over a freshly fetched branch list.
    [[nodiscard]] Branch selectBranch(const toolchain::Selector& selector, const config::AliasTable& aliases) const;

private:
    [[nodiscard]] std::vector<DirectoryItem> fetchListing(const std::string& url) const;

    ClientParams params_;
};

}
