#include "catalog/Client.hpp"
#include "catalog/BranchSelector.hpp"
#include "error/Errors.hpp"
#include "http/curlWrappers.hpp"
#include "logging/LogRegistry.hpp"

#include <fmt/core.h>

using namespace pawup::catalog;
using namespace pawup::error;
using namespace pawup::http;
using namespace pawup::logging;

ClientParams ClientParams::fromConfig(const config::Config& cfg) {
    return {cfg.source.root_url};
}

Client::Client(ClientParams params) : params_(std::move(params)) {
    if (params_.root_url.empty() || params_.root_url.back() != '/')
        throw ConfigError(fmt::format("source root URL '{}' must end with '/'", params_.root_url));
}

std::vector<DirectoryItem> Client::fetchListing(const std::string& url) const {
    LogRegistry::catalog()->debug("[Client] Fetching listing {}", url);

    const auto res = performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_HTTPGET, 1L);
    });

    if (!res.ok()) {
        LogRegistry::catalog()->error("[Client] GET {} failed: curl={}, http={}, {}", url,
                                      static_cast<int>(res.curl), res.http, res.error);
        if (res.curl == CURLE_OK)
            throw TransferError(fmt::format("failed to fetch {}: HTTP {}", url, res.http), url);
        throw TransferError(fmt::format("failed to fetch {}: {}", url, res.error), url);
    }

    return parseListing(res.body);
}

std::vector<Branch> Client::branches() const {
    try {
        auto out = branchesFromListing(fetchListing(params_.root_url));
        LogRegistry::catalog()->info("[Client] {} branches at {}", out.size(), params_.root_url);
        return out;
    } catch (const TransferError& e) {
        throw TransferError(fmt::format("couldn't fetch branches: {}", e.what()), e.url());
    }
}

std::vector<VersionUrl> Client::versions(const Branch& branch) const {
    const auto url = branch.url(params_.root_url);
    try {
        return versionsFromListing(fetchListing(url), url);
    } catch (const TransferError& e) {
        throw TransferError(fmt::format("couldn't fetch versions for branch '{}': {}", branch.name, e.what()), e.url());
    }
}

std::vector<RelevantUrl> Client::relevantUrls(const Branch& branch) const {
    std::vector<RelevantUrl> out;
    for (auto& v : versions(branch))
        if (auto r = RelevantUrl::from(std::move(v))) out.push_back(std::move(*r));
    LogRegistry::catalog()->debug("[Client] {} releases for {} in branch {}", out.size(),
                                  toolchain::PLATFORM_TARGET, branch.name);
    return out;
}

Branch Client::selectBranch(const toolchain::Selector& selector, const config::AliasTable& aliases) const {
    return catalog::selectBranch(branches(), selector, aliases);
}
