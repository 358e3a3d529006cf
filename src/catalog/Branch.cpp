#include "catalog/Branch.hpp"
#include "http/curlWrappers.hpp"

#include <climits>

using namespace pawup::catalog;

std::string Branch::url(const std::string_view root) const {
    std::string out(root);
    out += name;
    out += '/';
    return out;
}

std::string pawup::catalog::urlDecode(const std::string_view text) {
    if (text.find('%') == std::string_view::npos || text.size() > INT_MAX) return std::string(text);

    http::CurlEasy h;
    int len = 0;
    char* decoded = curl_easy_unescape(h, text.data(), static_cast<int>(text.size()), &len);
    if (!decoded) return std::string(text);
    std::string out(decoded, static_cast<size_t>(len));
    curl_free(decoded);
    return out;
}

std::vector<Branch> pawup::catalog::branchesFromListing(const std::vector<DirectoryItem>& items) {
    std::vector<Branch> out;
    for (const auto& item : items) {
        if (!item.isDirectory() || item.href.starts_with('/')) continue;
        const std::string_view href(item.href);
        auto name = urlDecode(href.substr(0, href.size() - 1));
        if (name.empty()) continue;
        out.push_back({std::move(name)});
    }
    return out;
}

std::vector<VersionUrl> pawup::catalog::versionsFromListing(const std::vector<DirectoryItem>& items,
                                                            const std::string_view branchUrl) {
    std::vector<VersionUrl> out;
    for (const auto& item : items) {
        if (item.isDirectory()) continue;
        out.emplace_back(std::string(branchUrl) + item.href);
    }
    return out;
}
