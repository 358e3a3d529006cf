#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace pawup::catalog {

// An anchor target on an autoindex page. Autoindex servers mark directories with a
// trailing '/', which is the only classification signal used.
struct DirectoryItem {
    enum class Kind { Directory, File };

    Kind kind;
    std::string href;

    static DirectoryItem fromHref(std::string href);

    [[nodiscard]] bool isDirectory() const { return kind == Kind::Directory; }

    bool operator==(const DirectoryItem&) const = default;
};

/// Every <a href> of an HTML directory listing, in document order. Other markup is ignored
/// and malformed markup is recovered from; anchors without an href are skipped.
/// Throws FormatError only if the parser can't be set up at all.
std::vector<DirectoryItem> parseListing(std::string_view html);

}
