#pragma once

#include "archive/Archive.hpp"

#include <archive.h>
#include <archive_entry.h>
#include <stdexcept>
#include <string>
#include <vector>

namespace pawup::test {

struct FixtureEntry {
    std::string path;
    std::string content;
    bool directory = false;
};

// Packs `entries` into an in-memory zip or tar.gz with libarchive's writer.
inline std::vector<char> buildArchive(const archive::ArchiveKind kind, const std::vector<FixtureEntry>& entries) {
    std::vector<char> buf(4 * 1024 * 1024);
    size_t used = 0;

    struct archive* a = archive_write_new();
    if (kind == archive::ArchiveKind::Zip) {
        archive_write_set_format_zip(a);
    } else {
        archive_write_set_format_gnutar(a);
        archive_write_add_filter_gzip(a);
    }
    if (archive_write_open_memory(a, buf.data(), buf.size(), &used) != ARCHIVE_OK) {
        archive_write_free(a);
        throw std::runtime_error("archive_write_open_memory failed");
    }

    for (const auto& e : entries) {
        struct archive_entry* entry = archive_entry_new();
        archive_entry_set_pathname(entry, e.path.c_str());
        archive_entry_set_filetype(entry, e.directory ? AE_IFDIR : AE_IFREG);
        archive_entry_set_perm(entry, e.directory ? 0755 : 0644);
        archive_entry_set_size(entry, e.directory ? 0 : static_cast<la_int64_t>(e.content.size()));
        archive_write_header(a, entry);
        if (!e.directory && !e.content.empty()) archive_write_data(a, e.content.data(), e.content.size());
        archive_entry_free(entry);
    }

    archive_write_close(a);
    archive_write_free(a);
    buf.resize(used);
    return buf;
}

}
