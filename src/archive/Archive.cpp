#include "archive/Archive.hpp"
#include "error/Errors.hpp"
#include "logging/LogRegistry.hpp"

#include <archive_entry.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fmt/core.h>

using namespace pawup::archive;
using namespace pawup::error;
using namespace pawup::logging;

namespace {
constexpr size_t TAR_CHUNK_SIZE = 64 * 1024;
constexpr size_t ZIP_BLOCK_SIZE = 10240;
}

std::string_view pawup::archive::to_string(const ArchiveKind kind) {
    switch (kind) {
    case ArchiveKind::Zip: return "zip";
    case ArchiveKind::TarGz: return "tar.gz";
    }
    return "unknown";
}

std::optional<ArchiveKind> pawup::archive::kindFromUrl(const std::string_view url) {
    if (url.ends_with(".zip")) return ArchiveKind::Zip;
    if (url.ends_with(".tar.gz")) return ArchiveKind::TarGz;
    return std::nullopt;
}

ArchiveKind pawup::archive::requireKind(const std::string_view url) {
    if (const auto kind = kindFromUrl(url)) return *kind;
    throw FormatError(fmt::format("archive at {} is neither a .zip nor a .tar.gz", url));
}

Archive::Archive(const ArchiveKind kind, std::unique_ptr<io::Reader> body) {
    if (!body) throw FormatError("archive has no body");

    if (kind == ArchiveKind::Zip) source_.emplace<ZipSource>(ZipSource{body->readAll()});
    else source_.emplace<TarGzSource>(TarGzSource{std::move(body), std::vector<char>(TAR_CHUNK_SIZE), nullptr});

    handle_ = archive_read_new();
    if (!handle_) throw FormatError("archive_read_new failed");

    int rc;
    if (auto* zip = std::get_if<ZipSource>(&source_)) {
        archive_read_support_format_zip_seekable(handle_);
        rc = archive_read_open_memory(handle_, zip->body.data(), zip->body.size());
        LogRegistry::archive()->debug("[Archive] Opened zip of {} bytes", zip->body.size());
    } else {
        archive_read_support_filter_gzip(handle_);
        archive_read_support_format_tar(handle_);
        rc = archive_read_open(handle_, this, nullptr, &Archive::readCallback, nullptr);
        LogRegistry::archive()->debug("[Archive] Opened tar.gz stream");
    }

    if (rc != ARCHIVE_OK) {
        try {
            fail("couldn't open archive");
        } catch (...) {
            archive_read_free(handle_);
            throw;
        }
    }
}

Archive::~Archive() {
    if (handle_) archive_read_free(handle_);
}

ArchiveKind Archive::kind() const {
    return std::holds_alternative<ZipSource>(source_) ? ArchiveKind::Zip : ArchiveKind::TarGz;
}

la_ssize_t Archive::readCallback(struct archive* a, void* self, const void** buf) {
    auto& src = std::get<TarGzSource>(static_cast<Archive*>(self)->source_);
    try {
        const size_t n = src.reader->read(src.chunk.data(), src.chunk.size());
        *buf = src.chunk.data();
        return static_cast<la_ssize_t>(n);
    } catch (...) {
        // Rethrown from fail() once libarchive has returned.
        src.error = std::current_exception();
        archive_set_error(a, EIO, "body reader failed");
        return -1;
    }
}

void Archive::fail(const std::string_view what) {
    if (const auto* tar = std::get_if<TarGzSource>(&source_); tar && tar->error)
        std::rethrow_exception(tar->error);

    const char* detail = archive_error_string(handle_);
    throw FormatError(fmt::format("{} ({}): {}", what, to_string(kind()), detail ? detail : "unknown error"));
}

std::optional<Entry> Archive::next() {
    struct archive_entry* e = nullptr;
    int rc;
    do {
        rc = archive_read_next_header(handle_, &e);
    } while (rc == ARCHIVE_RETRY);

    if (rc == ARCHIVE_EOF) {
        LogRegistry::archive()->debug("[Archive] End of archive after {} entries", entries_);
        return std::nullopt;
    }
    if (rc < ARCHIVE_WARN) fail(fmt::format("couldn't read entry #{}", entries_ + 1));
    if (rc == ARCHIVE_WARN)
        LogRegistry::archive()->warn("[Archive] Entry #{}: {}", entries_ + 1,
                                     archive_error_string(handle_) ? archive_error_string(handle_) : "warning");

    ++entries_;

    const char* raw = archive_entry_pathname(e);
    if (!raw) raw = archive_entry_pathname_utf8(e);
    std::string path = raw ? raw : "";

    const bool dir = archive_entry_filetype(e) == AE_IFDIR || (!path.empty() && path.back() == '/');
    return Entry(this, std::move(path), dir);
}

size_t Archive::readData(char* buf, const size_t len) {
    la_ssize_t n;
    do {
        n = archive_read_data(handle_, buf, len);
    } while (n == ARCHIVE_RETRY);

    if (n < 0 && n != ARCHIVE_WARN) fail("couldn't read entry data");
    return n < 0 ? 0 : static_cast<size_t>(n);
}

size_t Entry::read(char* buf, const size_t len) {
    if (owner_->kind() == ArchiveKind::TarGz) return owner_->readData(buf, len);

    if (!materialized_) {
        materialized_.emplace();
        std::vector<char> block(ZIP_BLOCK_SIZE);
        for (size_t n; (n = owner_->readData(block.data(), block.size())) > 0;)
            materialized_->insert(materialized_->end(), block.begin(), block.begin() + static_cast<std::ptrdiff_t>(n));
    }

    const size_t n = std::min(len, materialized_->size() - pos_);
    if (n) std::memcpy(buf, materialized_->data() + pos_, n);
    pos_ += n;
    return n;
}
