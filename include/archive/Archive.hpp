#pragma once

#include "io/Reader.hpp"

#include <archive.h>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace pawup::archive {

enum class ArchiveKind { Zip, TarGz };

std::string_view to_string(ArchiveKind kind);

/// Format implied by the URL suffix (".zip", ".tar.gz"); none for anything else.
std::optional<ArchiveKind> kindFromUrl(std::string_view url);

/// kindFromUrl() or FormatError naming the url.
ArchiveKind requireKind(std::string_view url);

class Archive;

// One member of an archive. Its data stays readable until the archive moves on to the next
// entry.
class Entry final : public io::Reader {
public:
    /// Member name exactly as stored; not guaranteed to be valid UTF-8.
    [[nodiscard]] const std::string& rawPath() const { return rawPath_; }
    [[nodiscard]] bool isDirectory() const { return directory_; }

    size_t read(char* buf, size_t len) override;

private:
    friend class Archive;
    Entry(Archive* owner, std::string rawPath, bool directory)
        : owner_(owner), rawPath_(std::move(rawPath)), directory_(directory) {}

    Archive* owner_;
    std::string rawPath_;
    bool directory_;

    // Zip members are read into memory whole on first access.
    std::optional<std::vector<char>> materialized_;
    size_t pos_ = 0;
};

// Read side of a downloaded package.
//  - Zip needs the central directory at the end, so the whole body is buffered first.
//  - Tar over gzip is decoded in one forward pass straight off the reader.
class Archive {
public:
    Archive(ArchiveKind kind, std::unique_ptr<io::Reader> body);
    ~Archive();

    Archive(const Archive&) = delete;
    Archive& operator=(const Archive&) = delete;
    Archive(Archive&&) = delete;
    Archive& operator=(Archive&&) = delete;

    [[nodiscard]] ArchiveKind kind() const;

    /// The following member, or none at the end. Invalidates the previously returned entry.
    /// Throws FormatError on corrupt input and rethrows failures of the underlying reader.
    std::optional<Entry> next();

private:
    friend class Entry;

    struct ZipSource {
        std::vector<char> body;
    };

    struct TarGzSource {
        std::unique_ptr<io::Reader> reader;
        std::vector<char> chunk;
        std::exception_ptr error;
    };

    static la_ssize_t readCallback(struct archive* a, void* self, const void** buf);

    size_t readData(char* buf, size_t len);
    [[noreturn]] void fail(std::string_view what);

    std::variant<ZipSource, TarGzSource> source_;
    struct archive* handle_ = nullptr;
    size_t entries_ = 0;
};

}
