#include "archive/Installer.hpp"
#include "error/Errors.hpp"
#include "http/BodyReader.hpp"
#include "logging/LogRegistry.hpp"
#include "toolchain/compiler.hpp"

#include <fmt/core.h>
#include <cstdint>
#include <fstream>
#include <system_error>
#include <vector>

using namespace pawup::archive;
using namespace pawup::error;
using namespace pawup::logging;

namespace fs = std::filesystem;

namespace {

constexpr size_t COPY_BUFFER_SIZE = 64 * 1024;

void writeEntry(Entry& entry, const fs::path& target, InstallStats& stats) {
    std::error_code ec;
    fs::create_directories(target.parent_path(), ec);
    if (ec) throw FilesystemError(fmt::format("failed to create directory {}: {}",
                                              target.parent_path().string(), ec.message()), target.parent_path());

    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out) throw FilesystemError(fmt::format("failed to open {} for writing", target.string()), target);

    std::vector<char> buf(COPY_BUFFER_SIZE);
    for (size_t n; (n = entry.read(buf.data(), buf.size())) > 0;) {
        out.write(buf.data(), static_cast<std::streamsize>(n));
        if (!out) throw FilesystemError(fmt::format("failed to write {}", target.string()), target);
        stats.bytes += n;
    }
    out.close();
    if (!out) throw FilesystemError(fmt::format("failed to write {}", target.string()), target);

#ifndef _WIN32
    if (pawup::toolchain::isCompiler(target.filename().string())) {
        fs::permissions(target, fs::perms::all, fs::perm_options::replace, ec);
        if (ec) throw FilesystemError(fmt::format("failed to make {} executable: {}", target.string(), ec.message()),
                                      target);
    }
#endif
}

}

bool pawup::archive::isValidUtf8(const std::string_view text) {
    size_t i = 0;
    while (i < text.size()) {
        const auto c = static_cast<unsigned char>(text[i]);
        size_t len;
        uint32_t cp;
        if (c < 0x80) { ++i; continue; }
        if ((c & 0xE0) == 0xC0) { len = 2; cp = c & 0x1F; }
        else if ((c & 0xF0) == 0xE0) { len = 3; cp = c & 0x0F; }
        else if ((c & 0xF8) == 0xF0) { len = 4; cp = c & 0x07; }
        else return false;

        if (i + len > text.size()) return false;
        for (size_t k = 1; k < len; ++k) {
            const auto cc = static_cast<unsigned char>(text[i + k]);
            if ((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }

        // overlong forms, surrogates, out of range
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000)) return false;
        if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return false;
        i += len;
    }
    return true;
}

std::optional<fs::path> pawup::archive::mapToToolchainRoot(const std::string_view memberPath) {
    if (!memberPath.starts_with(TOOLCHAIN_ROOT)) return std::nullopt;

    const auto rest = memberPath.substr(TOOLCHAIN_ROOT.size());
    if (rest.empty()) return std::nullopt;

    const auto clean = fs::path(std::string(rest)).lexically_normal();
    if (clean.empty() || clean.is_absolute() || clean.has_root_name() || clean.has_root_directory())
        return std::nullopt;

    const auto first = *clean.begin();
    if (first == "." || first == "..") return std::nullopt;
    return clean;
}

bool pawup::archive::isToolchainFile(const fs::path& relative) {
    if (!relative.empty() && *relative.begin() == INCLUDE_DIR) return true;
    return toolchain::isCompiler(relative.filename().string());
}

std::optional<fs::path> pawup::archive::toolchainPathFor(const std::string_view rawPath) {
    if (!isValidUtf8(rawPath)) return std::nullopt;
    auto mapped = mapToToolchainRoot(rawPath);
    if (!mapped || !isToolchainFile(*mapped)) return std::nullopt;
    return mapped;
}

InstallStats pawup::archive::extractToolchain(Archive& archive, const fs::path& destination) {
    InstallStats stats;

    while (auto entry = archive.next()) {
        const auto relative = toolchainPathFor(entry->rawPath());
        if (!relative || entry->isDirectory()) {
            ++stats.skipped;
            continue;
        }

        const auto target = destination / *relative;
        LogRegistry::archive()->trace("[Installer] {} -> {}", entry->rawPath(), target.string());
        writeEntry(*entry, target, stats);
        ++stats.written;
    }

    LogRegistry::archive()->info("[Installer] Wrote {} files ({} bytes) to {}, skipped {} entries",
                                 stats.written, stats.bytes, destination.string(), stats.skipped);
    return stats;
}

InstallStats pawup::archive::installFromUrl(const std::string& url, const uintmax_t maxBytes,
                                            const fs::path& destination) {
    const auto kind = requireKind(url);
    LogRegistry::archive()->info("[Installer] Installing {} ({}) into {}", url, to_string(kind), destination.string());

    Archive archive(kind, std::make_unique<http::BodyReader>(url, maxBytes));
    return extractToolchain(archive, destination);
}
