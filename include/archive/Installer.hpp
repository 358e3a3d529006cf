#pragma once

#include "archive/Archive.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace pawup::archive {

// Subtree of a SourceMod package that holds the compiler and its include files.
constexpr std::string_view TOOLCHAIN_ROOT = "addons/sourcemod/scripting/";
constexpr const auto* INCLUDE_DIR = "include";

[[nodiscard]] bool isValidUtf8(std::string_view text);

/// Path of a package member relative to TOOLCHAIN_ROOT, lexically normalized. None if the
/// member lies outside that root, is the root itself, or would escape it.
std::optional<std::filesystem::path> mapToToolchainRoot(std::string_view memberPath);

/// True for files under include/ and for the compiler executable.
[[nodiscard]] bool isToolchainFile(const std::filesystem::path& relative);

/// Combined filter: UTF-8, root mapping and toolchain membership.
std::optional<std::filesystem::path> toolchainPathFor(std::string_view rawPath);

struct InstallStats {
    size_t written = 0;
    size_t skipped = 0;
    uintmax_t bytes = 0;
};

/// Writes every toolchain file of `archive` below `destination`. Stops at the first I/O
/// failure with FilesystemError; files already written stay in place.
InstallStats extractToolchain(Archive& archive, const std::filesystem::path& destination);

/// Downloads `url` (at most `maxBytes` of body) and extracts it into `destination`.
/// The format is checked before anything is transferred.
InstallStats installFromUrl(const std::string& url, uintmax_t maxBytes, const std::filesystem::path& destination);

}
