#include "error/Errors.hpp"

#include <fmt/core.h>

namespace pawup::error {

ToolchainNotFound::ToolchainNotFound(const Kind kind, std::string version, std::string alias, const std::string& msg)
    : NotFoundError(msg), kind_(kind), version_(std::move(version)), alias_(std::move(alias)) {}

ToolchainNotFound ToolchainNotFound::latestCompatibleWith(const std::string& superVersion) {
    return {Kind::LatestCompatible, superVersion, {},
            fmt::format("latest toolchain compatible with version {} was not found", superVersion)};
}

ToolchainNotFound ToolchainNotFound::aliased(const std::string& version, const std::string& alias) {
    return {Kind::Aliased, version, alias,
            fmt::format("version {} (as specified by alias \"{}\") was not found", version, alias)};
}

ResolutionError::ResolutionError(const std::string& msg, std::string selector, std::string alias)
    : Error(msg), selector_(std::move(selector)), alias_(std::move(alias)) {}

ResolutionError ResolutionError::noAliasDefault(const std::string& alias) {
    return {fmt::format("alias \"{}\" has no default version set", alias), alias, alias};
}

TransferError::TransferError(const std::string& msg, std::string url)
    : Error(msg), url_(std::move(url)) {}

FilesystemError::FilesystemError(const std::string& msg, std::filesystem::path path)
    : Error(msg), path_(std::move(path)) {}

}
