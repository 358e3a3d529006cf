#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

namespace pawup::error {

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Selector resolved, but nothing matching is installed locally.
class NotFoundError : public Error {
public:
    using Error::Error;
};

class ToolchainNotFound : public NotFoundError {
public:
    enum class Kind { LatestCompatible, Aliased };

    static ToolchainNotFound latestCompatibleWith(const std::string& superVersion);
    static ToolchainNotFound aliased(const std::string& version, const std::string& alias);

    [[nodiscard]] Kind kind() const { return kind_; }
    [[nodiscard]] const std::string& version() const { return version_; }
    [[nodiscard]] const std::string& alias() const { return alias_; }

private:
    ToolchainNotFound(Kind kind, std::string version, std::string alias, const std::string& msg);

    Kind kind_;
    std::string version_, alias_;
};

// No qualifying remote branch/version, or an alias with no version behind it.
class ResolutionError : public Error {
public:
    ResolutionError(const std::string& msg, std::string selector, std::string alias = {});

    [[nodiscard]] const std::string& selector() const { return selector_; }
    [[nodiscard]] const std::string& alias() const { return alias_; }

    static ResolutionError noAliasDefault(const std::string& alias);

private:
    std::string selector_, alias_;
};

class TransferError : public Error {
public:
    TransferError(const std::string& msg, std::string url);
    [[nodiscard]] const std::string& url() const { return url_; }

private:
    std::string url_;
};

class FormatError : public Error {
public:
    using Error::Error;
};

class FilesystemError : public Error {
public:
    FilesystemError(const std::string& msg, std::filesystem::path path);
    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

class ConfigError : public Error {
public:
    using Error::Error;
};

}
