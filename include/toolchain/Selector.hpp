#pragma once

#include "config/Config.hpp"

#include <string>
#include <string_view>

namespace pawup::toolchain {

/// Parsed toolchain selector of the form `':' super_version | alias`.
class Selector {
public:
    enum class Kind { Alias, SuperVersion };

    static constexpr char SUPER_PREFIX = ':';

    static Selector parse(std::string_view text);
    static Selector alias(std::string name) { return {Kind::Alias, std::move(name)}; }
    static Selector superVersion(std::string prefix) { return {Kind::SuperVersion, std::move(prefix)}; }

    /// Alias: the alias table maps the name to exactly `version`.
    /// SuperVersion: `version` is the prefix or one of its refinements.
    [[nodiscard]] bool test(const config::AliasTable& aliases, std::string_view version) const;

    [[nodiscard]] Kind kind() const { return kind_; }
    [[nodiscard]] bool isAlias() const { return kind_ == Kind::Alias; }
    [[nodiscard]] bool isSuperVersion() const { return kind_ == Kind::SuperVersion; }

    /// Alias name or version prefix, without the marker.
    [[nodiscard]] const std::string& value() const { return value_; }

    /// Textual form, marker included.
    [[nodiscard]] std::string str() const;

    bool operator==(const Selector&) const = default;

private:
    Selector(const Kind kind, std::string value) : kind_(kind), value_(std::move(value)) {}

    Kind kind_;
    std::string value_;
};

}
