#include "toolchain/Selector.hpp"
#include "version/Version.hpp"

namespace pawup::toolchain {

Selector Selector::parse(const std::string_view text) {
    if (!text.empty() && text.front() == SUPER_PREFIX) return superVersion(std::string(text.substr(1)));
    return alias(std::string(text));
}

bool Selector::test(const config::AliasTable& aliases, const std::string_view version) const {
    if (kind_ == Kind::Alias) {
        const auto it = aliases.find(value_);
        return it != aliases.end() && it->second == version;
    }
    return version::isSubVersionOf(version, value_);
}

std::string Selector::str() const {
    if (kind_ == Kind::SuperVersion) return SUPER_PREFIX + value_;
    return value_;
}

}
