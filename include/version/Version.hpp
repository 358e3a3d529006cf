#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace pawup::version {

constexpr char SEPARATOR = '.';

enum class Relation {
    Equal,              // "1.12.0.7192" vs "1.12.0.7192"
    Different,          // "1.12.0.7192" vs "1.12.0.7150"
    IsSubVersionOf,     // "1.12.0.7192" vs "1.12"
    IsSuperVersionOf    // "1.12" vs "1.12.0.7192"
};

std::string_view to_string(Relation r);

/// Split a version into its dot-delimited parts. Parts never contain the separator; an empty
/// version yields a single empty part.
[[nodiscard]] std::vector<std::string_view> parts(std::string_view version);

/// Orders two parts by (length, then bytes). Matches numeric order only for canonical
/// non-negative integers without leading zeros; anything else falls back to lexical order
/// among parts of the same length.
[[nodiscard]] int comparePart(std::string_view a, std::string_view b);

/// Prefix relation of `a` to `b`. Not a magnitude relation: "1.9" and "1.10" are Different.
[[nodiscard]] Relation relationTo(std::string_view a, std::string_view b);

/// True if `a` equals `b` or refines it ("1.12.0" is a sub-version of "1.12").
[[nodiscard]] bool isSubVersionOf(std::string_view a, std::string_view b);

/// Three-way comparison over the common prefix of parts (<0, 0, >0).
/// A version compares equal to any of its own refinements, so a maximum taken with this
/// ordering is ambiguous among prefix-related candidates.
[[nodiscard]] int versionOrd(std::string_view a, std::string_view b);

[[nodiscard]] inline bool versionLess(std::string_view a, std::string_view b) { return versionOrd(a, b) < 0; }

}
