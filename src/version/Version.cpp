#include "version/Version.hpp"

namespace pawup::version {

namespace {

// Lazily walks the parts of a version without allocating.
class PartCursor {
public:
    explicit PartCursor(const std::string_view v) : rest_(v) {}

    bool next(std::string_view& out) {
        if (done_) return false;
        const auto pos = rest_.find(SEPARATOR);
        if (pos == std::string_view::npos) {
            out = rest_;
            done_ = true;
        } else {
            out = rest_.substr(0, pos);
            rest_.remove_prefix(pos + 1);
        }
        return true;
    }

private:
    std::string_view rest_;
    bool done_ = false;
};

}

std::string_view to_string(const Relation r) {
    switch (r) {
        case Relation::Equal: return "equal";
        case Relation::Different: return "different";
        case Relation::IsSubVersionOf: return "sub-version";
        case Relation::IsSuperVersionOf: return "super-version";
    }
    return "unknown";
}

std::vector<std::string_view> parts(const std::string_view version) {
    std::vector<std::string_view> out;
    PartCursor cur(version);
    std::string_view p;
    while (cur.next(p)) out.push_back(p);
    return out;
}

int comparePart(const std::string_view a, const std::string_view b) {
    if (a.size() != b.size()) return a.size() < b.size() ? -1 : 1;
    const int c = a.compare(b);
    return c < 0 ? -1 : (c > 0 ? 1 : 0);
}

Relation relationTo(const std::string_view a, const std::string_view b) {
    PartCursor ac(a), bc(b);
    std::string_view ap, bp;
    while (true) {
        const bool hasA = ac.next(ap);
        const bool hasB = bc.next(bp);
        if (!hasA && !hasB) return Relation::Equal;
        if (hasA && !hasB) return Relation::IsSubVersionOf;
        if (!hasA) return Relation::IsSuperVersionOf;
        if (ap != bp) return Relation::Different;
    }
}

bool isSubVersionOf(const std::string_view a, const std::string_view b) {
    const auto r = relationTo(a, b);
    return r == Relation::Equal || r == Relation::IsSubVersionOf;
}

int versionOrd(const std::string_view a, const std::string_view b) {
    PartCursor ac(a), bc(b);
    std::string_view ap, bp;
    while (ac.next(ap) && bc.next(bp))
        if (const int c = comparePart(ap, bp); c != 0) return c;
    return 0;
}

}
