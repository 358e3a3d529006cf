#include <gtest/gtest.h>
#include "version/Version.hpp"

#include <algorithm>
#include <string>
#include <vector>

using namespace pawup::version;

TEST(VersionTest, PartsSplitOnDots) {
    const auto p = parts("1.12.0.7192");
    ASSERT_EQ(p.size(), 4u);
    EXPECT_EQ(p[0], "1");
    EXPECT_EQ(p[3], "7192");
}

TEST(VersionTest, EmptyVersionHasOneEmptyPart) {
    const auto p = parts("");
    ASSERT_EQ(p.size(), 1u);
    EXPECT_TRUE(p[0].empty());
}

TEST(VersionTest, ComparePartShorterIsSmaller) {
    EXPECT_LT(comparePart("9", "10"), 0);
    EXPECT_GT(comparePart("100", "99"), 0);
    EXPECT_EQ(comparePart("12", "12"), 0);
}

TEST(VersionTest, ComparePartSameLengthIsLexical) {
    EXPECT_LT(comparePart("11", "12"), 0);
    EXPECT_LT(comparePart("ab", "ac"), 0);
}

TEST(VersionTest, ComparePartLeadingZerosAreNotNumeric) {
    // length decides before content
    EXPECT_GT(comparePart("010", "10"), 0);
}

TEST(VersionTest, RelationEqual) {
    EXPECT_EQ(relationTo("1.12.0", "1.12.0"), Relation::Equal);
}

TEST(VersionTest, RelationIsPrefixNotMagnitude) {
    EXPECT_EQ(relationTo("1.9", "1.10"), Relation::Different);
    EXPECT_EQ(relationTo("1.2", "1"), Relation::IsSubVersionOf);
    EXPECT_EQ(relationTo("1", "1.2"), Relation::IsSuperVersionOf);
}

TEST(VersionTest, RelationComparesWholeParts) {
    // "1.1" is not a prefix of "1.12"
    EXPECT_EQ(relationTo("1.12", "1.1"), Relation::Different);
}

TEST(VersionTest, IsSubVersionOf) {
    EXPECT_TRUE(isSubVersionOf("1.12.0.7192", "1.12"));
    EXPECT_TRUE(isSubVersionOf("1.12", "1.12"));
    EXPECT_FALSE(isSubVersionOf("1.12", "1.12.0"));
    EXPECT_FALSE(isSubVersionOf("1.11.0", "1.12"));
}

TEST(VersionTest, VersionOrdOrdersNumerically) {
    EXPECT_LT(versionOrd("1.9", "1.10"), 0);
    EXPECT_GT(versionOrd("1.12.0.7192", "1.12.0.7150"), 0);
    EXPECT_LT(versionOrd("1.11", "1.12"), 0);
}

TEST(VersionTest, VersionOrdTiesPrefixWithRefinement) {
    EXPECT_EQ(versionOrd("1.12", "1.12.0.7192"), 0);
    EXPECT_EQ(versionOrd("1.12.0.7192", "1.12"), 0);
}

TEST(VersionTest, SortingBranchNames) {
    std::vector<std::string> v{"1.10", "1.9", "1.12", "1.11"};
    std::ranges::sort(v, [](const std::string& a, const std::string& b) { return versionLess(a, b); });
    EXPECT_EQ(v, (std::vector<std::string>{"1.9", "1.10", "1.11", "1.12"}));
}

TEST(VersionTest, RelationToString) {
    EXPECT_EQ(to_string(Relation::IsSubVersionOf), "sub-version");
}
