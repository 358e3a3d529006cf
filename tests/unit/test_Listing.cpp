#include <gtest/gtest.h>
#include "catalog/Branch.hpp"
#include "catalog/Listing.hpp"

using namespace pawup::catalog;

namespace {

// Trimmed copy of an Apache autoindex page: unclosed <li>, <img> without a slash,
// and an entity in the title.
constexpr auto ROOT_PAGE = R"(<!DOCTYPE HTML PUBLIC "-//W3C//DTD HTML 3.2 Final//EN">
<html>
 <head>
  <title>Index of /smdrop &amp; friends</title>
 </head>
 <body>
<h1>Index of /smdrop</h1>
<ul><li><a href="/"> Parent Directory</a>
<li><a href="1.10/"> 1.10/</a>
<li><a href="1.11/"> 1.11/</a>
<li><a href="1.12/"> 1.12/</a>
<li><img src="/icons/blank.gif"><a href="README.txt"> README.txt</a>
<li><a name="no-href">anchor without href</a>
</ul>
</body></html>
)";

}

TEST(ListingTest, ExtractsEveryHrefInOrder) {
    const auto items = parseListing(ROOT_PAGE);
    ASSERT_EQ(items.size(), 5u);
    EXPECT_EQ(items[0].href, "/");
    EXPECT_EQ(items[1].href, "1.10/");
    EXPECT_EQ(items[4].href, "README.txt");
}

TEST(ListingTest, TrailingSlashMeansDirectory) {
    EXPECT_TRUE(DirectoryItem::fromHref("1.12/").isDirectory());
    EXPECT_FALSE(DirectoryItem::fromHref("sourcemod-1.12.0-git7192-linux.tar.gz").isDirectory());
    EXPECT_FALSE(DirectoryItem::fromHref("").isDirectory());
}

TEST(ListingTest, UppercaseTagsAndAttributes) {
    const auto items = parseListing(R"(<HTML><BODY><A HREF="1.9/">1.9</A></BODY></HTML>)");
    ASSERT_EQ(items.size(), 1u);
    EXPECT_EQ(items[0].href, "1.9/");
}

TEST(ListingTest, MalformedMarkupIsRecoveredFrom) {
    const auto items = parseListing(R"(<p><a href="a/">a<p><a href="b">b</div></span><a href="c/">)");
    ASSERT_EQ(items.size(), 3u);
    EXPECT_EQ(items[2].href, "c/");
}

TEST(ListingTest, EmptyInputHasNoItems) {
    EXPECT_TRUE(parseListing("").empty());
    EXPECT_TRUE(parseListing("no markup at all").empty());
}

TEST(ListingTest, BranchesSkipParentAndFiles) {
    const auto branches = branchesFromListing(parseListing(ROOT_PAGE));
    ASSERT_EQ(branches.size(), 3u);
    EXPECT_EQ(branches[0].name, "1.10");
    EXPECT_EQ(branches[2].name, "1.12");
}

TEST(ListingTest, BranchNamesAreUrlDecoded) {
    const auto branches = branchesFromListing({DirectoryItem::fromHref("dev%20builds/")});
    ASSERT_EQ(branches.size(), 1u);
    EXPECT_EQ(branches[0].name, "dev builds");
}

TEST(ListingTest, BranchUrl) {
    EXPECT_EQ((Branch{"1.12"}).url("https://sm.alliedmods.net/smdrop/"), "https://sm.alliedmods.net/smdrop/1.12/");
}

TEST(ListingTest, VersionsAreFilesResolvedAgainstBranch) {
    const std::vector items{
        DirectoryItem::fromHref("/smdrop/"),
        DirectoryItem::fromHref("sourcemod-1.12.0-git7192-linux.tar.gz"),
        DirectoryItem::fromHref("sourcemod-latest-linux"),
    };
    const auto versions = versionsFromListing(items, "https://example.org/smdrop/1.12/");
    ASSERT_EQ(versions.size(), 2u);
    EXPECT_EQ(versions[0].str(), "https://example.org/smdrop/1.12/sourcemod-1.12.0-git7192-linux.tar.gz");
    EXPECT_EQ(versions[1].str(), "https://example.org/smdrop/1.12/sourcemod-latest-linux");
}
