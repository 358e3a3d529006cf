#include <gtest/gtest.h>
#include "archive/Installer.hpp"
#include "toolchain/compiler.hpp"

namespace fs = std::filesystem;
using namespace pawup::archive;

namespace {
const std::string ROOT(TOOLCHAIN_ROOT);
}

TEST(InstallFilterTest, Utf8Validation) {
    EXPECT_TRUE(isValidUtf8("addons/sourcemod/scripting/include/sourcemod.inc"));
    EXPECT_TRUE(isValidUtf8("caf\xC3\xA9/\xE2\x82\xAC/\xF0\x9F\x98\x80"));
    EXPECT_FALSE(isValidUtf8("bad\xFF"));
    EXPECT_FALSE(isValidUtf8("truncated\xE2\x82"));
    EXPECT_FALSE(isValidUtf8("overlong\xC0\xAF"));
    EXPECT_FALSE(isValidUtf8("surrogate\xED\xA0\x80"));
}

TEST(InstallFilterTest, MapStripsRoot) {
    EXPECT_EQ(mapToToolchainRoot(ROOT + "include/sourcemod.inc"), fs::path("include/sourcemod.inc"));
}

TEST(InstallFilterTest, MapRejectsOutsideRoot) {
    EXPECT_FALSE(mapToToolchainRoot("addons/sourcemod/plugins/basechat.smx").has_value());
    EXPECT_FALSE(mapToToolchainRoot("addons/sourcemod/scripting").has_value());
}

TEST(InstallFilterTest, MapRejectsRootItself) {
    EXPECT_FALSE(mapToToolchainRoot(ROOT).has_value());
}

TEST(InstallFilterTest, MapNormalizesRedundantParts) {
    EXPECT_EQ(mapToToolchainRoot(ROOT + "include/./x/../admin.inc"), fs::path("include/admin.inc"));
    EXPECT_EQ(mapToToolchainRoot(ROOT + "include//admin.inc"), fs::path("include/admin.inc"));
}

TEST(InstallFilterTest, MapRejectsTraversal) {
    EXPECT_FALSE(mapToToolchainRoot(ROOT + "../../../etc/passwd").has_value());
    EXPECT_FALSE(mapToToolchainRoot(ROOT + "include/../../evil.inc").has_value());
    EXPECT_FALSE(mapToToolchainRoot(ROOT + "..").has_value());
    EXPECT_FALSE(mapToToolchainRoot(ROOT + ".").has_value());
}

TEST(InstallFilterTest, MapRejectsAbsolute) {
    EXPECT_FALSE(mapToToolchainRoot(ROOT + "/etc/passwd").has_value());
}

TEST(InstallFilterTest, ToolchainFiles) {
    EXPECT_TRUE(isToolchainFile("include/sourcemod.inc"));
    EXPECT_TRUE(isToolchainFile("include/sdktools/trace.inc"));
    EXPECT_TRUE(isToolchainFile(std::string(pawup::toolchain::COMPILER_EXE)));
    EXPECT_FALSE(isToolchainFile("compile.sh"));
    EXPECT_FALSE(isToolchainFile("admin-flatfile.sp"));
    EXPECT_FALSE(isToolchainFile("includes/sourcemod.inc"));
}

TEST(InstallFilterTest, CombinedFilter) {
    EXPECT_EQ(toolchainPathFor(ROOT + "include/core.inc"), fs::path("include/core.inc"));
    EXPECT_FALSE(toolchainPathFor(ROOT + "include/\xFF.inc").has_value());
    EXPECT_FALSE(toolchainPathFor(ROOT + "testsuite/foo.sp").has_value());
    EXPECT_FALSE(toolchainPathFor("cfg/sourcemod.cfg").has_value());
}
