#include <gtest/gtest.h>
#include "TestEnv.hpp"
#include "toolchain/Launcher.hpp"

using namespace pawup::toolchain;
using pawup::config::ToolchainSource;
using pawup::error::FilesystemError;
using pawup::error::ToolchainNotFound;

TEST(LauncherTest, ForwardsExitStatus) {
    EXPECT_EQ(runCompiler("/bin/sh", {"-c", "exit 0"}), 0);
    EXPECT_EQ(runCompiler("/bin/sh", {"-c", "exit 7"}), 7);
}

TEST(LauncherTest, PassesArgumentsVerbatim) {
    pawup::test::TempDir tmp;
    const auto out = tmp / "args.txt";
    EXPECT_EQ(runCompiler("/bin/sh", {"-c", "printf '%s|' \"$@\" > \"$0\"", out.string(), "a b", "-i", ""}), 0);
    EXPECT_EQ(pawup::test::readFile(out), "a b|-i||");
}

TEST(LauncherTest, KilledChildReportsSignal) {
    EXPECT_EQ(runCompiler("/bin/sh", {"-c", "kill -9 $$"}), 128 + 9);
}

TEST(LauncherTest, MissingExecutableThrows) {
    pawup::test::TempDir tmp;
    EXPECT_THROW((void)runCompiler(tmp / "spcomp64", {}), FilesystemError);
}

TEST(LauncherTest, DescribeMissingFromEnvironment) {
    const auto msg = describeMissing(ToolchainNotFound::latestCompatibleWith("1.12"), ToolchainSource::Env);
    EXPECT_EQ(msg, "the `PAWUP_TOOLCHAIN` environment variable specifies that a toolchain of the latest version "
                   "compatible with \"1.12\" should be used, but that toolchain is not installed");
}

TEST(LauncherTest, DescribeMissingFromConfigAlias) {
    const auto msg = describeMissing(ToolchainNotFound::aliased("1.11.0.6970", "work"), ToolchainSource::Config);
    EXPECT_EQ(msg, "the Pawup configuration file specifies that a toolchain of version \"1.11.0.6970\" "
                   "(as specified by alias \"work\") should be used, but that toolchain is not installed");
}
