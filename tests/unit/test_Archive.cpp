#include <gtest/gtest.h>
#include "ArchiveFixtures.hpp"
#include "TestEnv.hpp"
#include "archive/Archive.hpp"
#include "archive/Installer.hpp"
#include "error/Errors.hpp"
#include "toolchain/compiler.hpp"

#include <map>

namespace fs = std::filesystem;
using namespace pawup::archive;
using namespace pawup::error;
using pawup::test::FixtureEntry;
using pawup::test::TempDir;

namespace {

const std::string ROOT(TOOLCHAIN_ROOT);
const std::string COMPILER(pawup::toolchain::COMPILER_EXE);

std::vector<FixtureEntry> sourcemodPackage() {
    return {
        {"addons/", "", true},
        {"addons/sourcemod/plugins/basechat.smx", "smx"},
        {ROOT, "", true},
        {ROOT + "include/", "", true},
        {ROOT + "include/sourcemod.inc", "#include <core>\n"},
        {ROOT + "include/sdktools/trace.inc", "native void TR_TraceRay();\n"},
        {ROOT + COMPILER, "\x7f" "ELF compiler"},
        {ROOT + "compile.sh", "#!/bin/sh\n"},
        {ROOT + "admin-flatfile.sp", "public void OnPluginStart() {}\n"},
        {"cfg/sourcemod.cfg", "sm_show_activity 13\n"},
    };
}

Archive openFixture(const ArchiveKind kind, const std::vector<FixtureEntry>& entries) {
    return Archive(kind, std::make_unique<pawup::io::BufferReader>(pawup::test::buildArchive(kind, entries)));
}

}

class ArchiveTest : public ::testing::TestWithParam<ArchiveKind> {};

TEST(ArchiveKindTest, DetectedFromUrlSuffix) {
    EXPECT_EQ(kindFromUrl("https://x/sourcemod-1.12.0-git7192-windows.zip"), ArchiveKind::Zip);
    EXPECT_EQ(kindFromUrl("https://x/sourcemod-1.12.0-git7192-linux.tar.gz"), ArchiveKind::TarGz);
    EXPECT_FALSE(kindFromUrl("https://x/sourcemod-1.12.0-git7192-mac.dmg").has_value());
    EXPECT_FALSE(kindFromUrl("https://x/sourcemod-latest-linux").has_value());
    EXPECT_THROW((void)requireKind("https://x/file.tgz"), FormatError);
}

TEST_P(ArchiveTest, IteratesEntriesWithContents) {
    auto archive = openFixture(GetParam(), sourcemodPackage());
    EXPECT_EQ(archive.kind(), GetParam());

    size_t dirs = 0;
    std::map<std::string, std::string> files;
    while (auto e = archive.next()) {
        if (e->isDirectory()) { ++dirs; continue; }
        const auto bytes = e->readAll();
        files[e->rawPath()] = std::string(bytes.begin(), bytes.end());
    }

    EXPECT_EQ(dirs, 3u);
    EXPECT_EQ(files.size(), 7u);
    EXPECT_EQ(files.at(ROOT + "include/sourcemod.inc"), "#include <core>\n");
    EXPECT_EQ(files.at("cfg/sourcemod.cfg"), "sm_show_activity 13\n");
}

TEST_P(ArchiveTest, ExtractsOnlyToolchainFiles) {
    TempDir tmp;
    const auto dest = tmp / "1.12.0.7192";

    auto archive = openFixture(GetParam(), sourcemodPackage());
    const auto stats = extractToolchain(archive, dest);

    EXPECT_EQ(stats.written, 3u);
    EXPECT_EQ(pawup::test::readFile(dest / "include" / "sourcemod.inc"), "#include <core>\n");
    EXPECT_TRUE(fs::exists(dest / "include" / "sdktools" / "trace.inc"));
    EXPECT_TRUE(fs::exists(dest / COMPILER));
    EXPECT_FALSE(fs::exists(dest / "compile.sh"));
    EXPECT_FALSE(fs::exists(dest / "admin-flatfile.sp"));
    EXPECT_FALSE(fs::exists(dest / "addons"));
    EXPECT_FALSE(fs::exists(dest / "cfg"));
}

TEST_P(ArchiveTest, CompilerIsExecutableByAll) {
    TempDir tmp;
    auto archive = openFixture(GetParam(), sourcemodPackage());
    (void)extractToolchain(archive, tmp.path());

    const auto perms = fs::status(tmp / COMPILER).permissions();
    EXPECT_EQ(perms & fs::perms::all, fs::perms::all);
}

TEST_P(ArchiveTest, TraversalEntriesAreNeverWritten) {
    TempDir tmp;
    const auto dest = tmp / "toolchains" / "1.12.0.7192";

    auto archive = openFixture(GetParam(), {
        {ROOT + "include/../../../../evil.inc", "pwned"},
        {ROOT + "../outside.inc", "pwned"},
        {ROOT + "include/ok.inc", "fine"},
    });
    const auto stats = extractToolchain(archive, dest);

    EXPECT_EQ(stats.written, 1u);
    EXPECT_EQ(stats.skipped, 2u);
    EXPECT_TRUE(fs::exists(dest / "include" / "ok.inc"));
    EXPECT_FALSE(fs::exists(tmp / "evil.inc"));
    EXPECT_FALSE(fs::exists(tmp / "toolchains" / "evil.inc"));
    EXPECT_FALSE(fs::exists(dest.parent_path() / "outside.inc"));
}

TEST_P(ArchiveTest, ExistingFilesAreTruncated) {
    TempDir tmp;
    pawup::test::writeFile(tmp / "include" / "core.inc", "a much longer stale file body");

    auto archive = openFixture(GetParam(), {{ROOT + "include/core.inc", "new"}});
    (void)extractToolchain(archive, tmp.path());
    EXPECT_EQ(pawup::test::readFile(tmp / "include" / "core.inc"), "new");
}

TEST_P(ArchiveTest, CorruptBodyIsFormatError) {
    auto bytes = pawup::test::buildArchive(GetParam(), sourcemodPackage());
    bytes.resize(bytes.size() / 3);
    for (size_t i = 0; i < bytes.size(); i += 7) bytes[i] = static_cast<char>(~bytes[i]);

    EXPECT_THROW({
        Archive archive(GetParam(), std::make_unique<pawup::io::BufferReader>(std::move(bytes)));
        while (auto e = archive.next()) (void)e->readAll();
    }, FormatError);
}

INSTANTIATE_TEST_SUITE_P(Formats, ArchiveTest, ::testing::Values(ArchiveKind::Zip, ArchiveKind::TarGz),
                         [](const ::testing::TestParamInfo<ArchiveKind>& info) {
                             return info.param == ArchiveKind::Zip ? std::string("Zip") : std::string("TarGz");
                         });

class InstallerTest : public ::testing::Test {
protected:
    TempDir tmp;

    std::string fixtureUrl(const ArchiveKind kind) {
        const auto file = tmp / (kind == ArchiveKind::Zip ? "sourcemod-1.12.0-git7192-windows.zip"
                                                          : "sourcemod-1.12.0-git7192-linux.tar.gz");
        const auto bytes = pawup::test::buildArchive(kind, sourcemodPackage());
        pawup::test::writeFile(file, std::string(bytes.begin(), bytes.end()));
        return "file://" + file.string();
    }
};

TEST_F(InstallerTest, UnknownFormatFailsBeforeTransfer) {
    // The host doesn't resolve; reaching the network would be a TransferError instead.
    EXPECT_THROW((void)installFromUrl("https://pawup.invalid/sourcemod-1.12.0-linux.tar.bz2", 1024, tmp / "out"),
                 FormatError);
    EXPECT_FALSE(fs::exists(tmp / "out"));
}

TEST_F(InstallerTest, InstallsFromFileUrl) {
    const auto dest = tmp / "toolchains" / "1.12.0.7192";
    const auto stats = installFromUrl(fixtureUrl(ArchiveKind::TarGz), 75'000'000, dest);
    EXPECT_EQ(stats.written, 3u);
    EXPECT_TRUE(fs::exists(dest / "include" / "sourcemod.inc"));
}

TEST_F(InstallerTest, InstallsZipFromFileUrl) {
    const auto dest = tmp / "toolchains" / "1.12.0.7192";
    (void)installFromUrl(fixtureUrl(ArchiveKind::Zip), 75'000'000, dest);
    EXPECT_TRUE(fs::exists(dest / COMPILER));
}

// file:// reports the size up front, so the bound trips before the first byte.
// A tar.gz stream without a declared length can still leave earlier entries behind.
TEST_F(InstallerTest, DeclaredSizeOverLimitIsRejectedBeforeAnyWrite) {
    for (const auto kind : {ArchiveKind::Zip, ArchiveKind::TarGz}) {
        const auto dest = tmp / "toolchains" / std::string(to_string(kind));
        EXPECT_THROW((void)installFromUrl(fixtureUrl(kind), 64, dest), TransferError);
        EXPECT_FALSE(fs::exists(dest));
    }
}

TEST_F(InstallerTest, MissingFileIsTransferError) {
    EXPECT_THROW((void)installFromUrl("file://" + (tmp / "nope.zip").string(), 1024, tmp / "out"), TransferError);
}
