#include <gtest/gtest.h>
#include "TestEnv.hpp"
#include "config/ConfigFile.hpp"
#include "error/Errors.hpp"
#include "paths/paths.hpp"

#include <nlohmann/json.hpp>

namespace fs = std::filesystem;
using namespace pawup::config;
using pawup::error::ConfigError;
using pawup::test::ScopedEnv;
using pawup::test::TempDir;

TEST(ConfigTest, DefaultsForEmptyFile) {
    TempDir tmp;
    pawup::test::writeFile(tmp / "config.yaml", "");

    const auto cfg = loadConfig(tmp / "config.yaml");
    EXPECT_EQ(cfg.default_selector, "stable");
    EXPECT_TRUE(cfg.aliases.empty());
    EXPECT_EQ(cfg.source.root_url, DEFAULT_ROOT_URL);
    EXPECT_EQ(cfg.source.max_download_size, DEFAULT_MAX_DOWNLOAD_SIZE);
}

TEST(ConfigTest, MissingSectionsKeepDefaults) {
    TempDir tmp;
    pawup::test::writeFile(tmp / "config.yaml", "default: latest\naliases:\n  work: 1.11.0.6970\n");

    const auto cfg = loadConfig(tmp / "config.yaml");
    EXPECT_EQ(cfg.default_selector, "latest");
    ASSERT_NE(cfg.alias("work"), nullptr);
    EXPECT_EQ(*cfg.alias("work"), "1.11.0.6970");
    EXPECT_EQ(cfg.alias("home"), nullptr);
    EXPECT_EQ(cfg.source.root_url, DEFAULT_ROOT_URL);
}

TEST(ConfigTest, SaveThenLoadKeepsEverything) {
    TempDir tmp;
    Config cfg;
    cfg.default_selector = ":1.11";
    cfg.aliases = {{"work", "1.11.0.6970"}, {"legacy", "1.10.0.6528"}};
    cfg.source.root_url = "https://mirror.example.org/smdrop/";
    cfg.source.max_download_size = 1024;
    cfg.logging.console_level = spdlog::level::debug;
    cfg.logging.log_dir = tmp / "logs";

    saveConfig(cfg, tmp / "config.yaml");
    const auto back = loadConfig(tmp / "config.yaml");

    EXPECT_EQ(back.default_selector, ":1.11");
    EXPECT_EQ(back.aliases, cfg.aliases);
    EXPECT_EQ(back.source.root_url, "https://mirror.example.org/smdrop/");
    EXPECT_EQ(back.source.max_download_size, 1024u);
    EXPECT_EQ(back.logging.console_level, spdlog::level::debug);
    EXPECT_EQ(back.logging.file_level, spdlog::level::info);
    EXPECT_EQ(back.logging.log_dir, tmp / "logs");
}

TEST(ConfigTest, MalformedYamlIsConfigError) {
    TempDir tmp;
    pawup::test::writeFile(tmp / "config.yaml", "default: [unterminated\n");
    EXPECT_THROW((void)loadConfig(tmp / "config.yaml"), ConfigError);
}

TEST(ConfigTest, WrongLayoutIsConfigError) {
    TempDir tmp;
    pawup::test::writeFile(tmp / "config.yaml", "- just\n- a list\n");
    EXPECT_THROW((void)loadConfig(tmp / "config.yaml"), ConfigError);

    pawup::test::writeFile(tmp / "config.yaml", "aliases: [1, 2]\n");
    EXPECT_THROW((void)loadConfig(tmp / "config.yaml"), ConfigError);
}

TEST(ConfigTest, MissingFileIsConfigError) {
    TempDir tmp;
    EXPECT_THROW((void)loadConfig(tmp / "nope.yaml"), ConfigError);
}

TEST(ConfigTest, JsonView) {
    Config cfg;
    cfg.aliases["work"] = "1.11.0.6970";
    const nlohmann::json j = cfg;

    EXPECT_EQ(j.at("default"), "stable");
    EXPECT_EQ(j.at("aliases").at("work"), "1.11.0.6970");
    EXPECT_EQ(j.at("source").at("root_url"), DEFAULT_ROOT_URL);
    EXPECT_EQ(j.at("logging").at("console_level"), "warning");
}

class ConfigFileTest : public ::testing::Test {
protected:
    TempDir tmp;
    ScopedEnv configHome{pawup::paths::ENV_CONFIG_HOME, (tmp / "cfg").string()};
    ScopedEnv toolchain{ENV_TOOLCHAIN, std::nullopt};
};

TEST_F(ConfigFileTest, OpenDefaultWritesDefaults) {
    const auto expected = tmp / "cfg" / "pawup" / "config.yaml";
    ASSERT_FALSE(fs::exists(expected));

    const auto file = ConfigFile::openDefault();
    EXPECT_EQ(file.path(), expected);
    EXPECT_TRUE(fs::exists(expected));
    EXPECT_EQ(file.data().default_selector, "stable");
}

TEST_F(ConfigFileTest, ChangesPersistAcrossOpens) {
    {
        auto file = ConfigFile::openDefault();
        file.setDefault("latest");
        file.setAlias("work", "1.11.0.6970");
        file.save();
    }
    const auto again = ConfigFile::openDefault();
    EXPECT_EQ(again.data().default_selector, "latest");
    ASSERT_NE(again.data().alias("work"), nullptr);
    EXPECT_EQ(*again.data().alias("work"), "1.11.0.6970");
}

TEST_F(ConfigFileTest, ExistingFileIsNotOverwritten) {
    pawup::test::writeFile(tmp / "cfg" / "pawup" / "config.yaml", "default: ':1.10'\n");
    EXPECT_EQ(ConfigFile::openDefault().data().default_selector, ":1.10");
}

TEST_F(ConfigFileTest, CurrentToolchainFromConfig) {
    Config cfg;
    cfg.default_selector = "latest";
    const auto [selector, source] = currentToolchain(cfg);
    EXPECT_EQ(selector, "latest");
    EXPECT_EQ(source, ToolchainSource::Config);
}

TEST_F(ConfigFileTest, CurrentToolchainEnvironmentWins) {
    ScopedEnv env(ENV_TOOLCHAIN, ":1.11");
    const auto [selector, source] = currentToolchain(Config{});
    EXPECT_EQ(selector, ":1.11");
    EXPECT_EQ(source, ToolchainSource::Env);
}

TEST_F(ConfigFileTest, EmptyEnvironmentIsIgnored) {
    ScopedEnv env(ENV_TOOLCHAIN, "");
    EXPECT_EQ(currentToolchain(Config{}).second, ToolchainSource::Config);
}
