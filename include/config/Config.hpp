#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <spdlog/spdlog.h>
#include <nlohmann/json_fwd.hpp>

namespace pawup::config {

constexpr const auto* DEFAULT_SELECTOR = "stable";
constexpr const auto* DEFAULT_ROOT_URL = "https://sm.alliedmods.net/smdrop/";
constexpr static uintmax_t DEFAULT_MAX_DOWNLOAD_SIZE = 75'000'000; // ~75MB, full SourceMod package

// Where toolchains are downloaded from.
struct SourceConfig {
    std::string root_url = DEFAULT_ROOT_URL;   // static file server, must end in '/'
    uintmax_t max_download_size = DEFAULT_MAX_DOWNLOAD_SIZE;
};

struct LoggingConfig {
    spdlog::level::level_enum console_level = spdlog::level::warn;
    spdlog::level::level_enum file_level = spdlog::level::info;
    std::filesystem::path log_dir;  // empty = <cache dir>/pawup/logs
};

using AliasTable = std::map<std::string, std::string>;

struct Config {
    std::string default_selector = DEFAULT_SELECTOR;
    AliasTable aliases;
    SourceConfig source;
    LoggingConfig logging;

    [[nodiscard]] const std::string* alias(const std::string& name) const;
};

Config loadConfig(const std::filesystem::path& path);
void saveConfig(const Config& cfg, const std::filesystem::path& path);
std::string dumpYaml(const Config& cfg);

void to_json(nlohmann::json& j, const Config& c);
void to_json(nlohmann::json& j, const SourceConfig& c);
void to_json(nlohmann::json& j, const LoggingConfig& c);

} // namespace pawup::config
