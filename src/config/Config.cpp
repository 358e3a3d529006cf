#include "config/Config.hpp"
#include "config/config_yaml.hpp"
#include "error/Errors.hpp"

#include <fstream>
#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>
#include <fmt/core.h>

namespace pawup::config {

const std::string* Config::alias(const std::string& name) const {
    const auto it = aliases.find(name);
    return it == aliases.end() ? nullptr : &it->second;
}

Config loadConfig(const std::filesystem::path& path) {
    Config cfg;
    try {
        const YAML::Node root = YAML::LoadFile(path.string());
        if (root.IsNull()) return cfg;
        if (!YAML::convert<Config>::decode(root, cfg))
            throw error::ConfigError(fmt::format("failed to parse {}: unexpected document layout", path.string()));
    } catch (const YAML::BadFile&) {
        throw error::ConfigError(fmt::format("failed to open {}", path.string()));
    } catch (const YAML::Exception& e) {
        throw error::ConfigError(fmt::format("failed to parse {}: {}", path.string(), e.what()));
    }
    return cfg;
}

std::string dumpYaml(const Config& cfg) {
    YAML::Emitter out;
    out << YAML::convert<Config>::encode(cfg);
    return std::string(out.c_str()) + "\n";
}

void saveConfig(const Config& cfg, const std::filesystem::path& path) {
    const auto text = dumpYaml(cfg);

    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) throw error::ConfigError(fmt::format("failed to write {}", path.string()));

    out << text;
    out.close();
    if (!out) throw error::ConfigError(fmt::format("failed to write {}", path.string()));
}

void to_json(nlohmann::json& j, const Config& c) {
    j = {
        {"default", c.default_selector},
        {"aliases", c.aliases},
        {"source", c.source},
        {"logging", c.logging}
    };
}

void to_json(nlohmann::json& j, const SourceConfig& c) {
    j = {
        {"root_url", c.root_url},
        {"max_download_size", c.max_download_size}
    };
}

void to_json(nlohmann::json& j, const LoggingConfig& c) {
    j = {
        {"console_level", YAML::to_std_string(spdlog::level::to_string_view(c.console_level))},
        {"file_level", YAML::to_std_string(spdlog::level::to_string_view(c.file_level))},
        {"log_dir", c.log_dir.string()}
    };
}

} // namespace pawup::config
