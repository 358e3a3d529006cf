#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace pawup::config;

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<SourceConfig> {
    static Node encode(const SourceConfig& rhs) {
        Node node;
        node["root_url"] = rhs.root_url;
        node["max_download_size"] = rhs.max_download_size;
        return node;
    }

    static bool decode(const Node& node, SourceConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.root_url = node["root_url"].as<std::string>(DEFAULT_ROOT_URL);
        rhs.max_download_size = node["max_download_size"].as<uintmax_t>(DEFAULT_MAX_DOWNLOAD_SIZE);
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["console_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_level));
        node["file_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_level));
        node["log_dir"]       = rhs.log_dir.string();
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_level = spdlog::level::from_str(node["console_level"].as<std::string>("warn"));
        rhs.file_level = spdlog::level::from_str(node["file_level"].as<std::string>("info"));
        rhs.log_dir = node["log_dir"].as<std::string>("");
        return true;
    }
};

template<>
struct convert<Config> {
    static Node encode(const Config& rhs) {
        Node node;
        node["default"] = rhs.default_selector;
        Node aliases(NodeType::Map);
        for (const auto& [name, version] : rhs.aliases) aliases[name] = version;
        node["aliases"] = aliases;
        node["source"] = rhs.source;
        node["logging"] = rhs.logging;
        return node;
    }

    static bool decode(const Node& node, Config& rhs) {
        if (!node.IsMap()) return false;
        rhs.default_selector = node["default"].as<std::string>(DEFAULT_SELECTOR);
        if (const auto aliases = node["aliases"]) {
            if (!aliases.IsMap()) return false;
            for (const auto& kv : aliases)
                rhs.aliases[kv.first.as<std::string>()] = kv.second.as<std::string>();
        }
        if (const auto source = node["source"]) rhs.source = source.as<SourceConfig>();
        if (const auto logging = node["logging"]) rhs.logging = logging.as<LoggingConfig>();
        return true;
    }
};

} // namespace YAML
