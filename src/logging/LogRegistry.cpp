#include "logging/LogRegistry.hpp"
#include "paths/paths.hpp"

#include <algorithm>
#include <iostream>
#include <vector>

namespace pawup::logging {

void LogRegistry::init(const config::LoggingConfig& cnf) {
    if (initialized_) {
        spdlog::warn("[LogRegistry] Already initialized, ignoring second init()");
        return;
    }

    namespace fs = std::filesystem;

    console_sink_ = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink_->set_level(cnf.console_level);
    console_sink_->set_color_mode(spdlog::color_mode::automatic);
    console_sink_->set_pattern(LOG_FORMAT);

    std::vector<spdlog::sink_ptr> sinks{console_sink_};

    // A missing or read-only log directory costs us the file log, not the command.
    const auto logDir = cnf.log_dir.empty() ? paths::logDir() : std::optional(cnf.log_dir);
    if (logDir) {
        try {
            fs::create_directories(*logDir);
            main_file_sink_ = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                (*logDir / "pawup.log").string(), main_max_bytes_, main_max_files_);
            main_file_sink_->set_level(cnf.file_level);
            main_file_sink_->set_pattern(LOG_FORMAT);
            sinks.push_back(main_file_sink_);
        } catch (const fs::filesystem_error& e) {
            std::cerr << "[LogRegistry] Failed to create log directory: " << e.what() << std::endl;
        } catch (const spdlog::spdlog_ex& e) {
            std::cerr << "[LogRegistry] Failed to init file sink: " << e.what() << std::endl;
        }
    }

    const auto loggerLevel = std::min(cnf.console_level, main_file_sink_ ? cnf.file_level : cnf.console_level);

    for (const auto* name : {"pawup", "http", "catalog", "toolchain", "archive", "config", "shell"}) {
        if (spdlog::get(name)) spdlog::drop(name);
        const auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(loggerLevel);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    }

    initialized_ = true;
    pawup()->debug("[LogRegistry] Initialized");
}

std::shared_ptr<spdlog::logger> LogRegistry::get(const std::string& name) {
    auto logger = spdlog::get(name);
    if (!logger) {
        if (!initialized_) throw std::runtime_error("[LogRegistry] LogRegistry not initialized, cannot get logger: " + name);
        throw std::runtime_error("[LogRegistry] Logger not found: " + name);
    }
    return logger;
}

bool LogRegistry::isInitialized() { return initialized_; }

void LogRegistry::shutdown() {
    if (!initialized_) return;
    spdlog::shutdown();
    console_sink_.reset();
    main_file_sink_.reset();
    initialized_ = false;
}

}
