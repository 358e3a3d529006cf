#pragma once

#include <filesystem>
#include <memory>
#include <string>

namespace pawup::shell {

class Router;

void registerConfigCommands(const std::shared_ptr<Router>& r);
void registerToolchainCommands(const std::shared_ptr<Router>& r);
void registerRemoteCommands(const std::shared_ptr<Router>& r);
void registerSystemCommands(const std::shared_ptr<Router>& r);

inline void registerAllCommands(const std::shared_ptr<Router>& r) {
    registerConfigCommands(r);
    registerToolchainCommands(r);
    registerRemoteCommands(r);
    registerSystemCommands(r);
}

/// Directory new downloads go to: `<cache toolchain home>/<version>`.
/// Throws FilesystemError unless `version` is a single plain path component.
std::filesystem::path toolchainDestination(const std::string& version);

}
