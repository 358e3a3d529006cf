#pragma once

#include "config/ConfigFile.hpp"
#include "error/Errors.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace pawup::toolchain {

/// Runs `exe` with `args`, sharing this process's stdio, and waits for it.
/// Returns the child's exit status, or 128 + signal number if it was killed.
/// Throws FilesystemError if the child can't be started.
int runCompiler(const std::filesystem::path& exe, const std::vector<std::string>& args);

/// Explains a missing toolchain in terms of where the selector came from.
std::string describeMissing(const error::ToolchainNotFound& e, config::ToolchainSource source);

}
