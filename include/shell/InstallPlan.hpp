#pragma once

#include "toolchain/Selector.hpp"

#include <optional>
#include <string>

namespace pawup::shell {

/// What `update` and `install` do once the remote version is known.
struct InstallPlan {
    bool upgrading = true;
    bool needsDownload = false;
    std::optional<std::string> alias;    // written to the config when set
};

struct UpdateInputs {
    std::optional<std::string> installedLatest;  // newest local toolchain of the remote branch
    std::string remoteVersion;
    bool remoteInstalled = false;
    bool redownload = false;
    toolchain::Selector selector;
    std::optional<std::string> aliasArg;
};

/// Upgrades when nothing of the branch is installed or the installed version is older.
/// The alias is the explicit argument, else the selector's alias name.
[[nodiscard]] InstallPlan planUpdate(const UpdateInputs& in);

[[nodiscard]] InstallPlan planInstall(bool remoteInstalled, bool redownload);

}
