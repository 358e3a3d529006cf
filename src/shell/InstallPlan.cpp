#include "shell/InstallPlan.hpp"
#include "version/Version.hpp"

using namespace pawup::shell;

InstallPlan pawup::shell::planUpdate(const UpdateInputs& in) {
    InstallPlan plan;
    plan.upgrading = !in.installedLatest || version::versionLess(*in.installedLatest, in.remoteVersion);
    plan.needsDownload = in.redownload || (plan.upgrading && !in.remoteInstalled);

    plan.alias = in.aliasArg;
    if (!plan.alias && in.selector.isAlias()) plan.alias = in.selector.value();
    return plan;
}

InstallPlan pawup::shell::planInstall(const bool remoteInstalled, const bool redownload) {
    return {.upgrading = !remoteInstalled, .needsDownload = redownload || !remoteInstalled, .alias = std::nullopt};
}
