#include "toolchain/Launcher.hpp"
#include "logging/LogRegistry.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fmt/core.h>
#include <sys/wait.h>
#include <unistd.h>

using namespace pawup::toolchain;
using namespace pawup::error;
using namespace pawup::logging;

int pawup::toolchain::runCompiler(const std::filesystem::path& exe, const std::vector<std::string>& args) {
    const std::string exePath = exe.string();

    std::vector<char*> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(const_cast<char*>(exePath.c_str()));
    for (const auto& a : args) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);

    // exec failures are reported back through a close-on-exec pipe
    int errPipe[2];
    if (pipe2(errPipe, O_CLOEXEC) != 0)
        throw FilesystemError(fmt::format("{}: {}", exePath, std::strerror(errno)), exe);

    LogRegistry::toolchain()->debug("[Launcher] Spawning {} with {} args", exePath, args.size());

    const pid_t pid = fork();
    if (pid < 0) {
        const int err = errno;
        close(errPipe[0]);
        close(errPipe[1]);
        throw FilesystemError(fmt::format("{}: failed to fork: {}", exePath, std::strerror(err)), exe);
    }

    if (pid == 0) {
        close(errPipe[0]);
        execv(exePath.c_str(), argv.data());
        const int err = errno;
        (void)!write(errPipe[1], &err, sizeof(err));
        _exit(127);
    }

    close(errPipe[1]);
    int execErr = 0;
    ssize_t n;
    do {
        n = read(errPipe[0], &execErr, sizeof(execErr));
    } while (n < 0 && errno == EINTR);
    close(errPipe[0]);

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) throw FilesystemError(fmt::format("{}: waitpid failed: {}", exePath, std::strerror(errno)), exe);
    }

    if (n == static_cast<ssize_t>(sizeof(execErr)))
        throw FilesystemError(fmt::format("{}: {}", exePath, std::strerror(execErr)), exe);

    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return 1;
}

std::string pawup::toolchain::describeMissing(const ToolchainNotFound& e, const config::ToolchainSource source) {
    const std::string origin = source == config::ToolchainSource::Env
        ? fmt::format("the `{}` environment variable", config::ENV_TOOLCHAIN)
        : "the Pawup configuration file";

    const std::string what = e.kind() == ToolchainNotFound::Kind::LatestCompatible
        ? fmt::format("the latest version compatible with \"{}\"", e.version())
        : fmt::format("version \"{}\" (as specified by alias \"{}\")", e.version(), e.alias());

    return fmt::format("{} specifies that a toolchain of {} should be used, but that toolchain is not installed",
                       origin, what);
}
