//===----------------------------------------------------------------------===//
//
// Part of the screeps-build project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the launcher used to drive the external toolchain.  The child is
// started with fork/execvp so arguments never pass through a shell, and it
// inherits the parent's standard streams so the toolchain's own progress
// output reaches the operator as it is produced.  Exec and chdir failures in
// the child are reported back over a close-on-exec pipe, which lets the parent
// tell "could not start" apart from "started and failed".
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Subprocess launcher for the screeps-build pipeline.

#include "common/RunProcess.hpp"

#include <cerrno>
#include <cstring>
#include <iostream>
#include <string>
#include <vector>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace screeps::common
{

namespace
{
/// @brief Failure record written by the child when it cannot reach exec.
struct ChildFailure
{
    int stage; ///< 0 = chdir, 1 = exec
    int error; ///< errno at the point of failure
};

constexpr int kStageChdir = 0;
constexpr int kStageExec = 1;

[[noreturn]] void reportChildFailure(int fd, int stage, int error)
{
    const ChildFailure failure{stage, error};
    ssize_t written = 0;
    do
    {
        written = ::write(fd, &failure, sizeof(failure));
    } while (written == -1 && errno == EINTR);
    _exit(127);
}

[[nodiscard]] int decodeExitCode(int status)
{
    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    if (WIFSIGNALED(status))
        return 128 + WTERMSIG(status);
    return status;
}

support::Diag spawnError(const CommandSpec &spec, const std::string &detail)
{
    return support::makeError(support::DiagCode::Spawn,
                              "could not start '" + spec.program + "': " + detail);
}
} // namespace

std::string describeCommand(const CommandSpec &spec)
{
    std::string cmd = spec.program;
    for (const auto &arg : spec.args)
    {
        cmd += ' ';
        cmd += arg;
    }
    return cmd;
}

support::Expected<ExecutionResult> PosixProcessRunner::run(const CommandSpec &spec)
{
    if (spec.program.empty())
        return spawnError(spec, "empty program name");

    std::vector<char *> argv;
    argv.reserve(spec.args.size() + 2);
    argv.push_back(const_cast<char *>(spec.program.c_str()));
    for (const auto &arg : spec.args)
        argv.push_back(const_cast<char *>(arg.c_str()));
    argv.push_back(nullptr);

    int errPipe[2];
    if (::pipe2(errPipe, O_CLOEXEC) != 0)
        return spawnError(spec, std::strerror(errno));

    // Our pending output must appear before the child's.
    std::cout.flush();
    std::cerr.flush();

    const pid_t pid = ::fork();
    if (pid == -1)
    {
        const int err = errno;
        ::close(errPipe[0]);
        ::close(errPipe[1]);
        return spawnError(spec, std::strerror(err));
    }

    if (pid == 0)
    {
        ::close(errPipe[0]);
        if (!spec.workingDir.empty() && ::chdir(spec.workingDir.c_str()) != 0)
            reportChildFailure(errPipe[1], kStageChdir, errno);
        ::execvp(argv[0], argv.data());
        reportChildFailure(errPipe[1], kStageExec, errno);
    }

    ::close(errPipe[1]);
    ChildFailure failure{};
    ssize_t got = 0;
    do
    {
        got = ::read(errPipe[0], &failure, sizeof(failure));
    } while (got == -1 && errno == EINTR);
    ::close(errPipe[0]);

    int status = 0;
    pid_t waited = 0;
    do
    {
        waited = ::waitpid(pid, &status, 0);
    } while (waited == -1 && errno == EINTR);

    if (got == static_cast<ssize_t>(sizeof(failure)))
    {
        if (failure.stage == kStageChdir)
            return spawnError(spec,
                              "cannot enter working directory '" + spec.workingDir +
                                  "': " + std::strerror(failure.error));
        return spawnError(spec, std::strerror(failure.error));
    }

    if (waited == -1)
        return spawnError(spec, std::string("waitpid failed: ") + std::strerror(errno));

    ExecutionResult result;
    result.exit_code = decodeExitCode(status);
    result.success = WIFEXITED(status) && result.exit_code == 0;
    return result;
}

support::Expected<void> execute(ProcessRunner &runner, const CommandSpec &spec)
{
    auto result = runner.run(spec);
    if (!result)
        return result.error();

    if (!result.value().success)
    {
        const int code = result.value().exit_code;
        auto diag = support::makeError(support::DiagCode::Execution,
                                       "'" + describeCommand(spec) +
                                           "' exited with a non-zero exit code: " +
                                           std::to_string(code));
        diag.exitCode = code;
        return diag;
    }
    return {};
}

} // namespace screeps::common
