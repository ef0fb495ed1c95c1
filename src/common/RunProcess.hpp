//===----------------------------------------------------------------------===//
//
// Part of the screeps-build project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: common/RunProcess.hpp
// Purpose: Declare the process execution seam used to drive the external toolchain.
// Key invariants: The child inherits stdout/stderr; only its exit status is inspected.
// Ownership/Lifetime: Callers own CommandSpec buffers; runners copy what they need.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"

#include <string>
#include <vector>

namespace screeps::common
{

/// @brief Description of a single external command invocation.
struct CommandSpec
{
    std::string program;           ///< Program name, resolved through PATH.
    std::vector<std::string> args; ///< Arguments following the program name.
    std::string workingDir;        ///< Directory to run in; empty keeps the current one.
};

/// @brief Outcome of a process that was started successfully.
struct ExecutionResult
{
    bool success = false; ///< True when the process exited normally with status 0.
    int exit_code = -1;   ///< Exit status, or 128 + signal number when killed.
};

/// @brief Abstract process launcher so the pipeline can run against a fake in tests.
class ProcessRunner
{
  public:
    virtual ~ProcessRunner() = default;

    /// @brief Start @p spec, wait for it to finish and report its exit status.
    /// @return ExecutionResult once the process ran; a DiagCode::Spawn
    ///         diagnostic naming the command when it could not be started.
    virtual support::Expected<ExecutionResult> run(const CommandSpec &spec) = 0;
};

/// @brief fork/execvp based runner that passes the child's output through live.
/// @details No timeout is applied: a hung child blocks the caller until the
///          operator interrupts the whole process.
class PosixProcessRunner final : public ProcessRunner
{
  public:
    support::Expected<ExecutionResult> run(const CommandSpec &spec) override;
};

/// @brief Render @p spec as a single human-readable command line.
std::string describeCommand(const CommandSpec &spec);

/// @brief Run @p spec through @p runner and require a zero exit status.
/// @return Success; the runner's spawn diagnostic; or a DiagCode::Execution
///         diagnostic carrying the exit code.
support::Expected<void> execute(ProcessRunner &runner, const CommandSpec &spec);

} // namespace screeps::common
