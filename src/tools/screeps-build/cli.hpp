//===----------------------------------------------------------------------===//
//
// Part of the screeps-build project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/screeps-build/cli.hpp
// Purpose: Command-line parsing and the top-level driver for screeps-build.
// Key invariants: Exit status is 0 on success, 1 on pipeline failure and 2 on
//                 usage errors.
// Ownership/Lifetime: N/A.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "build/BuildPipeline.hpp"
#include "support/diag_expected.hpp"

#include <ostream>
#include <string>

namespace screeps::tools
{

/// @brief Exit status for a malformed command line.
inline constexpr int kExitUsage = 2;

/// @brief Parsed command-line options.
struct CliOptions
{
    /// @brief Requested operation.
    build::Mode mode{build::Mode::Build};

    /// @brief Project root given with -C/--root; empty means the current directory.
    std::string root{};

    /// @brief Print progress notes.
    bool verbose = false;

    /// @brief -h/--help was given.
    bool showHelp = false;

    /// @brief --version was given.
    bool showVersion = false;
};

/// @brief Parse @p argv as passed to main; index 0 is the program name.
/// @return Options, or a DiagCode::Usage diagnostic.
support::Expected<CliOptions> parseCommandLine(int argc, char **argv);

/// @brief Run screeps-build end to end.
/// @param runner Process runner used for cargo.
/// @param out Stream for usage and version text.
/// @param err Stream for diagnostics.
/// @return Process exit status.
int runScreepsBuild(int argc,
                    char **argv,
                    screeps::common::ProcessRunner &runner,
                    std::ostream &out,
                    std::ostream &err);

/// @brief Print synopsis and options.
void printUsage(std::ostream &os);

/// @brief Print the version banner.
void printVersion(std::ostream &os);

} // namespace screeps::tools
