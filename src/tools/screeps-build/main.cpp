//===----------------------------------------------------------------------===//
//
// Part of the screeps-build project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Main entry point for the screeps-build command-line tool.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Entry point for the `screeps-build` CLI tool.

#include "common/RunProcess.hpp"
#include "tools/screeps-build/cli.hpp"

#include <iostream>

/// @brief Wire the real process runner and standard streams into the driver.
int main(int argc, char **argv)
{
    screeps::common::PosixProcessRunner runner;
    return screeps::tools::runScreepsBuild(argc, argv, runner, std::cout, std::cerr);
}
