//===----------------------------------------------------------------------===//
//
// Part of the screeps-build project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: build/BuildPipeline.hpp
// Purpose: Sequence the cargo invocation, artifact scan, loader rewrite and
//          output writes for `check` and `build`.
// Key invariants: No output is written unless every earlier step succeeded.
// Ownership/Lifetime: The pipeline borrows its runner and logger.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "build/LoaderAssembler.hpp"
#include "common/RunProcess.hpp"
#include "support/diag_expected.hpp"

#include <filesystem>
#include <string>

namespace screeps::support
{
class Logger;
}

namespace screeps::build
{

/// @brief Operation requested by the operator.
enum class Mode
{
    Check, ///< Type-check only (`cargo check`).
    Build  ///< Full build followed by loader rewrite.
};

/// @brief Settings for one pipeline run.
struct BuildConfig
{
    /// @brief Project root; cargo runs here and outputs land beneath it.
    std::filesystem::path rootDir;

    /// @brief Program used to invoke the toolchain.
    std::string cargo{"cargo"};

    /// @brief Build with `--release`; selects the release/ output directory.
    bool release{true};
};

/// @brief `cargo check --target=wasm32-unknown-unknown`.
common::CommandSpec checkCommand(const BuildConfig &config);

/// @brief `cargo web build --target=wasm32-unknown-unknown [--release]`.
common::CommandSpec buildCommand(const BuildConfig &config);

/// @brief Directory where `cargo web` leaves its artifacts.
std::filesystem::path buildOutputDir(const BuildConfig &config);

/// @brief Directory receiving compiled.wasm and main.js.
std::filesystem::path finalOutputDir(const BuildConfig &config);

class BuildPipeline
{
  public:
    BuildPipeline(BuildConfig config, common::ProcessRunner &runner, support::Logger &log);

    /// @brief Run the lightweight check.
    support::Expected<void> check();

    /// @brief Run the full build and package its output.
    support::Expected<OutputArtifacts> build();

    /// @brief Locate the existing cargo output, rewrite the loader and write
    ///        the final artifacts without invoking cargo.
    support::Expected<OutputArtifacts> package();

    /// @brief Dispatch on @p mode.
    support::Expected<void> run(Mode mode);

  private:
    BuildConfig config_;
    common::ProcessRunner &runner_;
    support::Logger &log_;
};

} // namespace screeps::build
