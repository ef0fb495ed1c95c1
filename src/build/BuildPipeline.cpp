//===----------------------------------------------------------------------===//
//
// Part of the screeps-build project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: build/BuildPipeline.cpp
// Purpose: Implements the check/build flows.
//
// Every step returns an Expected; the first failure is handed back unchanged
// to the caller.  The wasm bytes and the rewritten loader are both held in
// memory before anything under target/ is touched.
//
//===----------------------------------------------------------------------===//

#include "build/BuildPipeline.hpp"

#include "build/ArtifactLocator.hpp"
#include "build/ToolchainContract.hpp"
#include "support/file_loader.hpp"
#include "support/logger.hpp"

#include <utility>

namespace fs = std::filesystem;

namespace screeps::build
{

namespace
{
std::string targetFlag()
{
    return "--target=" + std::string(contract::kTargetTriple);
}
} // namespace

common::CommandSpec checkCommand(const BuildConfig &config)
{
    return common::CommandSpec{config.cargo, {"check", targetFlag()}, config.rootDir.string()};
}

common::CommandSpec buildCommand(const BuildConfig &config)
{
    common::CommandSpec spec{config.cargo, {"web", "build", targetFlag()}, config.rootDir.string()};
    if (config.release)
        spec.args.push_back("--release");
    return spec;
}

fs::path buildOutputDir(const BuildConfig &config)
{
    return config.rootDir / std::string(contract::kTargetDir) /
           std::string(contract::kTargetTriple) / (config.release ? "release" : "debug");
}

fs::path finalOutputDir(const BuildConfig &config)
{
    return config.rootDir / std::string(contract::kTargetDir);
}

BuildPipeline::BuildPipeline(BuildConfig config,
                             common::ProcessRunner &runner,
                             support::Logger &log)
    : config_(std::move(config)), runner_(runner), log_(log)
{
}

support::Expected<void> BuildPipeline::check()
{
    log_.note("running check");
    const auto spec = checkCommand(config_);
    log_.note("running '" + common::describeCommand(spec) + "'");
    auto ran = common::execute(runner_, spec);
    if (!ran)
        return ran;
    log_.note("finished 'cargo check'");
    return {};
}

support::Expected<OutputArtifacts> BuildPipeline::build()
{
    log_.note("building");
    const auto spec = buildCommand(config_);
    log_.note("running '" + common::describeCommand(spec) + "'");
    auto ran = common::execute(runner_, spec);
    if (!ran)
        return ran.error();
    log_.note("finished 'cargo web'");
    return package();
}

support::Expected<OutputArtifacts> BuildPipeline::package()
{
    const fs::path outputDir = buildOutputDir(config_);
    auto artifacts = scanArtifacts(outputDir, defaultExtensionMap(), &log_);
    if (!artifacts)
        return artifacts.error();

    const fs::path &wasmPath = artifacts.value().at(ArtifactKind::BinaryModule);
    const fs::path &jsPath = artifacts.value().at(ArtifactKind::LoaderScript);

    log_.note("reading wasm file " + wasmPath.string());
    auto wasm = support::loadFile(wasmPath.string());
    if (!wasm)
        return wasm.error();

    log_.note("processing js file " + jsPath.string());
    auto js = support::loadFile(jsPath.string());
    if (!js)
        return js.error();

    auto script = processLoaderScript(js.value(), jsPath.string(), &log_);
    if (!script)
        return script.error();

    log_.note("writing " + std::string(contract::kOutputBinaryName) + " and " +
              std::string(contract::kOutputScriptName));
    return writeOutputs(finalOutputDir(config_), wasm.value(), script.value());
}

support::Expected<void> BuildPipeline::run(Mode mode)
{
    if (mode == Mode::Check)
        return check();

    auto built = build();
    if (!built)
        return built.error();
    return {};
}

} // namespace screeps::build
