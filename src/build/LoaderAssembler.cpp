//===----------------------------------------------------------------------===//
//
// Part of the screeps-build project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: build/LoaderAssembler.cpp
// Purpose: Strip the browser/node bootstrap from the generated loader and
//          emit the Screeps-ready artifacts.
//
// The Screeps host exposes the module synchronously, so the environment
// detection and fetch() path of the generated loader are dropped and replaced
// by a direct call to __initialize(module, false).
//
//===----------------------------------------------------------------------===//

#include "build/LoaderAssembler.hpp"

#include "build/ToolchainContract.hpp"
#include "support/logger.hpp"

#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace screeps::build
{

namespace
{

/// @brief Write @p content to @p path in binary mode.
support::Expected<void> writeFile(const fs::path &path, const std::string &content)
{
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out)
        return support::makeError(support::DiagCode::Io, "could not write " + path.string());
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.close();
    if (!out)
        return support::makeError(support::DiagCode::Io, "could not write " + path.string());
    return {};
}

void removeQuietly(const fs::path &path)
{
    std::error_code ec;
    fs::remove(path, ec);
}

} // namespace

support::Expected<std::string> extractPayload(std::string_view text,
                                              const LoaderShape &shape,
                                              const std::string &fileName)
{
    if (shape.prefix.end > shape.suffix.start)
    {
        return support::makeError(support::DiagCode::UnexpectedStructure,
                                  "'cargo web' generated an unexpected JS layout in " + fileName +
                                      ": the expected prefix and suffix overlap. screeps-build "
                                      "needs updating before it can process this output.");
    }

    std::string payload(text.substr(shape.prefix.end, shape.suffix.start - shape.prefix.end));
    if (payload.find(contract::kEntryPointMarker) == std::string::npos)
    {
        return support::makeError(support::DiagCode::MissingEntryPoint,
                                  "'cargo web' generated unexpected JS output in " + fileName +
                                      ": it does not include a '" +
                                      std::string(contract::kEntryPointMarker) + "' function.");
    }
    return payload;
}

std::string assembleLoader(std::string_view payload)
{
    std::string out;
    out.reserve(payload.size() + contract::kInitializeCall.size());
    out.append(payload);
    out.append(contract::kInitializeCall);
    return out;
}

support::Expected<std::string> processLoaderScript(std::string_view text,
                                                   const std::string &fileName,
                                                   support::Logger *log)
{
    const auto prefix = TemplatePattern::compile(
        contract::kLoaderPrefixTemplate, Anchor::Start, contract::kPlaceholder);
    const auto suffix = TemplatePattern::compile(
        contract::kLoaderSuffixTemplate, Anchor::End, contract::kPlaceholder);
    if (log && log->verbose())
    {
        log->note("expected prefix:\n```" + prefix.source() + "```");
        log->note("expected suffix:\n```" + suffix.source() + "```");
    }

    auto shape = matchLoaderShape(prefix, suffix, text, fileName);
    if (!shape)
        return shape.error();

    auto payload = extractPayload(text, shape.value(), fileName);
    if (!payload)
        return payload.error();

    return assembleLoader(payload.value());
}

support::Expected<OutputArtifacts> writeOutputs(const fs::path &outDir,
                                                const std::string &binaryBytes,
                                                const std::string &script)
{
    std::error_code ec;
    fs::create_directories(outDir, ec);
    if (ec)
    {
        return support::makeError(support::DiagCode::Io,
                                  "could not create " + outDir.string() + ": " + ec.message());
    }

    OutputArtifacts outputs;
    outputs.binary = outDir / std::string(contract::kOutputBinaryName);
    outputs.script = outDir / std::string(contract::kOutputScriptName);

    fs::path stagedBinary = outputs.binary;
    stagedBinary += ".tmp";
    fs::path stagedScript = outputs.script;
    stagedScript += ".tmp";

    auto staged = writeFile(stagedBinary, binaryBytes);
    if (staged)
        staged = writeFile(stagedScript, script);
    if (!staged)
    {
        removeQuietly(stagedBinary);
        removeQuietly(stagedScript);
        return staged.error();
    }

    fs::rename(stagedBinary, outputs.binary, ec);
    if (ec)
    {
        removeQuietly(stagedBinary);
        removeQuietly(stagedScript);
        return support::makeError(support::DiagCode::Io,
                                  "could not replace " + outputs.binary.string() + ": " +
                                      ec.message());
    }

    fs::rename(stagedScript, outputs.script, ec);
    if (ec)
    {
        removeQuietly(stagedScript);
        return support::makeError(support::DiagCode::Io,
                                  "could not replace " + outputs.script.string() + ": " +
                                      ec.message());
    }
    return outputs;
}

} // namespace screeps::build
