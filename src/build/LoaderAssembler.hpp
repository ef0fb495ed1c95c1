//===----------------------------------------------------------------------===//
//
// Part of the screeps-build project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: build/LoaderAssembler.hpp
// Purpose: Extract the stdweb initialization code from a `cargo web` loader,
//          append the Screeps invocation and write the final artifacts.
// Key invariants: The payload lies between the prefix and suffix matches and
//                 contains __initialize; outputs are written only after every
//                 check has passed.
// Ownership/Lifetime: All results are returned by value.
// Links: build/ToolchainContract.hpp, build/TemplateMatcher.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "build/TemplateMatcher.hpp"
#include "support/diag_expected.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace screeps::support
{
class Logger;
}

namespace screeps::build
{

/// @brief Slice the text between the prefix and suffix matches.
/// @return The payload; DiagCode::UnexpectedStructure when the prefix ends
///         after the suffix starts; DiagCode::MissingEntryPoint when the
///         payload does not mention __initialize.
support::Expected<std::string> extractPayload(std::string_view text,
                                              const LoaderShape &shape,
                                              const std::string &fileName);

/// @brief Append the synchronous __initialize call to @p payload.
std::string assembleLoader(std::string_view payload);

/// @brief Validate a generated loader and rewrite it for the Screeps host.
/// @param text Full contents of the generated loader.
/// @param fileName Path of the loader, used in diagnostics.
/// @param log Optional sink for the compiled patterns in verbose mode.
support::Expected<std::string> processLoaderScript(std::string_view text,
                                                   const std::string &fileName,
                                                   support::Logger *log = nullptr);

/// @brief Paths of the written artifacts.
struct OutputArtifacts
{
    std::filesystem::path binary;
    std::filesystem::path script;
};

/// @brief Write compiled.wasm and main.js into @p outDir, replacing old copies.
/// @details Both files are staged next to their destination and then renamed
///          over it.  If staging fails nothing in @p outDir changes.
support::Expected<OutputArtifacts> writeOutputs(const std::filesystem::path &outDir,
                                                const std::string &binaryBytes,
                                                const std::string &script);

} // namespace screeps::build
