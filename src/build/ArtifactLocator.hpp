//===----------------------------------------------------------------------===//
//
// Part of the screeps-build project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: build/ArtifactLocator.hpp
// Purpose: Find the single binary module and loader script in a build-output directory.
// Key invariants: Each required category resolves to exactly one regular file.
// Ownership/Lifetime: Returned paths are owned by the caller.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"

#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace screeps::support
{
class Logger;
}

namespace screeps::build
{

/// @brief Category assigned to a build-output entry from its extension.
enum class ArtifactKind
{
    BinaryModule,
    LoaderScript,
    Ignored
};

/// @brief Human-readable category name used in diagnostics ("wasm", "js").
const char *artifactKindName(ArtifactKind kind);

/// @brief A directory entry together with its classification.
struct CandidateFile
{
    std::filesystem::path path;
    ArtifactKind kind = ArtifactKind::Ignored;
};

/// @brief Extension (including the dot) to category table.
using ExtensionMap = std::map<std::string, ArtifactKind>;

/// @brief Located artifacts keyed by category.
using ArtifactSet = std::map<ArtifactKind, std::filesystem::path>;

/// @brief The `.wasm` / `.js` table used for `cargo web` output.
ExtensionMap defaultExtensionMap();

/// @brief Classify the regular files directly inside @p dir.
/// @return Candidates sorted by path, or a DiagCode::Io diagnostic when the
///         directory cannot be listed.
support::Expected<std::vector<CandidateFile>> classifyDirectory(const std::filesystem::path &dir,
                                                                const ExtensionMap &extensions);

/// @brief Resolve exactly one file for every category named in @p extensions.
///
/// Entries with unrecognised extensions are skipped and, when @p log is given,
/// reported as notes.
///
/// @return One path per category; DiagCode::AmbiguousArtifact when a category
///         has several candidates; DiagCode::MissingArtifact when it has none.
support::Expected<ArtifactSet> scanArtifacts(const std::filesystem::path &dir,
                                             const ExtensionMap &extensions,
                                             support::Logger *log = nullptr);

} // namespace screeps::build
