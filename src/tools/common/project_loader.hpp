//===----------------------------------------------------------------------===//
//
// Part of the screeps-build project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/common/project_loader.hpp
// Purpose: Project root resolution and screeps.project manifest parsing.
// Key invariants: After successful resolution, rootDir is an absolute path to
//                 an existing directory.
// Ownership/Lifetime: Returned configurations are owned by the caller.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "build/BuildPipeline.hpp"
#include "support/diag_expected.hpp"

#include <string>

namespace screeps::tools::common
{

/// @brief File name of the optional per-project manifest.
inline constexpr const char *kManifestName = "screeps.project";

/// @brief Resolve a project from a CLI root argument.
///
/// The root must be an existing directory. When it contains a
/// screeps.project manifest, the manifest's directives are applied on top of
/// the defaults.
///
/// @param root CLI argument naming the project root.
/// @return Configuration on success, DiagCode::Config diagnostic on failure.
support::Expected<build::BuildConfig> resolveProject(const std::string &root);

/// @brief Parse a screeps.project manifest.
///
/// Recognised directives:
///   cargo <program>
///   release on|off
///
/// @param manifestPath Path to the manifest file.
/// @param config Configuration the directives are applied to.
/// @return Updated configuration, or a diagnostic of the form
///         "path:line: message".
support::Expected<build::BuildConfig> parseManifest(const std::string &manifestPath,
                                                    build::BuildConfig config);

} // namespace screeps::tools::common
