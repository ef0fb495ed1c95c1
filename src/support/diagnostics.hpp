//===----------------------------------------------------------------------===//
//
// Part of the screeps-build project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/diagnostics.hpp
// Purpose: Declares diagnostic records and the stream printer used by every stage.
// Key invariants: Error diagnostics carry a DiagCode other than DiagCode::None.
// Ownership/Lifetime: Diagnostics are value types.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <ostream>
#include <string>

namespace screeps::support
{

/// @brief Severity levels for diagnostics.
enum class Severity
{
    Note,
    Warning,
    Error
};

/// @brief Failure category attached to error diagnostics.
/// @details Every category is fatal for the pipeline; the code exists so
///          callers and tests can tell failures apart without parsing text.
enum class DiagCode
{
    None,                ///< Informational diagnostic.
    Spawn,               ///< External program could not be started.
    Execution,           ///< External program exited non-zero.
    MissingArtifact,     ///< Required artifact category absent.
    AmbiguousArtifact,   ///< Required artifact category has several candidates.
    UnexpectedStructure, ///< Generated script does not match the expected template.
    MissingEntryPoint,   ///< Payload lacks the initialization entry point.
    Io,                  ///< File or directory could not be read or written.
    Config,              ///< Project manifest is malformed.
    Usage                ///< Command line is malformed.
};

/// @brief Single diagnostic message.
struct Diagnostic
{
    Severity severity;             ///< Message severity
    std::string message;           ///< Human-readable text
    DiagCode code = DiagCode::None; ///< Failure category
    int exitCode = 0;              ///< Child exit status for DiagCode::Execution
};

/// @brief Convert diagnostic severity to lowercase string.
const char *severityToString(Severity severity);

/// @brief Print a single diagnostic as "<severity>: <message>".
/// @param diag Diagnostic to format.
/// @param os Output stream receiving the text.
void printDiag(const Diagnostic &diag, std::ostream &os);

} // namespace screeps::support
