//===----------------------------------------------------------------------===//
//
// Part of the screeps-build project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/file_loader.hpp
// Purpose: Read whole files into memory with diagnostics on failure.
// Key invariants: The returned buffer holds the complete file contents byte for byte.
// Ownership/Lifetime: The caller owns the returned buffer.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"

#include <string>

namespace screeps::support
{

/// @brief Largest file loadFile() accepts.
inline constexpr unsigned long long kMaxLoadSize = 256ULL * 1024 * 1024;

/// @brief Load @p path in binary mode.
/// @return File contents on success; otherwise a DiagCode::Io diagnostic
///         describing the open, size or allocation failure.
Expected<std::string> loadFile(const std::string &path);

} // namespace screeps::support
