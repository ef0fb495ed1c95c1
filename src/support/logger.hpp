//===----------------------------------------------------------------------===//
//
// Part of the screeps-build project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/logger.hpp
// Purpose: Routes progress notes and failure diagnostics to an output stream.
// Key invariants: Notes are only written when verbose output is enabled;
//                 errors and warnings are always written.
// Ownership/Lifetime: Logger borrows the stream; the caller keeps it alive.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diagnostics.hpp"

#include <cstddef>
#include <ostream>
#include <string>

namespace screeps::support
{

/// @brief Stream-backed reporter for pipeline progress and failures.
class Logger
{
  public:
    /// @param os Stream receiving all output, typically std::cerr.
    /// @param verbose Whether note-severity messages are emitted.
    Logger(std::ostream &os, bool verbose);

    /// @brief Emit a progress note when verbose output is enabled.
    void note(const std::string &message);

    /// @brief Emit @p diag, honouring the verbosity setting for notes.
    void report(const Diagnostic &diag);

    /// @brief Number of warning or error diagnostics reported so far.
    size_t problemCount() const;

    bool verbose() const
    {
        return verbose_;
    }

  private:
    std::ostream &os_;
    bool verbose_ = false;
    size_t problems_ = 0;
};

} // namespace screeps::support
