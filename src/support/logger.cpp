//===----------------------------------------------------------------------===//
//
// Part of the screeps-build project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/logger.cpp
// Purpose: Implements the verbosity-aware diagnostic reporter.
//
//===----------------------------------------------------------------------===//

#include "support/logger.hpp"

#include "support/diag_expected.hpp"

namespace screeps::support
{

Logger::Logger(std::ostream &os, bool verbose) : os_(os), verbose_(verbose) {}

void Logger::note(const std::string &message)
{
    report(makeNote(message));
}

void Logger::report(const Diagnostic &diag)
{
    if (diag.severity == Severity::Note)
    {
        if (!verbose_)
            return;
    }
    else
    {
        ++problems_;
    }
    printDiag(diag, os_);
}

size_t Logger::problemCount() const
{
    return problems_;
}

} // namespace screeps::support
