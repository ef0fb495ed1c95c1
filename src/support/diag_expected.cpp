//===----------------------------------------------------------------------===//
//
// Part of the screeps-build project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the diagnostic-oriented Expected helpers used across the support
// library.  Expected<void> is the return type of every pipeline step that
// produces no value, so its out-of-line members live here together with the
// diagnostic factories.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Supplies the `Expected<void>` helpers specialized for diagnostics.

#include "diag_expected.hpp"

namespace screeps::support
{
/// @brief Construct an Expected<void> that stores a diagnostic error state.
///
/// @details A default-constructed `Expected` contains no diagnostic payload and
///          represents success.
Expected<void>::Expected(Diag diag) : error_(std::move(diag))
{
}

/// @brief Report whether the Expected<void> represents a successful outcome.
///
/// @return True if the instance holds no diagnostic (success), otherwise false.
bool Expected<void>::hasValue() const
{
    return !error_.has_value();
}

/// @brief Allow Expected<void> to participate directly in boolean tests.
Expected<void>::operator bool() const
{
    return hasValue();
}

/// @brief Access the diagnostic that describes the recorded failure.
///
/// @details Callers must ensure the `Expected` represents an error before
///          invoking this accessor.
const Diag &Expected<void>::error() const &
{
    return *error_;
}

/// @brief Build an error diagnostic with the provided category and message.
Diag makeError(DiagCode code, std::string msg)
{
    return Diag{Severity::Error, std::move(msg), code};
}

Diag makeNote(std::string msg)
{
    return Diag{Severity::Note, std::move(msg), DiagCode::None};
}
} // namespace screeps::support
