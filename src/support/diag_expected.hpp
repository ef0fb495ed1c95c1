//===----------------------------------------------------------------------===//
//
// Part of the screeps-build project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/diag_expected.hpp
// Purpose: Provides a lightweight Expected container carrying a Diagnostic on failure.
// Key invariants: An Expected holds either a value or a diagnostic, never both.
// Ownership/Lifetime: Expected owns its value or diagnostic.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diagnostics.hpp"

#include <optional>
#include <string>
#include <type_traits>
#include <utility>

namespace screeps::support
{
using Diag = Diagnostic;

/// @brief Expected-style container pairing a value with a diagnostic on error.
/// @tparam T Stored value type when the operation succeeds.
/// @note Mirrors a subset of std::expected for tool-only usage until the
///       standard type becomes universally available on our toolchain.
template <class T> class Expected
{
  public:
    /// @brief Construct a successful result containing @p value.
    /// @details Enabled only when the provided value does not decay to Diag to
    ///          avoid colliding with the diagnostic constructor below.
    template <class U = T, class = std::enable_if_t<!std::is_same_v<std::decay_t<U>, Diag>>>
    Expected(U &&value) : value_(std::forward<U>(value))
    {
    }

    /// @brief Construct an error result holding diagnostic @p diag.
    Expected(Diag diag) : error_(std::move(diag)) {}

    /// @brief Check whether a value is present.
    [[nodiscard]] bool hasValue() const
    {
        return value_.has_value();
    }

    explicit operator bool() const
    {
        return hasValue();
    }

    /// @brief Access the stored value; requires hasValue().
    T &value()
    {
        return *value_;
    }

    /// @brief Access the stored value; requires hasValue().
    const T &value() const
    {
        return *value_;
    }

    /// @brief Access the diagnostic describing the failure.
    const Diag &error() const &
    {
        return *error_;
    }

  private:
    std::optional<T> value_;
    std::optional<Diag> error_;
};

/// @brief Expected specialization for void success type.
template <> class Expected<void>
{
  public:
    /// @brief Construct a successful result with no payload.
    Expected() = default;

    /// @brief Construct an error result holding diagnostic @p diag.
    Expected(Diag diag);

    [[nodiscard]] bool hasValue() const;

    explicit operator bool() const;

    /// @brief Access the diagnostic describing the failure.
    const Diag &error() const &;

  private:
    std::optional<Diag> error_;
};

/// @brief Create an error diagnostic tagged with @p code.
/// @param code Failure category.
/// @param msg Human-readable diagnostic message.
/// @return Diagnostic marked as an error severity.
Diag makeError(DiagCode code, std::string msg);

/// @brief Create a note diagnostic used for progress reporting.
Diag makeNote(std::string msg);

} // namespace screeps::support
