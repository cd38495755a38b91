//===----------------------------------------------------------------------===//
//
// Part of the Quill project, under the GNU GPL v3.
// SPDX-License-Identifier: GPL-3.0-only
//
//===----------------------------------------------------------------------===//
//
// File: include/quill/support/expected.hpp
// Purpose: Lightweight Expected container pairing a value with a diagnostic on
//          failure; used for every fallible storage operation.
// Key invariants: An Expected holds either a value or a diagnostic, never both.
// Ownership/Lifetime: Expected owns its value or diagnostic.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "quill/support/diagnostics.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>

namespace quill::support
{
using Diag = Diagnostic;

/// @brief Expected-style container pairing a value with a diagnostic on error.
/// @tparam T Stored value type when the operation succeeds.
template <class T> class Expected
{
  public:
    /// @brief Construct a successful result containing @p value.
    /// @details Disabled for arguments decaying to Diag so the diagnostic
    ///          constructor below is always chosen for errors.
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

    /// @brief Access the diagnostic describing the failure; requires !hasValue().
    const Diag &error() const &
    {
        return *error_;
    }

  private:
    std::optional<T> value_;
    std::optional<Diag> error_;
};

/// @brief Expected specialization for operations without a result value.
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

/// @brief Convert diagnostic severity to its lowercase spelling.
const char *severityToString(Severity severity);

/// @brief Create an error diagnostic for @p path with message @p msg.
Diag makeError(std::string path, std::string msg);

/// @brief Print a single diagnostic as "<path>: <severity>: <message>".
/// @details The path prefix is omitted when the diagnostic carries none.
void printDiag(const Diag &diag, std::ostream &os);

} // namespace quill::support
