//===----------------------------------------------------------------------===//
//
// Part of the Quill project, under the GNU GPL v3.
// SPDX-License-Identifier: GPL-3.0-only
//
//===----------------------------------------------------------------------===//
//
// Implements the out-of-line pieces of Expected<void> together with the
// helpers that build and print diagnostics.  Storage and configuration code
// report failures through these so every message reaches the user in the same
// "<path>: <severity>: <message>" shape.
//
//===----------------------------------------------------------------------===//

#include "quill/support/expected.hpp"

namespace quill::support
{
/// @brief Construct an Expected<void> that stores a diagnostic error state.
/// @param diag Diagnostic to transfer into the error payload.
Expected<void>::Expected(Diag diag) : error_(std::move(diag)) {}

/// @brief Success is the absence of a stored diagnostic.
bool Expected<void>::hasValue() const
{
    return !error_.has_value();
}

Expected<void>::operator bool() const
{
    return hasValue();
}

/// @brief Access the diagnostic; only valid when hasValue() is false.
const Diag &Expected<void>::error() const &
{
    return *error_;
}

const char *severityToString(Severity severity)
{
    switch (severity)
    {
        case Severity::Note:
            return "note";
        case Severity::Warning:
            return "warning";
        case Severity::Error:
            return "error";
    }
    return "";
}

Diag makeError(std::string path, std::string msg)
{
    return Diagnostic{Severity::Error, std::move(msg), std::move(path)};
}

void printDiag(const Diag &diag, std::ostream &os)
{
    if (!diag.path.empty())
        os << diag.path << ": ";
    os << severityToString(diag.severity) << ": " << diag.message << '\n';
}
} // namespace quill::support
