/**
 * @file diagnostics.cpp
 * @brief Implements the diagnostic engine that records editor events.
 * @copyright
 *     GNU GPL v3 (SPDX-License-Identifier: GPL-3.0-only).
 * @details
 *     The engine doubles as the editor's log: loads, saves and configuration
 *     problems are reported here and printed once the terminal has been
 *     handed back to the shell.
 */

#include "quill/support/diagnostics.hpp"
#include "quill/support/expected.hpp"

namespace quill::support
{
/**
 * @brief Adds a diagnostic to the engine and updates severity counters.
 *
 * Notes are stored but not counted.
 *
 * @param d Diagnostic to record; moved into the engine's storage.
 */
void DiagnosticEngine::report(Diagnostic d)
{
    if (d.severity == Severity::Error)
        ++errors_;
    else if (d.severity == Severity::Warning)
        ++warnings_;
    diags_.push_back(std::move(d));
}

void DiagnosticEngine::note(std::string path, std::string message)
{
    report(Diagnostic{Severity::Note, std::move(message), std::move(path)});
}

void DiagnosticEngine::warn(std::string path, std::string message)
{
    report(Diagnostic{Severity::Warning, std::move(message), std::move(path)});
}

/**
 * @brief Writes all stored diagnostics to the provided output stream.
 *
 * Formatting is delegated to `printDiag` so single diagnostics and the engine
 * dump share one layout.
 *
 * @param os Output stream that receives the formatted diagnostics.
 */
void DiagnosticEngine::printAll(std::ostream &os) const
{
    for (const auto &d : diags_)
    {
        printDiag(d, os);
    }
}

size_t DiagnosticEngine::errorCount() const
{
    return errors_;
}

size_t DiagnosticEngine::warningCount() const
{
    return warnings_;
}
} // namespace quill::support
