//===----------------------------------------------------------------------===//
//
// Part of the Quill project, under the GNU GPL v3.
// SPDX-License-Identifier: GPL-3.0-only
//
//===----------------------------------------------------------------------===//
//
// File: include/quill/support/diagnostics.hpp
// Purpose: Declares the diagnostic record and the engine that collects editor
//          events (loads, saves, config problems) for later printing.
// Key invariants: Severity counters always match the recorded diagnostics.
// Ownership/Lifetime: Engine owns collected diagnostics.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

namespace quill::support
{

/// @brief Severity levels for diagnostics.
enum class Severity
{
    Note,
    Warning,
    Error
};

/// @brief Single diagnostic message, optionally tied to a file path.
struct Diagnostic
{
    Severity severity = Severity::Error; ///< Message severity
    std::string message;                 ///< Human-readable text
    std::string path;                    ///< File the message refers to; may be empty
};

/// @brief Collects diagnostics and prints them in order.
class DiagnosticEngine
{
  public:
    /// @brief Record diagnostic @p d.
    void report(Diagnostic d);

    /// @brief Convenience wrapper building a note for @p path.
    void note(std::string path, std::string message);

    /// @brief Convenience wrapper building a warning for @p path.
    void warn(std::string path, std::string message);

    /// @brief Print all recorded diagnostics to stream @p os.
    void printAll(std::ostream &os) const;

    /// @brief Access recorded diagnostics in reporting order.
    [[nodiscard]] const std::vector<Diagnostic> &diagnostics() const
    {
        return diags_;
    }

    /// @brief Number of errors reported.
    size_t errorCount() const;

    /// @brief Number of warnings reported.
    size_t warningCount() const;

  private:
    std::vector<Diagnostic> diags_;
    size_t errors_ = 0;
    size_t warnings_ = 0;
};

} // namespace quill::support
