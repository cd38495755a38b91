//===----------------------------------------------------------------------===//
//
// Part of the Quill project, under the GNU GPL v3.
// SPDX-License-Identifier: GPL-3.0-only
//
//===----------------------------------------------------------------------===//
//
// File: src/version.cpp
// Purpose: Provide the version string printed in the editor header and by
//          `quill --version`.
// Key invariants: Matches the VERSION recorded in the CMake project() call.
// Ownership/Lifetime: Returns a pointer to a string literal.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#include "quill/version.hpp"

namespace quill
{
const char *quill_version() noexcept
{
    return "0.1.0";
}
} // namespace quill
