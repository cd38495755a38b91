//===----------------------------------------------------------------------===//
//
// Part of the Quill project, under the GNU GPL v3.
// SPDX-License-Identifier: GPL-3.0-only
//
//===----------------------------------------------------------------------===//
//
// File: include/quill/version.hpp
// Purpose: Declares the version query shown in the editor header.
// Key invariants: The returned string has static storage duration.
// Ownership/Lifetime: Callers must not free the returned pointer.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

namespace quill
{
/// @brief Semantic version of the editor, "major.minor.patch".
const char *quill_version() noexcept;
} // namespace quill
