//===----------------------------------------------------------------------===//
//
// Part of the Quill project, under the GNU GPL v3.
// SPDX-License-Identifier: GPL-3.0-only
//
//===----------------------------------------------------------------------===//
//
// File: include/quill/syntax/language.hpp
// Purpose: Describes the language modes the tokenizer can run in: a sorted
//          keyword table plus line and block comment delimiters.
// Key invariants: Keyword tables are sorted so lookups can binary search.
// Ownership/Lifetime: Modes are static tables; callers hold non-owning
//                     pointers that stay valid for the program lifetime.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <span>
#include <string_view>

namespace quill::syntax
{

/// @brief Static description of one highlighting language.
struct LanguageMode
{
    std::string_view name;
    std::span<const std::string_view> keywords; ///< Sorted lexicographically.
    std::string_view lineComment;               ///< Empty disables the rule.
    std::string_view blockStart;                ///< Empty disables the rule.
    std::string_view blockEnd;

    /// @brief Check whether @p word is exactly one of the mode's keywords.
    [[nodiscard]] bool isKeyword(std::string_view word) const;
};

/// @brief Look up a built-in mode by name ("rust", "c", "cpp").
/// @return Pointer to the static mode, or nullptr for "plain" and unknown names.
const LanguageMode *findLanguage(std::string_view name);

/// @brief Pick a mode name for @p path from its extension.
/// @details Unknown or missing extensions fall back to "rust"; ".txt" and ".md"
///          map to "plain".
std::string_view languageForPath(std::string_view path);

} // namespace quill::syntax
