//===----------------------------------------------------------------------===//
//
// Part of the Quill project, under the GNU GPL v3.
// SPDX-License-Identifier: GPL-3.0-only
//
//===----------------------------------------------------------------------===//
//
// File: src/syntax/language.cpp
// Purpose: Keyword tables and extension mapping for the built-in language
//          modes.
// Key invariants: Every table is sorted; enforced at compile time.
// Ownership/Lifetime: All data has static storage duration.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#include "quill/syntax/language.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <string>

namespace quill::syntax
{

namespace
{
constexpr std::array<std::string_view, 23> kRustKeywords{{
    "as",    "break",  "continue", "else",        "enum",  "false", "fn",    "for",
    "if",    "impl",   "let",      "loop",        "macro_rules", "match", "mod",   "mut",
    "pub",   "return", "struct",   "trait",       "true",  "use",   "while",
}};

constexpr std::array<std::string_view, 34> kCKeywords{{
    "auto",     "break",    "case",     "char",   "const",    "continue", "default",
    "do",       "double",   "else",     "enum",   "extern",   "float",    "for",
    "goto",     "if",       "inline",   "int",    "long",     "register", "restrict",
    "return",   "short",    "signed",   "sizeof", "static",   "struct",   "switch",
    "typedef",  "union",    "unsigned", "void",   "volatile", "while",
}};

constexpr std::array<std::string_view, 62> kCppKeywords{{
    "alignas",  "alignof",   "auto",     "bool",     "break",    "case",     "catch",
    "char",     "class",     "const",    "constexpr", "continue", "decltype", "default",
    "delete",   "do",        "double",   "else",     "enum",     "explicit", "extern",
    "false",    "final",     "float",    "for",      "friend",   "goto",     "if",
    "inline",   "int",       "long",     "mutable",  "namespace", "new",     "noexcept",
    "nullptr",  "operator",  "override", "private",  "protected", "public",  "return",
    "short",    "signed",    "sizeof",   "static",   "struct",   "switch",   "template",
    "this",     "throw",     "true",     "try",      "typedef",  "typename", "union",
    "unsigned", "using",     "virtual",  "void",     "volatile", "while",
}};

template <std::size_t N> constexpr bool isSorted(const std::array<std::string_view, N> &table)
{
    for (std::size_t i = 1; i < N; ++i)
    {
        if (!(table[i - 1] < table[i]))
            return false;
    }
    return true;
}

static_assert(isSorted(kRustKeywords), "Rust keyword table must be sorted lexicographically");
static_assert(isSorted(kCKeywords), "C keyword table must be sorted lexicographically");
static_assert(isSorted(kCppKeywords), "C++ keyword table must be sorted lexicographically");

const LanguageMode kRust{"rust", kRustKeywords, "//", "/*", "*/"};
const LanguageMode kC{"c", kCKeywords, "//", "/*", "*/"};
const LanguageMode kCpp{"cpp", kCppKeywords, "//", "/*", "*/"};

struct ExtensionEntry
{
    std::string_view extension;
    std::string_view language;
};

constexpr std::array<ExtensionEntry, 11> kExtensions{{
    {"c", "c"},
    {"cc", "cpp"},
    {"cpp", "cpp"},
    {"cxx", "cpp"},
    {"h", "c"},
    {"hh", "cpp"},
    {"hpp", "cpp"},
    {"hxx", "cpp"},
    {"md", "plain"},
    {"rs", "rust"},
    {"txt", "plain"},
}};
} // namespace

bool LanguageMode::isKeyword(std::string_view word) const
{
    return std::binary_search(keywords.begin(), keywords.end(), word);
}

const LanguageMode *findLanguage(std::string_view name)
{
    if (name == kRust.name)
        return &kRust;
    if (name == kC.name)
        return &kC;
    if (name == kCpp.name)
        return &kCpp;
    return nullptr;
}

std::string_view languageForPath(std::string_view path)
{
    const auto slash = path.find_last_of("/\\");
    const std::string_view base = slash == std::string_view::npos ? path : path.substr(slash + 1);
    const auto dot = base.rfind('.');
    if (dot == std::string_view::npos || dot == 0)
        return kRust.name;

    std::string ext(base.substr(dot + 1));
    std::transform(
        ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return std::tolower(c); });
    for (const auto &entry : kExtensions)
    {
        if (entry.extension == ext)
            return entry.language;
    }
    return kRust.name;
}

} // namespace quill::syntax
