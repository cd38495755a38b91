// include/quill/syntax/highlight_tag.hpp
// @brief Lexical classification attached to every byte of a line.
// @invariant The set is closed; SearchResult is only produced by the search overlay.
// @ownership Plain value type.
#pragma once

#include <cstddef>
#include <cstdint>

namespace quill::syntax
{

enum class HighlightTag : uint8_t
{
    Standard,
    Identifier,
    Keyword,
    Number,
    Bracket,
    String,
    Comment,
    SearchResult,
};

/// @brief Number of distinct tags; sizes per-tag tables such as palettes.
inline constexpr std::size_t kHighlightTagCount = 8;

} // namespace quill::syntax
