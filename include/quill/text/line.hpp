//===----------------------------------------------------------------------===//
//
// Part of the Quill project, under the GNU GPL v3.
// SPDX-License-Identifier: GPL-3.0-only
//
//===----------------------------------------------------------------------===//
//
// File: include/quill/text/line.hpp
// Purpose: One document row: raw bytes plus one highlight tag per byte.
// Key invariants: tags().size() == size() once the owning buffer has
//                 retokenized; edits leave tags stale until then.
// Ownership/Lifetime: Line owns its content and tag storage.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "quill/syntax/highlight_tag.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace quill::text
{

/// @brief Single row of text with its per-byte classification.
class Line
{
  public:
    Line() = default;

    explicit Line(std::string content);

    /// @brief Insert @p s before byte @p index (clamped to the line end).
    void insert(std::size_t index, std::string_view s);

    /// @brief Remove the byte at @p index; out-of-range indices are ignored.
    void erase(std::size_t index);

    /// @brief Append the content of @p other.
    void append(const Line &other);

    /// @brief Truncate at @p index and return the removed tail as a new line.
    Line splitAt(std::size_t index);

    /// @brief Find @p phrase at or after byte @p start.
    /// @return Absolute byte offset of the match within the line.
    [[nodiscard]] std::optional<std::size_t> find(std::string_view phrase,
                                                  std::size_t start) const;

    [[nodiscard]] std::size_t size() const
    {
        return content_.size();
    }

    [[nodiscard]] const std::string &content() const
    {
        return content_;
    }

    [[nodiscard]] const std::vector<syntax::HighlightTag> &tags() const
    {
        return tags_;
    }

    /// @brief Mutable tag access for the tokenizer and the search overlay.
    std::vector<syntax::HighlightTag> &tags()
    {
        return tags_;
    }

    /// @brief Tag every byte with @p tag, resizing the tag array to match.
    void fillTags(syntax::HighlightTag tag);

  private:
    std::string content_;
    std::vector<syntax::HighlightTag> tags_;
};

} // namespace quill::text
