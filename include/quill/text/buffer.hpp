//===----------------------------------------------------------------------===//
//
// Part of the Quill project, under the GNU GPL v3.
// SPDX-License-Identifier: GPL-3.0-only
//
//===----------------------------------------------------------------------===//
//
// File: include/quill/text/buffer.hpp
// Purpose: Declares the document buffer: an ordered list of lines, the active
//          highlighter, and the load/save/edit operations over them.
// Key invariants: The buffer always holds at least one line, and every
//                 completed operation leaves each line's tags aligned with its
//                 content because the whole document is retokenized after any
//                 mutation.
// Ownership/Lifetime: Buffer owns its lines and highlighter; cursors and
//                     storage are borrowed per call.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "quill/render/style.hpp"
#include "quill/support/expected.hpp"
#include "quill/syntax/tokenizer.hpp"
#include "quill/text/line.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace quill::text
{

class Cursor;
class Storage;

/// @brief Spaces a tab expands to unless configured otherwise.
inline constexpr std::size_t kDefaultTabWidth = 4;

/// @brief Multi-line text document with syntax tags.
class Buffer
{
  public:
    /// @brief Create a blank buffer without highlighting.
    Buffer();

    /// @brief Create a blank buffer highlighted by @p highlighter (may be null).
    explicit Buffer(std::unique_ptr<syntax::Highlighter> highlighter);

    /// @brief Replace the document with @p content split on line breaks.
    /// @details A failed read yields one blank line, exactly like an empty
    ///          file; callers that care inspect @p content themselves.
    void load(const support::Expected<std::string> &content);

    /// @brief Read @p path through @p storage and load the result.
    /// @return True when the read succeeded.
    bool loadFrom(Storage &storage, const std::string &path);

    /// @brief Write the joined document to @p path through @p storage.
    [[nodiscard]] support::Expected<void> save(Storage &storage, const std::string &path) const;

    /// @brief Write the joined document to @p path on the local filesystem.
    [[nodiscard]] support::Expected<void> save(const std::string &path) const;

    /// @brief Lines joined by a single '\n', without a trailing terminator.
    [[nodiscard]] std::string serialize() const;

    /// @brief Insert @p c at the cursor; a tab expands to tabWidth() spaces.
    void insertChar(char c, Cursor &cursor);

    /// @brief Split the current line at the cursor and move to the new line.
    void newLine(Cursor &cursor);

    /// @brief Backspace: delete before the cursor or join with the previous line.
    void deleteChar(Cursor &cursor);

    /// @brief Find @p phrase in line @p index at or after byte @p start.
    [[nodiscard]] std::optional<std::size_t> findPhrase(std::string_view phrase,
                                                        std::size_t index,
                                                        std::size_t start) const;

    /// @brief Length of line @p index, or 0 when it does not exist.
    [[nodiscard]] std::size_t lineLen(std::size_t index) const;

    [[nodiscard]] std::size_t lineCount() const
    {
        return lines_.size();
    }

    [[nodiscard]] const Line &line(std::size_t index) const
    {
        return lines_[index];
    }

    [[nodiscard]] const std::vector<Line> &lines() const
    {
        return lines_;
    }

    /// @brief Tag @p length bytes from @p at as a search match.
    void markSearchResult(std::size_t lineIndex, std::size_t at, std::size_t length);

    /// @brief Recompute all tags, discarding any search overlay.
    void retokenize();

    /// @brief Swap the highlighting strategy and retokenize.
    void setHighlighter(std::unique_ptr<syntax::Highlighter> highlighter);

    [[nodiscard]] const syntax::Highlighter *highlighter() const
    {
        return highlighter_.get();
    }

    /// @brief Colours used while no highlighter is attached.
    void setPalette(const syntax::Palette &palette)
    {
        palette_ = palette;
    }

    /// @brief Presentation colour for @p tag.
    /// @details Without a highlighter every tag renders in the standard colour
    ///          except search matches, which keep their own.
    [[nodiscard]] render::RGBA colour(syntax::HighlightTag tag) const;

    void setTabWidth(std::size_t width)
    {
        tabWidth_ = width;
    }

    [[nodiscard]] std::size_t tabWidth() const
    {
        return tabWidth_;
    }

  private:
    std::vector<Line> lines_;
    std::unique_ptr<syntax::Highlighter> highlighter_;
    syntax::Palette palette_ = syntax::Palette::defaults();
    std::size_t tabWidth_ = kDefaultTabWidth;
};

} // namespace quill::text
