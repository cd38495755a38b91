//===----------------------------------------------------------------------===//
//
// Part of the Quill project, under the GNU GPL v3.
// SPDX-License-Identifier: GPL-3.0-only
//
//===----------------------------------------------------------------------===//
//
// File: include/quill/syntax/tokenizer.hpp
// Purpose: Declares the highlighting strategy interface and the rule-based
//          tokenizer that classifies every byte of a buffer in one pass.
// Key invariants: retokenize() leaves tags().size() == size() on every line and
//                 is deterministic, so rescanning unchanged text is a no-op.
// Ownership/Lifetime: Tokenizers borrow a static LanguageMode and own their
//                     palette; buffers own the tokenizer through Highlighter.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "quill/render/style.hpp"
#include "quill/syntax/highlight_tag.hpp"
#include "quill/syntax/language.hpp"
#include "quill/text/line.hpp"

#include <array>
#include <cstddef>
#include <memory>
#include <string_view>
#include <vector>

namespace quill::syntax
{

/// @brief Presentation colour for every highlight tag.
struct Palette
{
    std::array<render::RGBA, kHighlightTagCount> colours{};

    /// @brief Built-in colours: cyan identifiers, blue keywords, yellow numbers,
    ///        dark yellow brackets, red strings, green comments, magenta matches.
    static Palette defaults();

    render::RGBA &operator[](HighlightTag tag)
    {
        return colours[static_cast<std::size_t>(tag)];
    }

    const render::RGBA &operator[](HighlightTag tag) const
    {
        return colours[static_cast<std::size_t>(tag)];
    }
};

/// @brief Highlighting strategy attached to a buffer.
class Highlighter
{
  public:
    virtual ~Highlighter() = default;

    /// @brief Recompute the tags of every line from scratch.
    virtual void retokenize(std::vector<text::Line> &lines) const = 0;

    /// @brief Map @p tag to its presentation colour.
    [[nodiscard]] virtual render::RGBA colour(HighlightTag tag) const = 0;
};

/// @brief Single-pass lexical scanner driven by a LanguageMode.
///
/// Rules are tried in fixed priority at each position: word, number, string,
/// bracket, comment, then a one-byte Standard fallback.  Lines are scanned as
/// one stream joined by '\n' markers so block comments and unterminated
/// strings carry across line boundaries.
class Tokenizer final : public Highlighter
{
  public:
    explicit Tokenizer(const LanguageMode &mode, Palette palette = Palette::defaults());

    void retokenize(std::vector<text::Line> &lines) const override;

    [[nodiscard]] render::RGBA colour(HighlightTag tag) const override;

    /// @brief Classify every byte of @p chars.
    /// @return One tag per byte of @p chars, including '\n' markers.
    [[nodiscard]] std::vector<HighlightTag> scan(std::string_view chars) const;

    [[nodiscard]] const LanguageMode &mode() const
    {
        return mode_;
    }

    [[nodiscard]] const Palette &palette() const
    {
        return palette_;
    }

    // Rule lengths at the start of the given text; 0 means the rule does not apply.
    static std::size_t wordLength(std::string_view s);
    static std::size_t numberLength(std::string_view s);
    static std::size_t stringLength(std::string_view s);
    static std::size_t lineCommentLength(std::string_view s, std::string_view start);
    static std::size_t blockCommentLength(std::string_view s,
                                          std::string_view start,
                                          std::string_view end);
    static bool isBracket(char c);

  private:
    const LanguageMode &mode_;
    Palette palette_;
};

/// @brief Build the highlighter for mode @p language.
/// @return nullptr for "plain" and unknown names, which disables highlighting.
std::unique_ptr<Highlighter> makeHighlighter(std::string_view language,
                                             Palette palette = Palette::defaults());

} // namespace quill::syntax
