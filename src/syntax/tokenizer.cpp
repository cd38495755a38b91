//===----------------------------------------------------------------------===//
//
// Part of the Quill project, under the GNU GPL v3.
// SPDX-License-Identifier: GPL-3.0-only
//
//===----------------------------------------------------------------------===//
//
// File: src/syntax/tokenizer.cpp
// Purpose: Classify buffer bytes into highlight tags with a fixed-priority
//          rule scan over the whole document.
// Key invariants: The scan position only moves forward and every rule that
//                 matches consumes at least one byte, so the scan terminates
//                 with exactly one tag per byte.
// Ownership/Lifetime: Stateless apart from the borrowed mode and the palette.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#include "quill/syntax/tokenizer.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <utility>

namespace quill::syntax
{

namespace
{
/// @brief Letters, underscore and any non-ASCII byte start or continue a word.
bool isWordStart(char c)
{
    const auto uc = static_cast<unsigned char>(c);
    return std::isalpha(uc) || c == '_' || uc >= 0x80;
}

bool isDigit(char c)
{
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

bool startsWith(std::string_view s, std::string_view prefix)
{
    return !prefix.empty() && s.substr(0, prefix.size()) == prefix;
}
} // namespace

Palette Palette::defaults()
{
    Palette p;
    p[HighlightTag::Standard] = {229, 229, 229, 255};
    p[HighlightTag::Identifier] = {0, 205, 205, 255};
    p[HighlightTag::Keyword] = {59, 142, 234, 255};
    p[HighlightTag::Number] = {229, 229, 16, 255};
    p[HighlightTag::Bracket] = {175, 135, 0, 255};
    p[HighlightTag::String] = {205, 49, 49, 255};
    p[HighlightTag::Comment] = {0, 135, 0, 255};
    p[HighlightTag::SearchResult] = {205, 0, 205, 255};
    return p;
}

Tokenizer::Tokenizer(const LanguageMode &mode, Palette palette)
    : mode_(mode), palette_(std::move(palette))
{
}

render::RGBA Tokenizer::colour(HighlightTag tag) const
{
    return palette_[tag];
}

std::size_t Tokenizer::wordLength(std::string_view s)
{
    std::size_t len = 0;
    while (len < s.size())
    {
        const char c = s[len];
        if (isWordStart(c) || (len > 0 && isDigit(c)))
            ++len;
        else
            break;
    }
    return len;
}

std::size_t Tokenizer::numberLength(std::string_view s)
{
    std::size_t len = 0;
    while (len < s.size())
    {
        const char c = s[len];
        if (isDigit(c) || (len > 0 && (c == '_' || c == '.')))
            ++len;
        else
            break;
    }
    return len;
}

/// A string without its closing quote runs to the end of @p s, which is the
/// rest of the whole buffer during a scan.
std::size_t Tokenizer::stringLength(std::string_view s)
{
    if (s.empty() || (s[0] != '"' && s[0] != '\''))
        return 0;
    const char quote = s[0];
    std::size_t len = 1;
    bool escaped = false;
    while (len < s.size())
    {
        const char c = s[len];
        ++len;
        if (!escaped && c == quote)
            break;
        escaped = c == '\\' && !escaped;
    }
    return len;
}

/// Includes the terminating '\n' marker when one is present.
std::size_t Tokenizer::lineCommentLength(std::string_view s, std::string_view start)
{
    if (!startsWith(s, start))
        return 0;
    std::size_t len = start.size();
    while (len < s.size())
    {
        const char c = s[len];
        ++len;
        if (c == '\n')
            break;
    }
    return len;
}

/// Every further start delimiter deepens the nesting and every end delimiter
/// pops it; the comment ends at the first byte seen at depth zero.
std::size_t Tokenizer::blockCommentLength(std::string_view s,
                                          std::string_view start,
                                          std::string_view end)
{
    if (end.empty() || !startsWith(s, start))
        return 0;
    std::size_t len = start.size();
    int depth = 1;
    while (len < s.size())
    {
        const std::string_view rest = s.substr(len);
        if (startsWith(rest, start))
        {
            ++depth;
            len += start.size();
            continue;
        }
        if (startsWith(rest, end))
        {
            --depth;
            len += end.size();
            continue;
        }
        if (depth == 0)
            break;
        ++len;
    }
    return len;
}

bool Tokenizer::isBracket(char c)
{
    switch (c)
    {
        case '(':
        case ')':
        case '{':
        case '}':
        case '[':
        case ']':
            return true;
        default:
            return false;
    }
}

std::vector<HighlightTag> Tokenizer::scan(std::string_view chars) const
{
    std::vector<HighlightTag> tags;
    tags.reserve(chars.size());
    auto emit = [&tags](HighlightTag tag, std::size_t count) { tags.insert(tags.end(), count, tag); };

    std::size_t i = 0;
    while (i < chars.size())
    {
        const std::string_view rest = chars.substr(i);

        if (const auto len = wordLength(rest); len > 0)
        {
            const bool keyword = mode_.isKeyword(rest.substr(0, len));
            emit(keyword ? HighlightTag::Keyword : HighlightTag::Identifier, len);
            i += len;
            continue;
        }

        if (const auto len = numberLength(rest); len > 0)
        {
            emit(HighlightTag::Number, len);
            i += len;
            continue;
        }

        if (const auto len = stringLength(rest); len > 0)
        {
            emit(HighlightTag::String, len);
            i += len;
            continue;
        }

        if (isBracket(rest[0]))
        {
            emit(HighlightTag::Bracket, 1);
            ++i;
            continue;
        }

        // The longer candidate wins when both comment forms could start here.
        const auto comment = std::max(lineCommentLength(rest, mode_.lineComment),
                                      blockCommentLength(rest, mode_.blockStart, mode_.blockEnd));
        if (comment > 0)
        {
            emit(HighlightTag::Comment, comment);
            i += comment;
            continue;
        }

        emit(HighlightTag::Standard, 1);
        ++i;
    }
    return tags;
}

void Tokenizer::retokenize(std::vector<text::Line> &lines) const
{
    std::string chars;
    std::size_t total = 0;
    for (const auto &line : lines)
        total += line.size() + 1;
    chars.reserve(total);
    for (const auto &line : lines)
    {
        chars += line.content();
        chars += '\n';
    }

    const std::vector<HighlightTag> tags = scan(chars);

    // Hand each line the slice covering its bytes and skip the marker after it.
    auto it = tags.begin();
    for (auto &line : lines)
    {
        auto &out = line.tags();
        out.assign(it, it + static_cast<std::ptrdiff_t>(line.size()));
        it += static_cast<std::ptrdiff_t>(line.size()) + 1;
    }
}

std::unique_ptr<Highlighter> makeHighlighter(std::string_view language, Palette palette)
{
    if (const LanguageMode *mode = findLanguage(language))
        return std::make_unique<Tokenizer>(*mode, std::move(palette));
    return nullptr;
}

} // namespace quill::syntax
