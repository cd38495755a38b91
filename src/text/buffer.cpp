//===----------------------------------------------------------------------===//
//
// Part of the Quill project, under the GNU GPL v3.
// SPDX-License-Identifier: GPL-3.0-only
//
//===----------------------------------------------------------------------===//
//
// File: src/text/buffer.cpp
// Purpose: Implement document loading, saving and the three edit operations
//          (insert, split, backspace) on top of the line list.
// Key invariants: Every mutation ends with a full retokenization so multi-line
//                 constructs such as nested block comments are resolved from
//                 the start of the document.
// Ownership/Lifetime: Buffer owns its lines; storage and cursors are borrowed.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#include "quill/text/buffer.hpp"

#include "quill/text/cursor.hpp"
#include "quill/text/storage.hpp"

#include <utility>

namespace quill::text
{

namespace
{
/// @brief Split on '\n', dropping a '\r' before it; a final break adds no line.
std::vector<Line> splitLines(std::string_view content)
{
    std::vector<Line> lines;
    std::size_t start = 0;
    while (start < content.size())
    {
        const auto nl = content.find('\n', start);
        if (nl == std::string_view::npos)
        {
            lines.emplace_back(std::string(content.substr(start)));
            break;
        }
        std::string_view row = content.substr(start, nl - start);
        if (!row.empty() && row.back() == '\r')
            row.remove_suffix(1);
        lines.emplace_back(std::string(row));
        start = nl + 1;
    }
    if (lines.empty())
        lines.emplace_back();
    return lines;
}
} // namespace

Buffer::Buffer() : Buffer(nullptr) {}

Buffer::Buffer(std::unique_ptr<syntax::Highlighter> highlighter)
    : highlighter_(std::move(highlighter))
{
    lines_.emplace_back();
    retokenize();
}

void Buffer::load(const support::Expected<std::string> &content)
{
    if (content)
        lines_ = splitLines(content.value());
    else
        lines_.assign(1, Line());
    retokenize();
}

bool Buffer::loadFrom(Storage &storage, const std::string &path)
{
    const auto content = storage.read(path);
    load(content);
    return content.hasValue();
}

std::string Buffer::serialize() const
{
    std::string out;
    for (std::size_t i = 0; i < lines_.size(); ++i)
    {
        if (i > 0)
            out += '\n';
        out += lines_[i].content();
    }
    return out;
}

support::Expected<void> Buffer::save(Storage &storage, const std::string &path) const
{
    return storage.write(path, serialize());
}

support::Expected<void> Buffer::save(const std::string &path) const
{
    FileStorage storage;
    return save(storage, path);
}

void Buffer::insertChar(char c, Cursor &cursor)
{
    const Position pos = cursor.position();
    Line &line = lines_[cursor.lineIndex()];
    if (c == '\t')
    {
        line.insert(pos.x, std::string(tabWidth_, ' '));
        cursor.setPosition(pos.x + tabWidth_, pos.y);
    }
    else
    {
        line.insert(pos.x, std::string_view(&c, 1));
        cursor.setPosition(pos.x + 1, pos.y);
    }
    retokenize();
}

void Buffer::newLine(Cursor &cursor)
{
    const std::size_t index = cursor.lineIndex();
    const Position pos = cursor.position();
    Line tail = lines_[index].splitAt(pos.x);
    lines_.insert(lines_.begin() + static_cast<std::ptrdiff_t>(index) + 1, std::move(tail));
    retokenize();
    cursor.setPosition(0, pos.y + 1);
}

void Buffer::deleteChar(Cursor &cursor)
{
    const std::size_t index = cursor.lineIndex();
    const Position pos = cursor.position();
    if (pos.x > 0)
    {
        lines_[index].erase(pos.x - 1);
        cursor.setPosition(pos.x - 1, pos.y);
    }
    else if (pos.y > 0)
    {
        Line removed = std::move(lines_[index]);
        lines_.erase(lines_.begin() + static_cast<std::ptrdiff_t>(index));
        Line &previous = lines_[index - 1];
        const std::size_t joinAt = previous.size();
        previous.append(removed);
        cursor.setPosition(joinAt, pos.y - 1);
    }
    retokenize();
}

std::optional<std::size_t> Buffer::findPhrase(std::string_view phrase,
                                              std::size_t index,
                                              std::size_t start) const
{
    if (index >= lines_.size())
        return std::nullopt;
    return lines_[index].find(phrase, start);
}

std::size_t Buffer::lineLen(std::size_t index) const
{
    return index < lines_.size() ? lines_[index].size() : 0;
}

void Buffer::markSearchResult(std::size_t lineIndex, std::size_t at, std::size_t length)
{
    if (lineIndex >= lines_.size())
        return;
    auto &tags = lines_[lineIndex].tags();
    for (std::size_t i = at; i < at + length && i < tags.size(); ++i)
        tags[i] = syntax::HighlightTag::SearchResult;
}

void Buffer::retokenize()
{
    if (highlighter_)
    {
        highlighter_->retokenize(lines_);
        return;
    }
    for (auto &line : lines_)
        line.fillTags(syntax::HighlightTag::Standard);
}

void Buffer::setHighlighter(std::unique_ptr<syntax::Highlighter> highlighter)
{
    highlighter_ = std::move(highlighter);
    retokenize();
}

render::RGBA Buffer::colour(syntax::HighlightTag tag) const
{
    if (highlighter_)
        return highlighter_->colour(tag);
    if (tag == syntax::HighlightTag::SearchResult)
        return palette_[tag];
    return palette_[syntax::HighlightTag::Standard];
}

} // namespace quill::text
