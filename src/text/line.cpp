// src/text/line.cpp
// @brief Byte-level editing primitives for a single line.
// @invariant Content edits never touch tags; the buffer retokenizes afterwards.
// @ownership Line owns its content and tags.

#include "quill/text/line.hpp"

#include <algorithm>
#include <utility>

namespace quill::text
{

Line::Line(std::string content) : content_(std::move(content)) {}

void Line::insert(std::size_t index, std::string_view s)
{
    content_.insert(std::min(index, content_.size()), s);
}

void Line::erase(std::size_t index)
{
    if (index < content_.size())
    {
        content_.erase(index, 1);
    }
}

void Line::append(const Line &other)
{
    content_ += other.content_;
}

Line Line::splitAt(std::size_t index)
{
    index = std::min(index, content_.size());
    Line tail(content_.substr(index));
    content_.resize(index);
    return tail;
}

std::optional<std::size_t> Line::find(std::string_view phrase, std::size_t start) const
{
    if (start > content_.size())
    {
        return std::nullopt;
    }
    const auto pos = std::string_view(content_).find(phrase, start);
    if (pos == std::string_view::npos)
    {
        return std::nullopt;
    }
    return pos;
}

void Line::fillTags(syntax::HighlightTag tag)
{
    tags_.assign(content_.size(), tag);
}

} // namespace quill::text
