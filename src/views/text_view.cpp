// src/views/text_view.cpp
// @brief TextView painting: gutter marks plus colour runs of the visible slice.
// @invariant Runs never cross a colour change or the viewport's right edge.
// @ownership Borrows buffer, cursor and sink.

#include "quill/views/text_view.hpp"

#include <algorithm>
#include <string_view>

namespace quill::views
{

using syntax::HighlightTag;

TextView::TextView(const text::Buffer &buffer, const text::Cursor &cursor)
    : buffer_(buffer), cursor_(cursor)
{
}

void TextView::paint(render::DisplaySink &sink) const
{
    const text::ViewportSize size = cursor_.size();
    const std::size_t top = cursor_.offset().y;
    const render::RGBA gutter = buffer_.colour(HighlightTag::Standard);
    for (std::size_t i = 0; i < size.height; ++i)
    {
        const int row = kMarginRows + static_cast<int>(i);
        sink.moveTo(0, row);
        sink.print("~", gutter);
        const std::size_t lineIndex = top + i;
        if (lineIndex < buffer_.lineCount())
            paintLine(sink, lineIndex, row);
    }
}

void TextView::paintLine(render::DisplaySink &sink, std::size_t lineIndex, int row) const
{
    const text::Line &line = buffer_.line(lineIndex);
    const std::string &content = line.content();
    const auto &tags = line.tags();
    const std::size_t left = cursor_.offset().x;
    const std::size_t start = std::min(left, content.size());
    const std::size_t end = std::min(left + cursor_.size().width, content.size());
    if (start >= end)
        return;

    auto tagAt = [&](std::size_t i) {
        return i < tags.size() ? tags[i] : HighlightTag::Standard;
    };

    sink.moveTo(kMarginCols, row);
    std::size_t runStart = start;
    while (runStart < end)
    {
        const render::RGBA colour = buffer_.colour(tagAt(runStart));
        std::size_t runEnd = runStart + 1;
        while (runEnd < end && buffer_.colour(tagAt(runEnd)) == colour)
            ++runEnd;
        sink.print(std::string_view(content).substr(runStart, runEnd - runStart), colour);
        runStart = runEnd;
    }
}

text::Position TextView::cursorScreenPosition() const
{
    const text::Position p = cursor_.screenPosition();
    return {p.x + kMarginCols, p.y + kMarginRows};
}

} // namespace quill::views
