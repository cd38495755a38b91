// src/text/cursor.cpp
// @brief Cursor navigation and viewport scrolling.
// @invariant Vertical moves restore the remembered column as far as the new line allows.
// @ownership Cursor borrows the buffer only for the duration of a move.

#include "quill/text/cursor.hpp"

#include "quill/text/buffer.hpp"

#include <algorithm>

namespace quill::text
{

Cursor::Cursor(ViewportSize size)
{
    resize(size);
}

void Cursor::move(Direction dir, const Buffer &buffer)
{
    const std::size_t lastLine = buffer.lineCount() - 1;
    switch (dir)
    {
        case Direction::Up:
            if (y_ > 0)
            {
                --y_;
                renderX_ = std::min(x_, buffer.lineLen(y_));
            }
            break;
        case Direction::Down:
            if (y_ < lastLine)
            {
                ++y_;
                renderX_ = std::min(x_, buffer.lineLen(y_));
            }
            break;
        case Direction::Right:
            x_ = renderX_;
            if (x_ < buffer.lineLen(y_))
            {
                ++x_;
            }
            else if (y_ < lastLine)
            {
                ++y_;
                x_ = 0;
            }
            renderX_ = x_;
            break;
        case Direction::Left:
            x_ = renderX_;
            if (x_ > 0)
            {
                --x_;
            }
            else if (y_ > 0)
            {
                --y_;
                x_ = buffer.lineLen(y_);
            }
            renderX_ = x_;
            break;
    }
}

void Cursor::changeOffset()
{
    // Up, right, down, left: each scrolls by exactly the overshoot.
    if (y_ < yOffset_)
    {
        yOffset_ = y_;
    }
    if (renderX_ > xOffset_ + size_.width - 1)
    {
        xOffset_ = renderX_ - (size_.width - 1);
    }
    if (y_ > yOffset_ + size_.height - 1)
    {
        yOffset_ = y_ - (size_.height - 1);
    }
    if (renderX_ < xOffset_)
    {
        xOffset_ = renderX_;
    }
}

void Cursor::setPosition(std::size_t x, std::size_t y)
{
    x_ = x;
    renderX_ = x;
    y_ = y;
}

void Cursor::resize(ViewportSize size)
{
    size_.width = std::max<std::size_t>(size.width, 1);
    size_.height = std::max<std::size_t>(size.height, 1);
}

void Cursor::reset()
{
    x_ = 0;
    y_ = 0;
    renderX_ = 0;
    xOffset_ = 0;
    yOffset_ = 0;
}

} // namespace quill::text
