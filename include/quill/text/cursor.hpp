//===----------------------------------------------------------------------===//
//
// Part of the Quill project, under the GNU GPL v3.
// SPDX-License-Identifier: GPL-3.0-only
//
//===----------------------------------------------------------------------===//
//
// File: include/quill/text/cursor.hpp
// Purpose: Logical edit position, the column actually used on the current
//          line, and the scroll bookkeeping that keeps it on screen.
// Key invariants: y indexes an existing line after every move; once
//                 changeOffset() has run the viewport contains the cursor.
// Ownership/Lifetime: Value type; reads line lengths from a borrowed Buffer.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>

namespace quill::text
{

class Buffer;

/// @brief Column/row pair in byte and line units.
struct Position
{
    std::size_t x{0};
    std::size_t y{0};

    bool operator==(const Position &other) const = default;
};

/// @brief Width and height of the scrollable text area.
struct ViewportSize
{
    std::size_t width{1};
    std::size_t height{1};

    bool operator==(const ViewportSize &other) const = default;
};

enum class Direction
{
    Up,
    Down,
    Left,
    Right,
};

/// @brief Cursor with remembered horizontal intent and viewport offsets.
///
/// `x` is the column the user last asked for and survives vertical moves;
/// `renderX` is that column clamped to the current line and is what edits and
/// painting use.
class Cursor
{
  public:
    explicit Cursor(ViewportSize size);

    /// @brief Move one step in @p dir, wrapping across line ends horizontally.
    void move(Direction dir, const Buffer &buffer);

    /// @brief Scroll the minimum amount needed to bring the cursor into view.
    void changeOffset();

    /// @brief Place the cursor; both the desired and the render column become @p x.
    void setPosition(std::size_t x, std::size_t y);

    /// @brief Render column and line index.
    [[nodiscard]] Position position() const
    {
        return {renderX_, y_};
    }

    /// @brief Viewport-relative position: position minus scroll offset.
    [[nodiscard]] Position screenPosition() const
    {
        return {renderX_ - xOffset_, y_ - yOffset_};
    }

    [[nodiscard]] Position offset() const
    {
        return {xOffset_, yOffset_};
    }

    [[nodiscard]] std::size_t lineIndex() const
    {
        return y_;
    }

    [[nodiscard]] std::size_t desiredColumn() const
    {
        return x_;
    }

    [[nodiscard]] std::size_t renderColumn() const
    {
        return renderX_;
    }

    [[nodiscard]] ViewportSize size() const
    {
        return size_;
    }

    /// @brief Change the viewport size; zero dimensions are raised to one.
    void resize(ViewportSize size);

    /// @brief Return to the top-left corner with no scroll.
    void reset();

  private:
    std::size_t x_{0};
    std::size_t y_{0};
    std::size_t renderX_{0};
    std::size_t xOffset_{0};
    std::size_t yOffset_{0};
    ViewportSize size_{};
};

} // namespace quill::text
