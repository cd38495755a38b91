// include/quill/render/display_sink.hpp
// @brief Command interface the editor paints through.
// @invariant Coordinates are zero-based screen cells, column first.
// @ownership Sinks are borrowed by the editor for the duration of a refresh.
#pragma once

#include "quill/render/style.hpp"

#include <string_view>

namespace quill::render
{

/// @brief Receiver of one refresh worth of drawing commands.
class DisplaySink
{
  public:
    virtual ~DisplaySink() = default;

    virtual void moveTo(int col, int row) = 0;

    /// @brief Print @p run at the current position in colour @p colour.
    virtual void print(std::string_view run, RGBA colour) = 0;

    virtual void clear() = 0;

    virtual void showCursor(bool visible) = 0;

    virtual void flush() = 0;
};

} // namespace quill::render
