// include/quill/render/renderer.hpp
// @brief ANSI implementation of DisplaySink writing to a TermIO.
// @invariant setStyle and moveTo skip sequences that would not change terminal state.
// @ownership Renderer borrows the TermIO; the caller keeps it alive.
#pragma once

#include "quill/render/display_sink.hpp"
#include "quill/render/style.hpp"
#include "quill/term/term_io.hpp"

#include <optional>
#include <string_view>

namespace quill::render
{

/// @brief Emits SGR colour and CUP cursor sequences with minimal redundancy.
class AnsiRenderer final : public DisplaySink
{
  public:
    /// @param truecolor Emit 24-bit colours; otherwise map onto the 6x6x6 cube.
    /// @param background Background colour applied to every printed run.
    explicit AnsiRenderer(term::TermIO &tio, bool truecolor = true, RGBA background = RGBA{0, 0, 0, 255});

    void moveTo(int col, int row) override;
    void print(std::string_view run, RGBA colour) override;
    void clear() override;
    void showCursor(bool visible) override;
    void flush() override;

    /// @brief Switch colours, writing nothing when @p style is already active.
    void setStyle(Style style);

  private:
    term::TermIO &tio_;
    bool truecolor_;
    RGBA background_;
    std::optional<Style> currentStyle_;
    int cursorCol_{-1};
    int cursorRow_{-1};
};

} // namespace quill::render
