// src/render/renderer.cpp
// @brief Implementation of the ANSI renderer producing minimal terminal updates.
// @invariant setStyle and moveTo avoid redundant sequences based on cached state.
// @ownership Renderer writes through a borrowed TermIO reference.

#include "quill/render/renderer.hpp"

#include <string>

namespace quill::render
{

AnsiRenderer::AnsiRenderer(term::TermIO &tio, bool truecolor, RGBA background)
    : tio_(tio), truecolor_(truecolor), background_(background)
{
}

namespace
{
int toCube(uint8_t c)
{
    return c / 51; // map 0-255 to 0-5
}

int cubeIndex(RGBA c)
{
    return 16 + 36 * toCube(c.r) + 6 * toCube(c.g) + toCube(c.b);
}
} // namespace

void AnsiRenderer::setStyle(Style style)
{
    if (currentStyle_ && style == *currentStyle_)
    {
        return;
    }

    std::string seq = "\x1b[0";
    if (truecolor_)
    {
        seq += ";38;2;" + std::to_string(style.fg.r) + ";" + std::to_string(style.fg.g) + ";" +
               std::to_string(style.fg.b);
        seq += ";48;2;" + std::to_string(style.bg.r) + ";" + std::to_string(style.bg.g) + ";" +
               std::to_string(style.bg.b);
    }
    else
    {
        seq += ";38;5;" + std::to_string(cubeIndex(style.fg));
        seq += ";48;5;" + std::to_string(cubeIndex(style.bg));
    }

    seq += 'm';
    tio_.write(seq);
    currentStyle_ = style;
}

void AnsiRenderer::moveTo(int col, int row)
{
    if (col == cursorCol_ && row == cursorRow_)
    {
        return;
    }
    std::string seq = "\x1b[" + std::to_string(row + 1) + ";" + std::to_string(col + 1) + 'H';
    tio_.write(seq);
    cursorCol_ = col;
    cursorRow_ = row;
}

void AnsiRenderer::print(std::string_view run, RGBA colour)
{
    if (run.empty())
        return;
    setStyle(Style{colour, background_});
    tio_.write(run);
    // Byte count stands in for cell width; the editor addresses bytes.
    cursorCol_ += static_cast<int>(run.size());
}

void AnsiRenderer::clear()
{
    setStyle(Style{RGBA{229, 229, 229, 255}, background_});
    tio_.write("\x1b[2J\x1b[H");
    cursorCol_ = 0;
    cursorRow_ = 0;
}

void AnsiRenderer::showCursor(bool visible)
{
    tio_.write(visible ? "\x1b[?25h" : "\x1b[?25l");
}

void AnsiRenderer::flush()
{
    tio_.flush();
}

} // namespace quill::render
