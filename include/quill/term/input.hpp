// include/quill/term/input.hpp
// @brief Key events and the decoder turning raw terminal bytes into them.
// @invariant Incomplete escape or UTF-8 sequences are held until more bytes arrive.
// @ownership InputDecoder owns its pending bytes and event queue only.
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace quill::term
{

/// @brief One decoded key press.
struct KeyEvent
{
    enum class Code
    {
        Unknown, ///< Plain character; see codepoint.
        Enter,
        Esc,
        Tab,
        Backspace,
        Up,
        Down,
        Left,
        Right,
        Home,
        End,
        PageUp,
        PageDown,
        Insert,
        Delete,
    };

    enum Mods : unsigned
    {
        Shift = 1U << 0,
        Alt = 1U << 1,
        Ctrl = 1U << 2,
    };

    Code code{Code::Unknown};
    unsigned mods{0};
    uint32_t codepoint{0};
};

/// @brief Incremental decoder for bytes read from a raw-mode terminal.
class InputDecoder
{
  public:
    /// @brief Append @p bytes and decode every complete key they finish.
    void feed(std::string_view bytes);

    /// @brief Take the decoded events, oldest first.
    std::vector<KeyEvent> drain();

  private:
    /// @return Bytes consumed, or 0 when the sequence is not complete yet.
    std::size_t decodeEscape(std::string_view s);
    std::size_t decodeUtf8(std::string_view s);

    std::string pending_;
    std::vector<KeyEvent> events_;
};

} // namespace quill::term
