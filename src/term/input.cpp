// src/term/input.cpp
// @brief Decoding of control bytes, CSI/SS3 sequences and UTF-8 into key events.
// @invariant A lone ESC at the end of a feed is reported as the Esc key.
// @ownership Decoder owns pending bytes; drained events are moved to the caller.

#include "quill/term/input.hpp"

#include <utility>

namespace quill::term
{

namespace
{
using Code = KeyEvent::Code;

/// Larger CSI parameters name no key; digits past this are ignored.
constexpr int kMaxParam = 9999;

KeyEvent key(Code code, unsigned mods = 0)
{
    KeyEvent ev{};
    ev.code = code;
    ev.mods = mods;
    return ev;
}

/// @brief Translate an xterm modifier parameter (1 + bitmask) to Mods bits.
unsigned modsFromParam(int param)
{
    if (param <= 1)
        return 0;
    const int bits = param - 1;
    unsigned mods = 0;
    if (bits & 1)
        mods |= KeyEvent::Shift;
    if (bits & 2)
        mods |= KeyEvent::Alt;
    if (bits & 4)
        mods |= KeyEvent::Ctrl;
    return mods;
}

Code codeForFinal(char final)
{
    switch (final)
    {
        case 'A':
            return Code::Up;
        case 'B':
            return Code::Down;
        case 'C':
            return Code::Right;
        case 'D':
            return Code::Left;
        case 'H':
            return Code::Home;
        case 'F':
            return Code::End;
        default:
            return Code::Unknown;
    }
}

Code codeForTilde(int param)
{
    switch (param)
    {
        case 1:
        case 7:
            return Code::Home;
        case 2:
            return Code::Insert;
        case 3:
            return Code::Delete;
        case 4:
        case 8:
            return Code::End;
        case 5:
            return Code::PageUp;
        case 6:
            return Code::PageDown;
        default:
            return Code::Unknown;
    }
}
} // namespace

void InputDecoder::feed(std::string_view bytes)
{
    pending_.append(bytes);
    std::size_t i = 0;
    while (i < pending_.size())
    {
        const auto c = static_cast<unsigned char>(pending_[i]);
        const std::string_view rest = std::string_view(pending_).substr(i);

        if (c == 0x1b)
        {
            const std::size_t used = decodeEscape(rest);
            if (used == 0)
                break;
            i += used;
            continue;
        }
        if (c >= 0x80)
        {
            const std::size_t used = decodeUtf8(rest);
            if (used == 0)
                break;
            i += used;
            continue;
        }

        if (c == '\r' || c == '\n')
            events_.push_back(key(Code::Enter));
        else if (c == '\t')
            events_.push_back(key(Code::Tab));
        else if (c == 0x7f || c == 0x08)
            events_.push_back(key(Code::Backspace));
        else if (c >= 1 && c <= 26)
        {
            KeyEvent ev = key(Code::Unknown, KeyEvent::Ctrl);
            ev.codepoint = static_cast<uint32_t>('a' + (c - 1));
            events_.push_back(ev);
        }
        else if (c >= 0x20)
        {
            KeyEvent ev{};
            ev.codepoint = c;
            events_.push_back(ev);
        }
        ++i;
    }
    pending_.erase(0, i);
}

std::vector<KeyEvent> InputDecoder::drain()
{
    std::vector<KeyEvent> out;
    out.swap(events_);
    return out;
}

std::size_t InputDecoder::decodeEscape(std::string_view s)
{
    // Nothing follows within this feed, so this is the Esc key itself.
    if (s.size() == 1)
    {
        events_.push_back(key(Code::Esc));
        return 1;
    }

    const char intro = s[1];
    if (intro == 'O')
    {
        if (s.size() < 3)
            return 0;
        events_.push_back(key(codeForFinal(s[2])));
        return 3;
    }
    if (intro != '[')
    {
        // ESC followed by a plain byte is how terminals send Alt+key.
        if (intro == 0x1b)
        {
            events_.push_back(key(Code::Esc));
            return 1;
        }
        KeyEvent ev = key(Code::Unknown, KeyEvent::Alt);
        ev.codepoint = static_cast<unsigned char>(intro);
        events_.push_back(ev);
        return 2;
    }

    int params[2] = {0, 0};
    int count = 0;
    std::size_t i = 2;
    for (; i < s.size(); ++i)
    {
        const char c = s[i];
        if (c >= '0' && c <= '9')
        {
            if (count == 0)
                count = 1;
            if (count <= 2 && params[count - 1] < kMaxParam)
                params[count - 1] = params[count - 1] * 10 + (c - '0');
            continue;
        }
        if (c == ';')
        {
            ++count;
            continue;
        }
        break;
    }
    if (i >= s.size())
        return 0;

    const char final = s[i];
    const unsigned mods = modsFromParam(params[1]);
    if (final == '~')
        events_.push_back(key(codeForTilde(params[0]), mods));
    else
        events_.push_back(key(codeForFinal(final), mods));
    return i + 1;
}

std::size_t InputDecoder::decodeUtf8(std::string_view s)
{
    const auto lead = static_cast<unsigned char>(s[0]);
    std::size_t len = 0;
    uint32_t cp = 0;
    if ((lead & 0xE0) == 0xC0)
    {
        len = 2;
        cp = lead & 0x1F;
    }
    else if ((lead & 0xF0) == 0xE0)
    {
        len = 3;
        cp = lead & 0x0F;
    }
    else if ((lead & 0xF8) == 0xF0)
    {
        len = 4;
        cp = lead & 0x07;
    }
    else
    {
        // Stray continuation byte: drop it.
        return 1;
    }
    if (s.size() < len)
        return 0;
    for (std::size_t k = 1; k < len; ++k)
    {
        const auto b = static_cast<unsigned char>(s[k]);
        if ((b & 0xC0) != 0x80)
            return 1;
        cp = (cp << 6) | (b & 0x3F);
    }
    KeyEvent ev{};
    ev.codepoint = cp;
    events_.push_back(ev);
    return len;
}

} // namespace quill::term
