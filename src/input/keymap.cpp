// src/input/keymap.cpp
// @brief Chord hashing and dispatch for the editor's fixed bindings.
// @invariant Lookups match code, modifiers and codepoint exactly.
// @ownership Keymap owns the bound callbacks.

#include "quill/input/keymap.hpp"

#include <utility>

namespace quill::input
{
bool KeyChord::operator==(const KeyChord &other) const
{
    return code == other.code && mods == other.mods && codepoint == other.codepoint;
}

KeyChord KeyChord::ctrl(char letter)
{
    return KeyChord{term::KeyEvent::Code::Unknown,
                    term::KeyEvent::Ctrl,
                    static_cast<uint32_t>(static_cast<unsigned char>(letter))};
}

KeyChord KeyChord::key(term::KeyEvent::Code code)
{
    return KeyChord{code, 0, 0};
}

KeyChord KeyChord::from(const term::KeyEvent &ev)
{
    return KeyChord{ev.code, ev.mods, ev.codepoint};
}

std::size_t KeyChordHash::operator()(const KeyChord &kc) const
{
    return static_cast<std::size_t>(kc.code) ^ (static_cast<std::size_t>(kc.mods) << 8U) ^
           (static_cast<std::size_t>(kc.codepoint) << 16U);
}

void Keymap::bind(const KeyChord &chord, Action action)
{
    bindings_[chord] = std::move(action);
}

bool Keymap::handle(const term::KeyEvent &ev) const
{
    const auto it = bindings_.find(KeyChord::from(ev));
    if (it == bindings_.end() || !it->second)
        return false;
    it->second();
    return true;
}

} // namespace quill::input
