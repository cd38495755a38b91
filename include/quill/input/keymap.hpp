// include/quill/input/keymap.hpp
// @brief Fixed key-chord bindings for the editor surface.
// @invariant A chord is bound to at most one action; rebinding replaces it.
// @ownership Keymap owns the bound callbacks and their captured state.
#pragma once

#include "quill/term/input.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <unordered_map>

namespace quill::input
{

/// @brief Key plus modifiers that triggers an action.
struct KeyChord
{
    term::KeyEvent::Code code{term::KeyEvent::Code::Unknown};
    unsigned mods{0};
    uint32_t codepoint{0};

    bool operator==(const KeyChord &other) const;

    /// @brief Chord for Ctrl plus lowercase @p letter, as the decoder reports it.
    static KeyChord ctrl(char letter);

    /// @brief Chord for an unmodified special key.
    static KeyChord key(term::KeyEvent::Code code);

    /// @brief Chord matching the decoded event @p ev exactly.
    static KeyChord from(const term::KeyEvent &ev);
};

struct KeyChordHash
{
    std::size_t operator()(const KeyChord &kc) const;
};

/// @brief Chord to action table; bindings are fixed by the editor.
class Keymap
{
  public:
    using Action = std::function<void()>;

    /// @brief Bind @p chord to @p action, replacing any earlier binding.
    void bind(const KeyChord &chord, Action action);

    /// @brief Run the action bound to @p ev.
    /// @return True when a binding matched.
    bool handle(const term::KeyEvent &ev) const;

  private:
    std::unordered_map<KeyChord, Action, KeyChordHash> bindings_;
};

} // namespace quill::input
