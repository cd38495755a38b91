//===----------------------------------------------------------------------===//
//
// Part of the Quill project, under the GNU GPL v3.
// SPDX-License-Identifier: GPL-3.0-only
//
//===----------------------------------------------------------------------===//
//
// File: include/quill/editor/editor.hpp
// Purpose: Declares the editing surface: it turns key events into cursor,
//          buffer and search operations, runs the save/load/find prompts and
//          paints header, text and status line through a display sink.
// Key invariants: One key event is processed to completion before the next;
//                 the cursor is inside the viewport after every event.
// Ownership/Lifetime: Editor owns the buffer, cursor, search index and key
//                     bindings; storage and the diagnostic engine are borrowed
//                     and must outlive it.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "quill/config/config.hpp"
#include "quill/input/keymap.hpp"
#include "quill/render/display_sink.hpp"
#include "quill/support/diagnostics.hpp"
#include "quill/term/input.hpp"
#include "quill/term/session.hpp"
#include "quill/text/buffer.hpp"
#include "quill/text/cursor.hpp"
#include "quill/text/search.hpp"
#include "quill/text/storage.hpp"

#include <optional>
#include <string>

namespace quill::editor
{

/// @brief What the next key event is interpreted as.
enum class Mode
{
    Normal,
    SavePrompt,
    LoadPrompt,
    FindPrompt,
    QuitConfirm,
};

/// @brief Headless, event-driven text editor.
class Editor
{
  public:
    /// @param window Full terminal size; the text area is (cols-2, rows-3).
    Editor(term::TermSize window,
           text::Storage &storage,
           support::DiagnosticEngine &diags,
           config::Config cfg = {});

    // Key bindings capture this.
    Editor(const Editor &) = delete;
    Editor &operator=(const Editor &) = delete;

    /// @brief Load @p path into the buffer and make it the current file.
    /// @details A file that cannot be read opens as an empty document.
    void open(const std::string &path);

    /// @brief Apply one key event.
    void handleKey(const term::KeyEvent &ev);

    /// @brief Paint a complete frame through @p sink.
    void refresh(render::DisplaySink &sink) const;

    /// @brief Adapt to a new terminal size.
    void resize(term::TermSize window);

    [[nodiscard]] bool running() const
    {
        return running_;
    }

    [[nodiscard]] bool dirty() const
    {
        return dirty_;
    }

    [[nodiscard]] Mode mode() const
    {
        return mode_;
    }

    [[nodiscard]] const std::optional<std::string> &fileName() const
    {
        return fileName_;
    }

    [[nodiscard]] const text::Buffer &buffer() const
    {
        return buffer_;
    }

    [[nodiscard]] const text::Cursor &cursor() const
    {
        return cursor_;
    }

    [[nodiscard]] const text::SearchData &search() const
    {
        return search_;
    }

    /// @brief Header text, already truncated to the window width.
    [[nodiscard]] std::string headerLine() const;

    /// @brief Status text: the prompt, a pending message or the cursor summary.
    [[nodiscard]] std::string statusLine() const;

  private:
    void bindKeys();
    void handleNormal(const term::KeyEvent &ev);
    void handlePrompt(const term::KeyEvent &ev);
    void handleQuitConfirm(const term::KeyEvent &ev);

    void beginPrompt(Mode mode, std::string message, std::string initial);
    void finishPrompt(bool accepted);
    void updateFind();
    void jumpTo(const std::optional<text::Position> &pos);

    void insertCodepoint(uint32_t cp);
    void moveCursor(text::Direction dir);
    void afterEdit();

    void save(const std::string &path);
    void applyLanguage(const std::string &path);

    config::Config cfg_;
    text::Storage &storage_;
    support::DiagnosticEngine &diags_;
    term::TermSize window_;

    text::Buffer buffer_;
    text::Cursor cursor_;
    text::SearchData search_;
    input::Keymap keymap_;

    Mode mode_{Mode::Normal};
    std::string promptMessage_;
    std::string promptInput_;
    text::Cursor findSnapshot_;
    std::optional<std::string> message_;
    std::optional<std::string> fileName_;
    bool dirty_{false};
    bool running_{true};
};

} // namespace quill::editor
