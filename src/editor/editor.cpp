//===----------------------------------------------------------------------===//
//
// Part of the Quill project, under the GNU GPL v3.
// SPDX-License-Identifier: GPL-3.0-only
//
//===----------------------------------------------------------------------===//
//
// File: src/editor/editor.cpp
// Purpose: Implements the editing surface: fixed key bindings, the prompt
//          state machine (save, load, find, quit confirmation) and frame
//          painting.
// Key invariants: Every edit marks the document dirty and scrolls the cursor
//                 into view; only a successful save or load clears the flag.
// Ownership/Lifetime: See editor.hpp.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#include "quill/editor/editor.hpp"

#include "quill/syntax/tokenizer.hpp"
#include "quill/version.hpp"
#include "quill/views/text_view.hpp"

#include <algorithm>
#include <utility>

namespace quill::editor
{

namespace
{
using Code = term::KeyEvent::Code;

constexpr const char *kSavePrompt = "Enter a path to save to:";
constexpr const char *kLoadPrompt = "Enter a path to load from:";
constexpr const char *kFindPrompt = "Find:";
constexpr const char *kQuitPrompt = "Press Ctrl-C again to confirm quit. Press Esc to cancel";

text::ViewportSize viewportFor(term::TermSize window)
{
    const int cols = std::max(window.cols - 2, 1);
    const int rows = std::max(window.rows - 3, 1);
    return {static_cast<std::size_t>(cols), static_cast<std::size_t>(rows)};
}

std::string truncate(std::string s, int width)
{
    if (width >= 0 && s.size() > static_cast<std::size_t>(width))
        s.resize(static_cast<std::size_t>(width));
    return s;
}

bool isTextInput(const term::KeyEvent &ev)
{
    return ev.code == Code::Unknown && ev.codepoint >= 0x20 && ev.codepoint != 0x7f &&
           (ev.mods & (term::KeyEvent::Ctrl | term::KeyEvent::Alt)) == 0;
}

/// @brief UTF-8 encoding of @p cp; the buffer stores raw bytes.
std::string encodeUtf8(uint32_t cp)
{
    std::string out;
    if (cp <= 0x7F)
    {
        out += static_cast<char>(cp);
    }
    else if (cp <= 0x7FF)
    {
        out += static_cast<char>(0xC0 | ((cp >> 6) & 0x1F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
    else if (cp <= 0xFFFF)
    {
        out += static_cast<char>(0xE0 | ((cp >> 12) & 0x0F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
    else
    {
        out += static_cast<char>(0xF0 | ((cp >> 18) & 0x07));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
    return out;
}
} // namespace

Editor::Editor(term::TermSize window,
               text::Storage &storage,
               support::DiagnosticEngine &diags,
               config::Config cfg)
    : cfg_(std::move(cfg)),
      storage_(storage),
      diags_(diags),
      window_(window),
      cursor_(viewportFor(window)),
      findSnapshot_(viewportFor(window))
{
    buffer_.setPalette(cfg_.palette);
    buffer_.setTabWidth(cfg_.editor.tab_width);
    applyLanguage({});
    bindKeys();
}

void Editor::bindKeys()
{
    using input::KeyChord;

    keymap_.bind(KeyChord::ctrl('s'), [this] {
        beginPrompt(Mode::SavePrompt, kSavePrompt, fileName_.value_or(std::string{}));
    });
    keymap_.bind(KeyChord::ctrl('l'), [this] {
        beginPrompt(Mode::LoadPrompt, kLoadPrompt, fileName_.value_or(std::string{}));
    });
    keymap_.bind(KeyChord::ctrl('f'), [this] {
        findSnapshot_ = cursor_;
        beginPrompt(Mode::FindPrompt, kFindPrompt, {});
    });
    keymap_.bind(KeyChord::ctrl('c'), [this] {
        mode_ = Mode::QuitConfirm;
        message_ = kQuitPrompt;
    });
    keymap_.bind(KeyChord::key(Code::Up), [this] { moveCursor(text::Direction::Up); });
    keymap_.bind(KeyChord::key(Code::Down), [this] { moveCursor(text::Direction::Down); });
    keymap_.bind(KeyChord::key(Code::Left), [this] { moveCursor(text::Direction::Left); });
    keymap_.bind(KeyChord::key(Code::Right), [this] { moveCursor(text::Direction::Right); });
    keymap_.bind(KeyChord::key(Code::Enter), [this] {
        buffer_.newLine(cursor_);
        afterEdit();
    });
    keymap_.bind(KeyChord::key(Code::Backspace), [this] {
        buffer_.deleteChar(cursor_);
        afterEdit();
    });
    keymap_.bind(KeyChord::key(Code::Tab), [this] {
        buffer_.insertChar('\t', cursor_);
        afterEdit();
    });
}

void Editor::applyLanguage(const std::string &path)
{
    const std::string language = config::resolveLanguage(cfg_, path);
    buffer_.setHighlighter(syntax::makeHighlighter(language, cfg_.palette));
}

void Editor::open(const std::string &path)
{
    fileName_ = path;
    applyLanguage(path);
    const auto content = storage_.read(path);
    if (content)
        diags_.note(path, "loaded " + std::to_string(content.value().size()) + " bytes");
    else
        diags_.note(path, "could not read file, starting empty: " + content.error().message);
    buffer_.load(content);
    cursor_.reset();
    search_ = text::SearchData{};
    dirty_ = false;
}

void Editor::resize(term::TermSize window)
{
    window_ = window;
    cursor_.resize(viewportFor(window));
    cursor_.changeOffset();
}

void Editor::handleKey(const term::KeyEvent &ev)
{
    // Transient messages last until the next key.
    message_.reset();
    switch (mode_)
    {
        case Mode::Normal:
            handleNormal(ev);
            break;
        case Mode::SavePrompt:
        case Mode::LoadPrompt:
        case Mode::FindPrompt:
            handlePrompt(ev);
            break;
        case Mode::QuitConfirm:
            handleQuitConfirm(ev);
            break;
    }
}

void Editor::handleNormal(const term::KeyEvent &ev)
{
    if (keymap_.handle(ev))
        return;
    if (isTextInput(ev))
        insertCodepoint(ev.codepoint);
}

void Editor::handleQuitConfirm(const term::KeyEvent &ev)
{
    if (ev.code == Code::Unknown && (ev.mods & term::KeyEvent::Ctrl) && ev.codepoint == 'c')
    {
        running_ = false;
        mode_ = Mode::Normal;
        return;
    }
    if (ev.code == Code::Esc)
    {
        mode_ = Mode::Normal;
        return;
    }
    message_ = kQuitPrompt;
}

void Editor::beginPrompt(Mode mode, std::string message, std::string initial)
{
    mode_ = mode;
    promptMessage_ = std::move(message);
    promptInput_ = std::move(initial);
}

void Editor::handlePrompt(const term::KeyEvent &ev)
{
    if (ev.code == Code::Esc)
    {
        promptInput_.clear();
        finishPrompt(false);
        return;
    }
    if (ev.code == Code::Enter)
    {
        finishPrompt(true);
        return;
    }
    if (ev.code == Code::Backspace)
    {
        if (!promptInput_.empty())
            promptInput_.pop_back();
        if (mode_ == Mode::FindPrompt)
            updateFind();
        return;
    }
    if (isTextInput(ev))
    {
        promptInput_ += encodeUtf8(ev.codepoint);
        if (mode_ == Mode::FindPrompt)
            updateFind();
        return;
    }
    if (mode_ != Mode::FindPrompt)
        return;

    // Navigation between matches never rescans.
    if (ev.code == Code::Right || ev.code == Code::Down)
        jumpTo(search_.next());
    else if (ev.code == Code::Left || ev.code == Code::Up)
        jumpTo(search_.previous());
}

void Editor::updateFind()
{
    jumpTo(search_.findResults(promptInput_, buffer_));
}

void Editor::jumpTo(const std::optional<text::Position> &pos)
{
    if (!pos)
        return;
    cursor_.setPosition(pos->x, pos->y);
    cursor_.changeOffset();
}

void Editor::finishPrompt(bool accepted)
{
    const Mode mode = mode_;
    mode_ = Mode::Normal;
    std::string input = std::move(promptInput_);
    promptInput_.clear();

    switch (mode)
    {
        case Mode::FindPrompt:
            if (!accepted)
            {
                // The window may have been resized since the snapshot was taken.
                const text::ViewportSize size = cursor_.size();
                cursor_ = findSnapshot_;
                cursor_.resize(size);
                cursor_.changeOffset();
            }
            (void)search_.findResults({}, buffer_);
            break;
        case Mode::SavePrompt:
            if (accepted && !input.empty())
                save(input);
            break;
        case Mode::LoadPrompt:
            if (accepted && !input.empty())
                open(input);
            break;
        case Mode::Normal:
        case Mode::QuitConfirm:
            break;
    }
}

void Editor::save(const std::string &path)
{
    fileName_ = path;
    const auto result = buffer_.save(storage_, path);
    if (!result)
    {
        diags_.report(result.error());
        message_ = "Save failed: " + result.error().message;
        return;
    }
    dirty_ = false;
    diags_.note(path, "wrote " + std::to_string(buffer_.lineCount()) + " lines");
    message_ = "Saved " + path;
}

void Editor::insertCodepoint(uint32_t cp)
{
    for (char c : encodeUtf8(cp))
        buffer_.insertChar(c, cursor_);
    afterEdit();
}

void Editor::moveCursor(text::Direction dir)
{
    cursor_.move(dir, buffer_);
    cursor_.changeOffset();
}

void Editor::afterEdit()
{
    dirty_ = true;
    cursor_.changeOffset();
}

std::string Editor::headerLine() const
{
    std::string name = fileName_ ? (dirty_ ? "*" : "") + *fileName_ : std::string("Untitled");
    return truncate(name + " -- Quill text editor -- " + quill_version(), window_.cols);
}

std::string Editor::statusLine() const
{
    std::string text;
    if (mode_ == Mode::SavePrompt || mode_ == Mode::LoadPrompt || mode_ == Mode::FindPrompt)
        text = promptMessage_ + " " + promptInput_;
    else if (message_)
        text = *message_;
    else
        text = "Cursor: " + std::to_string(cursor_.desiredColumn()) + ", " +
               std::to_string(cursor_.lineIndex()) + " -- " + std::to_string(buffer_.lineCount()) +
               " lines";
    return truncate(std::move(text), window_.cols);
}

void Editor::refresh(render::DisplaySink &sink) const
{
    const render::RGBA standard = buffer_.colour(syntax::HighlightTag::Standard);
    sink.showCursor(false);
    sink.clear();
    sink.moveTo(0, 0);
    sink.print(headerLine(), standard);

    const views::TextView view(buffer_, cursor_);
    view.paint(sink);

    sink.moveTo(0, std::max(window_.rows - 1, 0));
    sink.print(statusLine(), standard);

    const text::Position pos = view.cursorScreenPosition();
    sink.moveTo(static_cast<int>(pos.x), static_cast<int>(pos.y));
    sink.showCursor(mode_ != Mode::QuitConfirm);
    sink.flush();
}

} // namespace quill::editor
