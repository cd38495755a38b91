// src/term/session.cpp
// @brief POSIX raw-mode session: termios setup, alternate screen, size query.
// @invariant Escape sequences are only written when raw mode was entered.
// @ownership Session owns the saved termios copy.

#include "quill/term/session.hpp"

#include <cstdlib>

#if !defined(_WIN32)
#include <sys/ioctl.h>
#include <termios.h>
#include <unistd.h>
#endif

namespace quill::term
{

struct TerminalSession::Saved
{
#if !defined(_WIN32)
    termios attrs{};
#endif
};

bool noTtyRequested()
{
    const char *v = std::getenv("QUILL_NO_TTY");
    return v != nullptr && v[0] == '1';
}

#if defined(_WIN32)

TerminalSession::TerminalSession() = default;

TerminalSession::~TerminalSession() = default;

TermSize terminalSize()
{
    return {};
}

#else

namespace
{
void writeAll(const char *s, std::size_t n)
{
    while (n > 0)
    {
        const ssize_t w = ::write(STDOUT_FILENO, s, n);
        if (w <= 0)
            return;
        s += w;
        n -= static_cast<std::size_t>(w);
    }
}

constexpr char kEnterScreen[] = "\x1b[?1049h\x1b[H";
constexpr char kLeaveScreen[] = "\x1b[?1049l";
} // namespace

TerminalSession::TerminalSession()
{
    if (noTtyRequested() || !::isatty(STDIN_FILENO))
        return;

    auto saved = std::make_unique<Saved>();
    if (::tcgetattr(STDIN_FILENO, &saved->attrs) == -1)
        return;

    termios raw = saved->attrs;
    raw.c_iflag &= ~static_cast<tcflag_t>(BRKINT | ICRNL | INPCK | ISTRIP | IXON);
    raw.c_oflag &= ~static_cast<tcflag_t>(OPOST);
    raw.c_cflag |= CS8;
    raw.c_lflag &= ~static_cast<tcflag_t>(ECHO | ICANON | IEXTEN | ISIG);
    // Blocking reads of at least one byte; the editor has no timers.
    raw.c_cc[VMIN] = 1;
    raw.c_cc[VTIME] = 0;
    if (::tcsetattr(STDIN_FILENO, TCSAFLUSH, &raw) == -1)
        return;

    saved_ = std::move(saved);
    active_ = true;
    writeAll(kEnterScreen, sizeof(kEnterScreen) - 1);
}

TerminalSession::~TerminalSession()
{
    if (!active_)
        return;
    writeAll(kLeaveScreen, sizeof(kLeaveScreen) - 1);
    (void)::tcsetattr(STDIN_FILENO, TCSAFLUSH, &saved_->attrs);
}

TermSize terminalSize()
{
    TermSize size;
    winsize ws{};
    if (::ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_col != 0 && ws.ws_row != 0)
    {
        size.rows = ws.ws_row;
        size.cols = ws.ws_col;
    }
    return size;
}

#endif

} // namespace quill::term
