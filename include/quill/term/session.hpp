// include/quill/term/session.hpp
// @brief RAII guard switching the terminal into raw mode and the alternate screen.
// @invariant The original terminal state is restored exactly once, on destruction.
// @ownership Session owns the saved terminal attributes.
#pragma once

#include <memory>

namespace quill::term
{

/// @brief Rows and columns of the controlling terminal.
struct TermSize
{
    int rows{24};
    int cols{80};
};

/// @brief Enter raw mode for the lifetime of the object.
/// @details Does nothing when QUILL_NO_TTY=1 or stdin is not a terminal, so
///          tests and pipelines can construct it freely.
class TerminalSession
{
  public:
    TerminalSession();
    ~TerminalSession();

    TerminalSession(const TerminalSession &) = delete;
    TerminalSession &operator=(const TerminalSession &) = delete;

    /// @brief Whether raw mode was actually entered.
    [[nodiscard]] bool active() const
    {
        return active_;
    }

  private:
    bool active_{false};
    struct Saved;
    std::unique_ptr<Saved> saved_;
};

/// @brief Query the terminal size, falling back to 24x80.
TermSize terminalSize();

/// @brief True when QUILL_NO_TTY is set to "1".
bool noTtyRequested();

} // namespace quill::term
