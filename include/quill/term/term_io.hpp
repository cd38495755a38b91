// include/quill/term/term_io.hpp
// @brief Byte sink abstraction for terminal output.
// @invariant StringTermIO captures writes verbatim; RealTermIO buffers until flush().
// @ownership Implementations own their buffers; callers borrow them by reference.
#pragma once

#include <string>
#include <string_view>

namespace quill::term
{

/// @brief Destination for escape sequences and text.
class TermIO
{
  public:
    virtual ~TermIO() = default;

    virtual void write(std::string_view s) = 0;

    virtual void flush() = 0;
};

/// @brief Writes to standard output, buffering between flushes.
class RealTermIO final : public TermIO
{
  public:
    void write(std::string_view s) override;

    /// @brief Push buffered bytes to fd 1, retrying short writes.
    void flush() override;

  private:
    std::string pending_;
};

/// @brief In-memory sink used by tests and headless rendering.
class StringTermIO final : public TermIO
{
  public:
    void write(std::string_view s) override
    {
        buffer_.append(s);
    }

    void flush() override {}

    [[nodiscard]] const std::string &buffer() const
    {
        return buffer_;
    }

    void clear()
    {
        buffer_.clear();
    }

  private:
    std::string buffer_;
};

} // namespace quill::term
