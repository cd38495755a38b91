// src/term/term_io.cpp
// @brief Standard-output TermIO implementation.
// @invariant flush() either writes every pending byte or drops the remainder on a hard error.
// @ownership RealTermIO owns its pending buffer.

#include "quill/term/term_io.hpp"

#include <cerrno>

#if defined(_WIN32)
#include <cstdio>
#else
#include <unistd.h>
#endif

namespace quill::term
{

void RealTermIO::write(std::string_view s)
{
    pending_.append(s);
}

void RealTermIO::flush()
{
#if defined(_WIN32)
    std::fwrite(pending_.data(), 1, pending_.size(), stdout);
    std::fflush(stdout);
#else
    std::size_t off = 0;
    while (off < pending_.size())
    {
        const ssize_t n = ::write(STDOUT_FILENO, pending_.data() + off, pending_.size() - off);
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            break;
        }
        off += static_cast<std::size_t>(n);
    }
#endif
    pending_.clear();
}

} // namespace quill::term
