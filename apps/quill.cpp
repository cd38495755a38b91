// apps/quill.cpp
// @brief Terminal front end wiring TerminalSession, InputDecoder and Editor.
// @invariant Exits after a confirmed Ctrl-C in interactive mode; headless renders once.
// @ownership main owns the session, storage and editor; diagnostics outlive the session.

#include "quill/config/config.hpp"
#include "quill/editor/editor.hpp"
#include "quill/render/renderer.hpp"
#include "quill/support/diagnostics.hpp"
#include "quill/term/input.hpp"
#include "quill/term/session.hpp"
#include "quill/term/term_io.hpp"
#include "quill/text/storage.hpp"
#include "quill/version.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>
#include <string_view>

#if defined(_WIN32)
#include <conio.h>
#else
#include <unistd.h>
#endif

namespace
{
void usage(std::ostream &os)
{
    os << "usage: quill [--version] [path]\n";
}

void flushDiagnostics(const quill::support::DiagnosticEngine &diags)
{
    diags.printAll(std::cerr);
    if (const char *logPath = std::getenv("QUILL_LOG"); logPath && *logPath)
    {
        std::ofstream log(logPath, std::ios::app);
        if (log)
            diags.printAll(log);
        else
            std::cerr << logPath << ": warning: cannot open log file\n";
    }
}
} // namespace

int main(int argc, char **argv)
{
    std::string path;
    for (int i = 1; i < argc; ++i)
    {
        const std::string_view arg = argv[i];
        if (arg == "--version")
        {
            std::cout << "quill " << quill::quill_version() << "\n";
            return 0;
        }
        if (arg == "-h" || arg == "--help")
        {
            usage(std::cout);
            return 0;
        }
        if (!path.empty() || (arg.size() > 1 && arg[0] == '-'))
        {
            usage(std::cerr);
            return 2;
        }
        path = std::string(arg);
    }

    quill::support::DiagnosticEngine diags;
    quill::config::Config cfg;
    if (const std::string cfgPath = quill::config::discoverConfigPath(); !cfgPath.empty())
    {
        if (!quill::config::loadFromFile(cfgPath, cfg, &diags))
            diags.warn(cfgPath, "cannot open configuration file, using defaults");
    }

    const bool headless = quill::term::noTtyRequested();
    quill::text::FileStorage storage;
    {
        quill::term::TerminalSession session;
        quill::term::RealTermIO tio;
        quill::render::AnsiRenderer renderer(tio, cfg.editor.truecolor, cfg.background);

        quill::term::TermSize size = quill::term::terminalSize();
        quill::editor::Editor editor(size, storage, diags, cfg);
        if (!path.empty())
            editor.open(path);

        editor.refresh(renderer);
        if (!headless)
        {
            quill::term::InputDecoder decoder;
#if defined(_WIN32)
            while (editor.running())
            {
                const int c = _getch();
                const char ch = static_cast<char>(c);
                decoder.feed(std::string_view(&ch, 1));
#else
            char in[64];
            while (editor.running())
            {
                const ssize_t n = ::read(STDIN_FILENO, in, sizeof(in));
                if (n <= 0)
                    break;
                decoder.feed(std::string_view(in, static_cast<size_t>(n)));
#endif
                for (const auto &ev : decoder.drain())
                {
                    editor.handleKey(ev);
                    if (!editor.running())
                        break;
                }
                const quill::term::TermSize now = quill::term::terminalSize();
                if (now.rows != size.rows || now.cols != size.cols)
                {
                    size = now;
                    editor.resize(size);
                }
                if (editor.running())
                    editor.refresh(renderer);
            }
        }
    }

    flushDiagnostics(diags);
    return 0;
}
