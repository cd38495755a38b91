// tests/test_config.cpp
// @brief Verify the configuration loader parses theme and editor settings.
// @invariant Rejected values keep defaults and are reported as warnings.
// @ownership Test owns configuration data only.

#include "quill/config/config.hpp"

#include <cassert>
#include <cstdlib>

using quill::config::Config;
using quill::config::loadFromFile;
using quill::render::RGBA;
using quill::support::DiagnosticEngine;
using quill::syntax::HighlightTag;
using quill::syntax::Palette;

int main()
{
    Config cfg;
    DiagnosticEngine diags;
    bool ok = loadFromFile(CONFIG_INI, cfg, &diags);
    assert(ok);
    assert(diags.warningCount() == 0);

    // Theme colours, with or without the leading '#'.
    assert((cfg.palette[HighlightTag::Keyword] == RGBA{255, 136, 0, 255}));
    assert((cfg.palette[HighlightTag::Comment] == RGBA{0x11, 0x22, 0x33, 255}));
    assert((cfg.palette[HighlightTag::SearchResult] == RGBA{0, 255, 0, 255}));
    assert((cfg.background == RGBA{16, 16, 16, 255}));
    assert(cfg.palette[HighlightTag::String] == Palette::defaults()[HighlightTag::String]);

    // Editor settings; unknown sections are ignored.
    assert(cfg.editor.tab_width == 2);
    assert(cfg.editor.language == "cpp");
    assert(!cfg.editor.truecolor);
    assert(quill::config::resolveLanguage(cfg, "x.rs") == "cpp");

    // Invalid values keep defaults while parsing continues.
    Config bad;
    DiagnosticEngine badDiags;
    bool okBad = loadFromFile(CONFIG_BAD_INI, bad, &badDiags);
    assert(okBad);
    assert(bad.palette[HighlightTag::Keyword] == Palette::defaults()[HighlightTag::Keyword]);
    assert(bad.palette[HighlightTag::String] == Palette::defaults()[HighlightTag::String]);
    assert((bad.palette[HighlightTag::Number] == RGBA{1, 2, 3, 255}));
    assert(bad.editor.tab_width == 4);
    assert(bad.editor.language == "auto");
    assert(bad.editor.truecolor);
    assert(badDiags.warningCount() == 6);
    assert(badDiags.diagnostics()[0].path == CONFIG_BAD_INI);

    // Auto language follows the extension.
    assert(quill::config::resolveLanguage(bad, "x.c") == "c");
    assert(quill::config::resolveLanguage(bad, "") == "rust");

    // A missing file is the only hard failure.
    Config missing;
    assert(!loadFromFile("/nonexistent/quill.ini", missing));

    // Discovery prefers the explicit variable.
#ifdef _WIN32
    _putenv_s("QUILL_CONFIG", CONFIG_INI);
#else
    setenv("QUILL_CONFIG", CONFIG_INI, 1);
#endif
    assert(quill::config::discoverConfigPath() == CONFIG_INI);
    return 0;
}
