// include/quill/config/config.hpp
// @brief Editor configuration: highlight palette, background and editing options.
// @invariant Missing or malformed entries leave the built-in defaults in place.
// @ownership Config is a plain value; the loader only reads the file it is given.
#pragma once

#include "quill/render/style.hpp"
#include "quill/support/diagnostics.hpp"
#include "quill/syntax/tokenizer.hpp"

#include <string>

namespace quill::config
{

/// @brief Options from the [editor] section.
struct EditorConfig
{
    unsigned tab_width{4};
    std::string language{"auto"}; ///< "auto", "rust", "c", "cpp" or "plain".
    bool truecolor{true};
};

/// @brief Full configuration with defaults matching the built-in look.
struct Config
{
    syntax::Palette palette = syntax::Palette::defaults();
    render::RGBA background{0, 0, 0, 255};
    EditorConfig editor;
};

/// @brief Parse the INI file at @p path into @p out.
/// @param diags Receives a warning per rejected value when non-null.
/// @return False only when the file cannot be opened.
bool loadFromFile(const std::string &path, Config &out, support::DiagnosticEngine *diags = nullptr);

/// @brief Locate the user configuration file.
/// @return $QUILL_CONFIG when set, else $HOME/.config/quill/quill.ini when it
///         exists, else an empty string.
std::string discoverConfigPath();

/// @brief Resolve the language mode name to use for @p path.
/// @details "auto" defers to the file extension; anything else is used as-is.
std::string resolveLanguage(const Config &cfg, const std::string &path);

} // namespace quill::config
