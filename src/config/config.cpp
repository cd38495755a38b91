// src/config/config.cpp
// @brief INI-like configuration loader implementation.
// @invariant Reads sections [theme] and [editor]; other sections are ignored.
// @ownership Loader does not own external resources beyond file path.

#include "quill/config/config.hpp"

#include "quill/syntax/language.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string_view>
#include <utility>

namespace quill::config
{

namespace
{
using syntax::HighlightTag;

std::string trim(std::string_view sv)
{
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front())))
    {
        sv.remove_prefix(1);
    }
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back())))
    {
        sv.remove_suffix(1);
    }
    return std::string(sv);
}

std::string lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

bool parse_color(const std::string &s, render::RGBA &out)
{
    std::string hex = s;
    if (!hex.empty() && hex[0] == '#')
    {
        hex.erase(0, 1);
    }
    if (hex.size() != 6 || !std::all_of(hex.begin(), hex.end(), [](unsigned char c) {
            return std::isxdigit(c) != 0;
        }))
    {
        return false;
    }
    unsigned v = 0;
    std::istringstream iss(hex);
    iss >> std::hex >> v;
    if (iss.fail())
    {
        return false;
    }
    out.r = static_cast<uint8_t>((v >> 16) & 0xFF);
    out.g = static_cast<uint8_t>((v >> 8) & 0xFF);
    out.b = static_cast<uint8_t>(v & 0xFF);
    out.a = 255;
    return true;
}

bool parse_bool(const std::string &s, bool &out)
{
    const std::string l = lower(s);
    if (l == "1" || l == "true" || l == "yes" || l == "on")
    {
        out = true;
        return true;
    }
    if (l == "0" || l == "false" || l == "no" || l == "off")
    {
        out = false;
        return true;
    }
    return false;
}

bool parse_tab_width(const std::string &s, unsigned &out)
{
    unsigned v = 0;
    const char *first = s.data();
    const char *last = s.data() + s.size();
    auto [ptr, ec] = std::from_chars(first, last, v);
    if (ec != std::errc{} || ptr != last || v < 1 || v > 16)
    {
        return false;
    }
    out = v;
    return true;
}

/// @brief Map "<tag>_fg" theme keys onto palette slots.
bool theme_tag(const std::string &key, HighlightTag &tag)
{
    static constexpr std::pair<std::string_view, HighlightTag> kKeys[] = {
        {"standard_fg", HighlightTag::Standard},
        {"identifier_fg", HighlightTag::Identifier},
        {"keyword_fg", HighlightTag::Keyword},
        {"number_fg", HighlightTag::Number},
        {"bracket_fg", HighlightTag::Bracket},
        {"string_fg", HighlightTag::String},
        {"comment_fg", HighlightTag::Comment},
        {"search_fg", HighlightTag::SearchResult},
    };
    for (const auto &[name, t] : kKeys)
    {
        if (key == name)
        {
            tag = t;
            return true;
        }
    }
    return false;
}

bool known_language(const std::string &name)
{
    return name == "auto" || name == "plain" || syntax::findLanguage(name) != nullptr;
}

} // namespace

bool loadFromFile(const std::string &path, Config &out, support::DiagnosticEngine *diags)
{
    std::ifstream in(path);
    if (!in)
    {
        return false;
    }

    auto reject = [&](int lineNo, const std::string &key, const std::string &value) {
        if (diags)
        {
            diags->warn(path,
                        "line " + std::to_string(lineNo) + ": ignoring invalid value '" + value +
                            "' for '" + key + "'");
        }
    };

    std::string line;
    std::string section;
    int lineNo = 0;
    while (std::getline(in, line))
    {
        ++lineNo;
        std::string trimmed = trim(line);
        if (trimmed.empty() || trimmed[0] == '#' || trimmed[0] == ';')
        {
            continue;
        }
        if (trimmed.front() == '[' && trimmed.back() == ']')
        {
            section = lower(trimmed.substr(1, trimmed.size() - 2));
            continue;
        }
        auto eq = trimmed.find('=');
        if (eq == std::string::npos)
        {
            continue;
        }
        std::string key = lower(trim(trimmed.substr(0, eq)));
        std::string value = trim(trimmed.substr(eq + 1));

        if (section == "theme")
        {
            render::RGBA col;
            HighlightTag tag{};
            const bool isBackground = key == "background";
            if (!isBackground && !theme_tag(key, tag))
            {
                continue;
            }
            if (!parse_color(value, col))
            {
                reject(lineNo, key, value);
                continue;
            }
            if (isBackground)
                out.background = col;
            else
                out.palette[tag] = col;
        }
        else if (section == "editor")
        {
            if (key == "tab_width")
            {
                if (!parse_tab_width(value, out.editor.tab_width))
                    reject(lineNo, key, value);
            }
            else if (key == "language")
            {
                std::string name = lower(value);
                if (known_language(name))
                    out.editor.language = std::move(name);
                else
                    reject(lineNo, key, value);
            }
            else if (key == "truecolor")
            {
                if (!parse_bool(value, out.editor.truecolor))
                    reject(lineNo, key, value);
            }
        }
    }
    return true;
}

std::string discoverConfigPath()
{
    if (const char *explicitPath = std::getenv("QUILL_CONFIG"); explicitPath && *explicitPath)
    {
        return explicitPath;
    }
    const char *home = std::getenv("HOME");
    if (!home || !*home)
    {
        return {};
    }
    std::string candidate = std::string(home) + "/.config/quill/quill.ini";
    std::ifstream probe(candidate);
    if (!probe)
    {
        return {};
    }
    return candidate;
}

std::string resolveLanguage(const Config &cfg, const std::string &path)
{
    if (cfg.editor.language != "auto")
    {
        return cfg.editor.language;
    }
    return std::string(syntax::languageForPath(path));
}

} // namespace quill::config
