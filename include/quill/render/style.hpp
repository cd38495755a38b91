// include/quill/render/style.hpp
// @brief Colour value used as the presentation value of highlight tags.
// @invariant Alpha is carried for completeness; terminals ignore it.
// @ownership Plain value type.
#pragma once

#include <cstdint>

namespace quill::render
{

/// @brief 8-bit per channel colour.
struct RGBA
{
    uint8_t r{0};
    uint8_t g{0};
    uint8_t b{0};
    uint8_t a{255};

    bool operator==(const RGBA &other) const = default;
};

/// @brief Foreground/background pair emitted by the ANSI renderer.
struct Style
{
    RGBA fg{229, 229, 229, 255};
    RGBA bg{0, 0, 0, 255};

    bool operator==(const Style &other) const = default;
};

} // namespace quill::render
