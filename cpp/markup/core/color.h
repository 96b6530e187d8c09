#pragma once

#include <cstdint>
#include <cstdio>
#include <string>
#include <string_view>

namespace markup {

// Colors are packed as 0xRRGGBBAA.
using Color = std::uint32_t;

constexpr Color kColorWhite = 0xFFFFFFFFu;
constexpr Color kColorYellow = 0xFFFF00FFu;

constexpr float colorChannel(Color c, int shift) {
    return static_cast<float>((c >> shift) & 0xFFu) / 255.0f;
}
constexpr float colorR(Color c) { return colorChannel(c, 24); }
constexpr float colorG(Color c) { return colorChannel(c, 16); }
constexpr float colorB(Color c) { return colorChannel(c, 8); }
constexpr float colorA(Color c) { return colorChannel(c, 0); }

namespace detail {
inline int hexNibble(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}
} // namespace detail

/**
 * Parse "#rgb", "#rrggbb" or "#rrggbbaa". Missing alpha is opaque.
 * Returns false and leaves out untouched on malformed input.
 */
inline bool parseHexColor(std::string_view text, Color& out) {
    if (text.empty() || text[0] != '#') return false;
    text.remove_prefix(1);

    std::string expanded;
    if (text.size() == 3) {
        for (char c : text) {
            expanded.push_back(c);
            expanded.push_back(c);
        }
        text = expanded;
    }
    if (text.size() != 6 && text.size() != 8) return false;

    Color value = 0;
    for (char c : text) {
        const int n = detail::hexNibble(c);
        if (n < 0) return false;
        value = (value << 4) | static_cast<Color>(n);
    }
    if (text.size() == 6) value = (value << 8) | 0xFFu;
    out = value;
    return true;
}

// Multiply the alpha channel by opacity (clamped to [0,1]).
inline Color withOpacity(Color c, float opacity) {
    if (!(opacity > 0.0f)) opacity = 0.0f;
    if (opacity > 1.0f) opacity = 1.0f;
    const float a = static_cast<float>(c & 0xFFu) * opacity;
    return (c & 0xFFFFFF00u) | (static_cast<Color>(a + 0.5f) & 0xFFu);
}

inline std::string formatHexColor(Color c) {
    char buf[10];
    if ((c & 0xFFu) == 0xFFu) {
        std::snprintf(buf, sizeof(buf), "#%06x", static_cast<unsigned>(c >> 8));
    } else {
        std::snprintf(buf, sizeof(buf), "#%08x", static_cast<unsigned>(c));
    }
    return std::string(buf);
}

} // namespace markup
