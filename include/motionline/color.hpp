#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace motionline
{

// Display color of a timeline segment. Components are 8-bit because the
// export model stores colors as "#RRGGBB".
struct Color
{
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;
    uint8_t a = 255;

    constexpr Color() = default;
    constexpr Color(uint8_t r, uint8_t g, uint8_t b, uint8_t a = 255) : r(r), g(g), b(b), a(a) {}

    constexpr bool operator==(const Color&) const = default;
};

inline constexpr Color rgb(uint8_t r, uint8_t g, uint8_t b)
{
    return Color{r, g, b, 255};
}

// Build a color from a packed 0xRRGGBB value.
inline constexpr Color rgb_hex(uint32_t packed)
{
    return Color{static_cast<uint8_t>((packed >> 16) & 0xFF),
                 static_cast<uint8_t>((packed >> 8) & 0xFF),
                 static_cast<uint8_t>(packed & 0xFF),
                 255};
}

// "#RRGGBB" (uppercase hex, alpha dropped).
std::string to_hex(const Color& c);

// Parse "#RRGGBB" or "RRGGBB" (case-insensitive). Returns nullopt on
// malformed input.
std::optional<Color> parse_hex(std::string_view text);

// Perceived lightness in [0, 255], used to pick a readable label color.
int lightness(const Color& c);

// Lighter/darker variants for locked and outlined segments.
Color lighter(const Color& c, float factor = 1.5f);
Color darker(const Color& c, float factor = 1.2f);

namespace colors
{
inline constexpr Color black{0, 0, 0};
inline constexpr Color white{255, 255, 255};
inline constexpr Color neutral_gray = rgb_hex(0x757575);
inline constexpr Color playhead     = rgb_hex(0xFF5722);
inline constexpr Color selection    = rgb_hex(0x2196F3);
}   // namespace colors

}   // namespace motionline
