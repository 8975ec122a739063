#include <algorithm>
#include <cctype>
#include <cstdio>
#include <motionline/color.hpp>

namespace motionline
{

namespace
{

int hex_digit(char c)
{
    if (c >= '0' && c <= '9')
        return c - '0';
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (c >= 'a' && c <= 'f')
        return 10 + (c - 'a');
    return -1;
}

uint8_t scale_channel(uint8_t v, float factor)
{
    float scaled = static_cast<float>(v) * factor;
    return static_cast<uint8_t>(std::clamp(scaled, 0.0f, 255.0f));
}

}   // anonymous namespace

std::string to_hex(const Color& c)
{
    char buf[8];
    std::snprintf(buf, sizeof(buf), "#%02X%02X%02X", c.r, c.g, c.b);
    return std::string(buf);
}

std::optional<Color> parse_hex(std::string_view text)
{
    if (!text.empty() && text.front() == '#')
        text.remove_prefix(1);
    if (text.size() != 6)
        return std::nullopt;

    uint8_t channels[3];
    for (size_t i = 0; i < 3; ++i)
    {
        int hi = hex_digit(text[i * 2]);
        int lo = hex_digit(text[i * 2 + 1]);
        if (hi < 0 || lo < 0)
            return std::nullopt;
        channels[i] = static_cast<uint8_t>(hi * 16 + lo);
    }
    return Color{channels[0], channels[1], channels[2], 255};
}

int lightness(const Color& c)
{
    // HSL lightness: (max + min) / 2
    int hi = std::max({c.r, c.g, c.b});
    int lo = std::min({c.r, c.g, c.b});
    return (hi + lo) / 2;
}

Color lighter(const Color& c, float factor)
{
    return Color{scale_channel(c.r, factor), scale_channel(c.g, factor), scale_channel(c.b, factor), c.a};
}

Color darker(const Color& c, float factor)
{
    if (factor <= 0.0f)
        return c;
    float inv = 1.0f / factor;
    return Color{scale_channel(c.r, inv), scale_channel(c.g, inv), scale_channel(c.b, inv), c.a};
}

}   // namespace motionline
