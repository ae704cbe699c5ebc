#ifndef COLOR_HPP
#define COLOR_HPP

#include <cstdint>

struct Color
{
    unsigned char r{0}, g{0}, b{0}, a{0xFF};
    constexpr Color(){}
    constexpr Color(unsigned char r, unsigned char g, unsigned char b, unsigned char a = 0xFF): r{r}, g{g}, b{b}, a{a} {}
    constexpr explicit Color(unsigned char y): r{y}, g{y}, b{y} {}

    constexpr bool operator==(const Color & other) const
    {
        return r == other.r
            && g == other.g
            && b == other.b
            && a == other.a;
    }

    // composite over an opaque gray background
    constexpr Color & alpha_blend(unsigned char bg)
    {
        auto blend = [this, bg](unsigned char c)
        {
            return static_cast<unsigned char>((c * a + bg * (0xFF - a) + 0x7F) / 0xFF);
        };

        r = blend(r);
        g = blend(g);
        b = blend(b);
        a = 0xFF;
        return *this;
    }

    // ITU-R BT.601 luma, integer weights
    constexpr unsigned char to_gray() const
    {
        return static_cast<unsigned char>((299u * r + 587u * g + 114u * b) / 1000u);
    }
};

// image rows are handed to C decoders as packed RGBA buffers
static_assert(sizeof(Color) == 4);

#endif // COLOR_HPP
