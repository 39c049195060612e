#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <variant>

namespace livebar {
namespace format {

struct Rgb {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;

    bool operator==(const Rgb& other) const {
        return r == other.r && g == other.g && b == other.b;
    }
    bool operator!=(const Rgb& other) const { return !(*this == other); }
};

// Caller-facing color input: a palette name, a "#RGB"/"#RRGGBB" hex string,
// or an RGB triple with components in 0..255.
using ColorSpec = std::variant<std::string, std::array<int, 3>>;

inline ColorSpec rgb(int r, int g, int b) {
    return std::array<int, 3>{r, g, b};
}

// Canonical color every renderer works with. Palette entries keep their
// 16-color SGR code and carry a nominal RGB value for interpolation.
struct Color {
    std::string name;
    Rgb value;
    std::string sgr;

    std::string apply(const std::string& text) const;
    bool operator==(const Color& other) const { return sgr == other.sgr && value == other.value; }
};

Color resolveColor(const ColorSpec& spec);
Color paletteColor(const std::string& name);
Color trueColor(Rgb value);
Rgb parseHexColor(const std::string& hex);

std::string foregroundSgr(Rgb value);
Rgb interpolate(Rgb from, Rgb to, double t);
Rgb scale(Rgb value, double factor);

std::string describe(const ColorSpec& spec);

}}
