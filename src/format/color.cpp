#include "livebar/format/color.hpp"
#include "livebar/common/constants.hpp"
#include "livebar/common/error_codes.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <unordered_map>

namespace livebar {
namespace format {

namespace {

struct PaletteEntry {
    const char* sgr;
    Rgb nominal;
};

const std::unordered_map<std::string, PaletteEntry>& palette() {
    static const std::unordered_map<std::string, PaletteEntry> entries = {
        {"cyan", {"\033[96m", {85, 255, 255}}},
        {"green", {"\033[92m", {85, 255, 85}}},
        {"yellow", {"\033[93m", {255, 255, 85}}},
        {"blue", {"\033[94m", {85, 85, 255}}},
        {"magenta", {"\033[95m", {255, 85, 255}}},
        {"red", {"\033[91m", {255, 85, 85}}},
        {"white", {"\033[97m", {255, 255, 255}}},
        {"black", {"\033[90m", {127, 127, 127}}},
        {"reset", {"\033[0m", {229, 229, 229}}},
        {"bold", {"\033[1m", {255, 255, 255}}}
    };
    return entries;
}

[[noreturn]] void throwInvalidColor(const std::string& input, const std::string& reason) {
    common::ErrorContext ctx;
    ctx.component = "Color";
    ctx.details["input"] = input;
    ctx.details["reason"] = reason;
    throw common::BarError(common::BarErrorCode::CONFIG_INVALID_COLOR, ctx);
}

int hexDigit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

uint8_t clampChannel(double v) {
    return static_cast<uint8_t>(std::lround(std::clamp(v, 0.0, 255.0)));
}

}

std::string Color::apply(const std::string& text) const {
    if (sgr.empty()) return text;
    return sgr + text + constants::ansi::RESET;
}

std::string foregroundSgr(Rgb value) {
    return fmt::format("\033[38;2;{};{};{}m", value.r, value.g, value.b);
}

Color paletteColor(const std::string& name) {
    std::string key = name;
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    auto it = palette().find(key);
    if (it == palette().end()) {
        throwInvalidColor(name, "unknown color name");
    }
    return Color{key, it->second.nominal, it->second.sgr};
}

Color trueColor(Rgb value) {
    return Color{fmt::format("#{:02x}{:02x}{:02x}", value.r, value.g, value.b),
                 value, foregroundSgr(value)};
}

Rgb parseHexColor(const std::string& hex) {
    if (hex.empty() || hex[0] != '#') {
        throwInvalidColor(hex, "hex color must start with '#'");
    }

    std::string digits = hex.substr(1);
    if (digits.size() != 3 && digits.size() != 6) {
        throwInvalidColor(hex, "hex color must have 3 or 6 digits");
    }

    if (digits.size() == 3) {
        std::string expanded;
        for (char c : digits) {
            expanded += c;
            expanded += c;
        }
        digits = expanded;
    }

    int channels[3];
    for (int i = 0; i < 3; ++i) {
        int hi = hexDigit(digits[i * 2]);
        int lo = hexDigit(digits[i * 2 + 1]);
        if (hi < 0 || lo < 0) {
            throwInvalidColor(hex, "invalid hex digit");
        }
        channels[i] = hi * 16 + lo;
    }

    return Rgb{static_cast<uint8_t>(channels[0]),
               static_cast<uint8_t>(channels[1]),
               static_cast<uint8_t>(channels[2])};
}

Color resolveColor(const ColorSpec& spec) {
    if (const auto* triple = std::get_if<std::array<int, 3>>(&spec)) {
        for (int channel : *triple) {
            if (channel < 0 || channel > 255) {
                throwInvalidColor(describe(spec), "RGB components must be 0-255");
            }
        }
        return trueColor(Rgb{static_cast<uint8_t>((*triple)[0]),
                             static_cast<uint8_t>((*triple)[1]),
                             static_cast<uint8_t>((*triple)[2])});
    }

    const auto& text = std::get<std::string>(spec);
    if (text.empty()) {
        throwInvalidColor(text, "empty color");
    }
    if (text[0] == '#') {
        return trueColor(parseHexColor(text));
    }
    return paletteColor(text);
}

Rgb interpolate(Rgb from, Rgb to, double t) {
    t = std::clamp(t, 0.0, 1.0);
    return Rgb{clampChannel(from.r + (to.r - from.r) * t),
               clampChannel(from.g + (to.g - from.g) * t),
               clampChannel(from.b + (to.b - from.b) * t)};
}

Rgb scale(Rgb value, double factor) {
    return Rgb{clampChannel(value.r * factor),
               clampChannel(value.g * factor),
               clampChannel(value.b * factor)};
}

std::string describe(const ColorSpec& spec) {
    if (const auto* triple = std::get_if<std::array<int, 3>>(&spec)) {
        return fmt::format("({}, {}, {})", (*triple)[0], (*triple)[1], (*triple)[2]);
    }
    return std::get<std::string>(spec);
}

}}
