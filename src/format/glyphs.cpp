#include "livebar/format/glyphs.hpp"
#include "livebar/common/constants.hpp"
#include "livebar/common/error_codes.hpp"
#include <algorithm>
#include <cmath>
#include <map>

namespace livebar {
namespace format {

namespace {

const std::map<BarStyle, std::vector<std::string>>& glyphTables() {
    static const std::map<BarStyle, std::vector<std::string>> tables = {
        {BarStyle::CLASSIC, {"█", "░"}},
        {BarStyle::GRADIENT, {"█", "▓", "▒", "░"}},
        {BarStyle::BRAILLE, {"⣿", "⣤", "⣄", "⡤", "⠤", "⠔", "⠒", "⠉", " "}},
        {BarStyle::CIRCLES, {"●", "○"}},
        {BarStyle::BLOCKS, {"▓", "▒", "░"}}
    };
    return tables;
}

// Braille cells each carry their own fill level, so the boundary fades over
// one cell instead of jumping.
std::vector<std::string> brailleCells(const std::vector<std::string>& table,
                                      double progress, int width) {
    std::vector<std::string> cells;
    cells.reserve(width);
    const double filled = progress * width;
    const int last = static_cast<int>(table.size()) - 1;

    for (int i = 0; i < width; ++i) {
        double level = std::clamp(filled - i, 0.0, 1.0);
        int index = static_cast<int>(std::lround((1.0 - level) * last));
        cells.push_back(table[std::clamp(index, 0, last)]);
    }
    return cells;
}

std::vector<std::string> partialCells(const std::vector<std::string>& table,
                                      double progress, int width) {
    std::vector<std::string> cells;
    cells.reserve(width);

    const double exact = progress * width;
    const int filled = std::min(static_cast<int>(exact), width);
    const double partial = exact - filled;
    const int shades = static_cast<int>(table.size()) - 2;

    for (int i = 0; i < filled; ++i) {
        cells.push_back(table.front());
    }
    if (filled < width) {
        if (partial > 0.0) {
            int index = shades - static_cast<int>(partial * shades);
            cells.push_back(table[std::clamp(index, 1, shades)]);
        } else {
            cells.push_back(table.back());
        }
        for (int i = filled + 1; i < width; ++i) {
            cells.push_back(table.back());
        }
    }
    return cells;
}

}

BarStyle parseBarStyle(const std::string& name) {
    if (name == "classic") return BarStyle::CLASSIC;
    if (name == "gradient") return BarStyle::GRADIENT;
    if (name == "braille") return BarStyle::BRAILLE;
    if (name == "circles") return BarStyle::CIRCLES;
    if (name == "blocks") return BarStyle::BLOCKS;

    common::ErrorContext ctx;
    ctx.component = "Glyphs";
    ctx.details["bar_style"] = name;
    ctx.details["expected"] = "classic|gradient|braille|circles|blocks";
    throw common::BarError(common::BarErrorCode::CONFIG_UNKNOWN_STYLE, ctx);
}

std::string to_string(BarStyle style) {
    switch (style) {
        case BarStyle::CLASSIC: return "classic";
        case BarStyle::GRADIENT: return "gradient";
        case BarStyle::BRAILLE: return "braille";
        case BarStyle::CIRCLES: return "circles";
        case BarStyle::BLOCKS: return "blocks";
        default: return "unknown";
    }
}

const std::vector<std::string>& glyphTable(BarStyle style) {
    return glyphTables().at(style);
}

std::vector<std::string> barCells(BarStyle style, double progress, int width) {
    if (width <= 0) {
        return {};
    }
    if (!std::isfinite(progress)) {
        progress = 0.0;
    }
    progress = std::clamp(progress, 0.0, 1.0);

    const auto& table = glyphTable(style);
    if (style == BarStyle::BRAILLE) {
        return brailleCells(table, progress, width);
    }
    if (table.size() > 2) {
        return partialCells(table, progress, width);
    }

    const int filled = std::min(static_cast<int>(progress * width), width);
    std::vector<std::string> cells(filled, table.front());
    cells.resize(width, table.back());
    return cells;
}

int bouncePositions(int width) {
    return std::max(1, width - constants::glyphs::BOUNCE_MARKER_CELLS + 1);
}

std::vector<std::string> bounceCells(BarStyle style, int position, int width) {
    if (width <= 0) {
        return {};
    }
    const auto& table = glyphTable(style);
    std::vector<std::string> cells(width, table.back());

    position = std::clamp(position, 0, bouncePositions(width) - 1);
    const int end = std::min(width, position + constants::glyphs::BOUNCE_MARKER_CELLS);
    for (int i = position; i < end; ++i) {
        cells[i] = table.front();
    }
    return cells;
}

}}
