#pragma once

#include <string>
#include <vector>

namespace livebar {
namespace format {

enum class BarStyle {
    CLASSIC,
    GRADIENT,
    BRAILLE,
    CIRCLES,
    BLOCKS
};

BarStyle parseBarStyle(const std::string& name);
std::string to_string(BarStyle style);

// Glyph table for a style, densest first; the last entry is the empty cell.
const std::vector<std::string>& glyphTable(BarStyle style);

// One glyph per cell for a determinate bar. progress is clamped to [0, 1].
std::vector<std::string> barCells(BarStyle style, double progress, int width);

// Marker cells placed at position inside an otherwise empty track. The
// marker is clipped at the right edge when the track is narrower than it.
std::vector<std::string> bounceCells(BarStyle style, int position, int width);

// Number of distinct marker positions for a track of the given width.
int bouncePositions(int width);

}}
