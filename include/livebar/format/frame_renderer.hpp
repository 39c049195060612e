#pragma once

#include "livebar/common/types.hpp"
#include "color.hpp"
#include "glyphs.hpp"
#include "units.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace livebar {
namespace format {

// Everything one frame depends on, copied out of a bar's state so that the
// same view and width always render to the same bytes.
struct BarView {
    std::string desc;
    BarStyle style = BarStyle::GRADIENT;
    Color color;
    int width = 0;
    std::string unit;
    UnitScale unit_scale = UnitScale::NONE;

    uint64_t current = 0;
    std::optional<uint64_t> total;
    double elapsed_seconds = 0.0;
    std::optional<double> rate;
    std::optional<double> eta_seconds;

    std::string suffix;
    size_t spinner_frame = 0;
    int bounce_position = 0;

    bool determinate() const { return total.has_value(); }
    bool complete() const { return total && current >= *total; }
    // Fraction in [0, 1]; overshoot is clamped, indeterminate bars report 0.
    double progress() const;
    double percentage() const { return progress() * 100.0; }
};

struct RenderFrame {
    std::vector<std::string> lines;
    int width = 0;

    std::string text() const;
    // Terminal rows the frame occupies once lines wider than columns wrap.
    int rows(int columns) const;
};

class FrameRenderer {
public:
    explicit FrameRenderer(int max_suffix_lines);

    RenderFrame render(const BarView& view, int columns, common::FramePhase phase) const;

    // Plain line for non-terminal output: no escape sequences, no newlines.
    // timestamp, when non-empty, is prefixed as "<timestamp> | ".
    std::string statusLine(const BarView& view, bool final, const std::string& timestamp) const;

private:
    int max_suffix_lines_;

    std::string leadGlyph(const BarView& view, common::FramePhase phase) const;
    std::string glyphRegion(const BarView& view) const;
    std::string gradientCells(const std::vector<std::string>& cells, const Color& color,
                              const std::string& empty_glyph) const;
    std::string composeMain(const BarView& view, const std::string& desc,
                            common::FramePhase phase) const;
    std::vector<std::string> suffixLines(const std::string& suffix, int available) const;
    std::string rateText(const BarView& view) const;
};

}}
