#include "livebar/format/frame_renderer.hpp"
#include "livebar/format/ansi_text.hpp"
#include "livebar/common/constants.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm>

namespace livebar {
namespace format {

namespace {

constexpr double GRADIENT_START_FACTOR = 0.45;

std::string joinParts(const std::vector<std::string>& parts) {
    std::string result;
    for (const auto& part : parts) {
        if (part.empty()) continue;
        if (!result.empty()) result += " ";
        result += part;
    }
    return result;
}

std::string endWithReset(std::string line) {
    const std::string reset = constants::ansi::RESET;
    if (line.size() < reset.size() ||
        line.compare(line.size() - reset.size(), reset.size(), reset) != 0) {
        line += reset;
    }
    return line;
}

std::string flatten(const std::string& text) {
    std::string plain = stripAnsi(text);
    std::replace(plain.begin(), plain.end(), '\n', ' ');
    std::replace(plain.begin(), plain.end(), '\r', ' ');
    return plain;
}

// Control bytes other than ESC move the cursor without being measured, so
// they become spaces before any width is computed.
std::string replaceControls(const std::string& text, bool keep_newlines) {
    std::string result = text;
    for (auto& c : result) {
        if (c == constants::ansi::ESC || (keep_newlines && c == '\n')) continue;
        auto byte = static_cast<unsigned char>(c);
        if (byte < 0x20 || byte == 0x7F) {
            c = ' ';
        }
    }
    return result;
}

}

double BarView::progress() const {
    if (!total || *total == 0) {
        return 0.0;
    }
    uint64_t shown = std::min(current, *total);
    return static_cast<double>(shown) / static_cast<double>(*total);
}

std::string RenderFrame::text() const {
    std::string result;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) result += "\n";
        result += lines[i];
    }
    return result;
}

int RenderFrame::rows(int columns) const {
    if (columns <= 0) {
        return static_cast<int>(lines.size());
    }
    int total = 0;
    for (const auto& line : lines) {
        int w = displayWidth(line);
        total += std::max(1, (w + columns - 1) / columns);
    }
    return total;
}

FrameRenderer::FrameRenderer(int max_suffix_lines)
    : max_suffix_lines_(std::max(1, max_suffix_lines)) {}

std::string FrameRenderer::leadGlyph(const BarView& view, common::FramePhase phase) const {
    using namespace constants;

    if (phase == common::FramePhase::FINAL) {
        if (view.determinate() && !view.complete()) {
            return std::string(ansi::FAIL_COLOR) + glyphs::INCOMPLETE_MARK + ansi::RESET;
        }
        return std::string(ansi::DONE_COLOR) + glyphs::DONE_MARK + ansi::RESET;
    }
    return glyphs::SPINNER[view.spinner_frame % glyphs::SPINNER.size()];
}

std::string FrameRenderer::gradientCells(const std::vector<std::string>& cells, const Color& color,
                                         const std::string& empty_glyph) const {
    auto lit = static_cast<int>(std::count_if(cells.begin(), cells.end(),
        [&](const std::string& cell) { return cell != empty_glyph; }));

    Rgb start = scale(color.value, GRADIENT_START_FACTOR);
    std::string result;
    int index = 0;
    bool empty_started = false;

    for (const auto& cell : cells) {
        if (cell != empty_glyph) {
            double t = lit > 1 ? static_cast<double>(index) / (lit - 1) : 1.0;
            result += foregroundSgr(interpolate(start, color.value, t)) + cell;
            ++index;
        } else {
            if (!empty_started) {
                result += color.sgr;
                empty_started = true;
            }
            result += cell;
        }
    }
    return result + constants::ansi::RESET;
}

std::string FrameRenderer::glyphRegion(const BarView& view) const {
    std::vector<std::string> cells = view.determinate()
        ? barCells(view.style, view.progress(), view.width)
        : bounceCells(view.style, view.bounce_position, view.width);

    std::string body;
    if (view.style == BarStyle::GRADIENT) {
        body = gradientCells(cells, view.color, glyphTable(view.style).back());
    } else {
        body = view.color.sgr;
        for (const auto& cell : cells) body += cell;
        body += constants::ansi::RESET;
    }
    return "[" + body + "]";
}

std::string FrameRenderer::rateText(const BarView& view) const {
    if (!view.rate) {
        return "-- " + view.unit + "/s";
    }
    return formatRate(*view.rate, view.unit_scale) + " " + view.unit + "/s";
}

std::string FrameRenderer::composeMain(const BarView& view, const std::string& desc,
                                       common::FramePhase phase) const {
    std::vector<std::string> parts;
    parts.push_back(leadGlyph(view, phase));
    parts.push_back(desc.empty() ? "" : view.color.apply(desc));
    parts.push_back(glyphRegion(view));

    if (view.determinate()) {
        parts.push_back(fmt::format("{:5.1f}%", view.percentage()));
        parts.push_back(formatNumber(static_cast<double>(view.current), view.unit_scale) + "/" +
                        formatNumber(static_cast<double>(*view.total), view.unit_scale));
        parts.push_back(rateText(view));
        parts.push_back(formatDuration(view.elapsed_seconds));
        if (phase != common::FramePhase::FINAL && !view.complete()) {
            parts.push_back("ETA: " + (view.eta_seconds ? formatDuration(*view.eta_seconds)
                                                        : std::string("--")));
        }
    } else {
        parts.push_back(formatNumber(static_cast<double>(view.current), view.unit_scale) +
                        " " + view.unit);
        parts.push_back(rateText(view));
        parts.push_back(formatDuration(view.elapsed_seconds));
    }
    return joinParts(parts);
}

std::vector<std::string> FrameRenderer::suffixLines(const std::string& suffix, int available) const {
    std::vector<std::string> wrapped = wrapToWidth(suffix, available);
    bool elided = false;
    if (static_cast<int>(wrapped.size()) > max_suffix_lines_) {
        wrapped.resize(max_suffix_lines_);
        elided = true;
    }

    std::vector<std::string> lines;
    for (size_t i = 0; i < wrapped.size(); ++i) {
        std::string content = wrapped[i];
        if (elided && i + 1 == wrapped.size()) {
            const std::string marker = constants::glyphs::ELLIPSIS;
            int room = available - displayWidth(marker);
            content = room > 0 ? truncateToWidth(content, room) + marker
                               : truncateToWidth(marker, available);
        }
        lines.push_back(endWithReset(constants::ansi::SUFFIX_COLOR + content));
    }
    return lines;
}

RenderFrame FrameRenderer::render(const BarView& view, int columns, common::FramePhase phase) const {
    const int available = std::max(1, columns - constants::limits::LINE_MARGIN);
    const std::string desc = replaceControls(view.desc, false);
    const std::string suffix = replaceControls(view.suffix, true);

    std::string main = composeMain(view, desc, phase);
    int main_width = displayWidth(main);

    if (main_width > available && !desc.empty()) {
        int desc_room = displayWidth(desc) - (main_width - available);
        std::string shown = desc_room > 0 ? elide(desc, desc_room, constants::glyphs::ELLIPSIS) : "";
        main = composeMain(view, shown, phase);
        main_width = displayWidth(main);
    }

    RenderFrame frame;
    if (!suffix.empty()) {
        std::string inline_suffix = constants::ansi::SUFFIX_COLOR + suffix + constants::ansi::RESET;
        bool single_line = suffix.find('\n') == std::string::npos &&
                           main_width + 1 + displayWidth(suffix) <= available;
        if (single_line) {
            frame.lines.push_back(endWithReset(main + " " + inline_suffix));
        } else {
            frame.lines.push_back(endWithReset(main));
            for (auto& line : suffixLines(suffix, available)) {
                frame.lines.push_back(std::move(line));
            }
        }
    } else {
        frame.lines.push_back(endWithReset(main));
    }

    for (const auto& line : frame.lines) {
        frame.width = std::max(frame.width, displayWidth(line));
    }
    return frame;
}

std::string FrameRenderer::statusLine(const BarView& view, bool final, const std::string& timestamp) const {
    std::string line;
    if (!timestamp.empty()) {
        line += timestamp + " | ";
    }

    std::string desc = flatten(view.desc);
    if (!desc.empty()) {
        line += desc + ": ";
    }

    if (view.determinate()) {
        line += fmt::format("{:.1f}% ({}/{})", view.percentage(),
                            formatNumber(static_cast<double>(view.current), view.unit_scale),
                            formatNumber(static_cast<double>(*view.total), view.unit_scale));
        if (view.rate) {
            line += " " + formatRate(*view.rate, view.unit_scale) + " " + view.unit + "/s";
        }
    } else {
        line += formatNumber(static_cast<double>(view.current), view.unit_scale) + " " +
                view.unit + " processed";
        if (view.rate) {
            line += " (" + formatRate(*view.rate, view.unit_scale) + " " + view.unit + "/s)";
        }
    }

    std::string suffix = flatten(view.suffix);
    if (!suffix.empty()) {
        line += " " + suffix;
    }

    if (final) {
        if (view.determinate() && !view.complete()) {
            line += " - incomplete after " + formatDuration(view.elapsed_seconds);
        } else {
            line += " - done in " + formatDuration(view.elapsed_seconds);
        }
    }
    return line;
}

}}
