#include "livebar/format/units.hpp"
#include "livebar/common/error_codes.hpp"
#include <spdlog/fmt/fmt.h>
#include <array>
#include <cmath>

namespace livebar {
namespace format {

namespace {

constexpr std::array<const char*, 5> DECIMAL_SUFFIXES = {"", "K", "M", "B", "T"};
constexpr std::array<const char*, 6> BINARY_SUFFIXES = {"", "KiB", "MiB", "GiB", "TiB", "PiB"};

template<size_t N>
std::string scaleWithSuffixes(double value, double threshold,
                              const std::array<const char*, N>& suffixes) {
    for (size_t i = 0; i < N; ++i) {
        if (std::fabs(value) < threshold) {
            if (i == 0) {
                return fmt::format("{:.0f}", value);
            }
            return fmt::format("{:.1f}{}", value, suffixes[i]);
        }
        value /= threshold;
    }
    return fmt::format("{:.1f}{}", value * threshold, suffixes[N - 1]);
}

}

UnitScale parseUnitScale(const std::string& name) {
    if (name == "none") return UnitScale::NONE;
    if (name == "kmg") return UnitScale::DECIMAL;
    if (name == "binary") return UnitScale::BINARY;

    common::ErrorContext ctx;
    ctx.component = "Units";
    ctx.details["unit_scale"] = name;
    ctx.details["expected"] = "none|kmg|binary";
    throw common::BarError(common::BarErrorCode::CONFIG_UNKNOWN_UNIT_SCALE, ctx);
}

std::string to_string(UnitScale scale) {
    switch (scale) {
        case UnitScale::NONE: return "none";
        case UnitScale::DECIMAL: return "kmg";
        case UnitScale::BINARY: return "binary";
        default: return "unknown";
    }
}

std::string formatNumber(double value, UnitScale scale) {
    switch (scale) {
        case UnitScale::DECIMAL:
            return scaleWithSuffixes(value, 1000.0, DECIMAL_SUFFIXES);
        case UnitScale::BINARY:
            return scaleWithSuffixes(value, 1024.0, BINARY_SUFFIXES);
        case UnitScale::NONE:
        default:
            return fmt::format("{:.0f}", value);
    }
}

std::string formatRate(double per_second, UnitScale scale) {
    if (scale == UnitScale::NONE) {
        return fmt::format("{:.1f}", per_second);
    }
    return formatNumber(per_second, scale);
}

std::string formatDuration(double seconds) {
    if (!std::isfinite(seconds) || seconds < 0) {
        seconds = 0;
    }
    if (seconds < 60.0) {
        return fmt::format("{:.1f}s", seconds);
    }

    auto total = static_cast<long long>(seconds);
    if (total < 3600) {
        return fmt::format("{}m{:02d}s", total / 60, total % 60);
    }
    return fmt::format("{}h{:02d}m", total / 3600, (total % 3600) / 60);
}

}}
