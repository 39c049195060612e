#pragma once

#include <string>

namespace livebar {
namespace format {

enum class UnitScale {
    NONE,
    DECIMAL,
    BINARY
};

// Accepts "none", "kmg" and "binary"; anything else throws
// CONFIG_UNKNOWN_UNIT_SCALE.
UnitScale parseUnitScale(const std::string& name);
std::string to_string(UnitScale scale);

// Counts render as whole numbers below the first threshold and with one
// decimal plus a suffix (K/M/B/T or KiB..PiB) above it.
std::string formatNumber(double value, UnitScale scale);
std::string formatRate(double per_second, UnitScale scale);
std::string formatDuration(double seconds);

}}
