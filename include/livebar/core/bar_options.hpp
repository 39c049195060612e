#pragma once

#include "livebar/common/constants.hpp"
#include "livebar/format/color.hpp"
#include "livebar/format/glyphs.hpp"
#include "livebar/format/units.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace livebar {
namespace core {

// Construction options as callers write them. Defaults are the compiled
// ones; fromConfig() starts from the loaded [bar] and [render] sections.
struct BarOptions {
    std::optional<int64_t> total;
    std::string desc;
    std::string bar_style = constants::config_defaults::BAR_STYLE;
    format::ColorSpec color = std::string(constants::config_defaults::COLOR);
    int width = constants::config_defaults::BAR_WIDTH;
    std::string unit = constants::config_defaults::UNIT;
    std::string unit_scale = constants::config_defaults::UNIT_SCALE;
    double smoothing = constants::config_defaults::SMOOTHING;
    double log_interval = constants::config_defaults::LOG_INTERVAL;
    bool log_timestamp = constants::config_defaults::LOG_TIMESTAMP;
    bool thread_safe = constants::config_defaults::THREAD_SAFE;
    double min_redraw_interval = constants::config_defaults::MIN_REDRAW_INTERVAL;
    int max_suffix_lines = constants::config_defaults::MAX_SUFFIX_LINES;

    static BarOptions fromConfig();
};

// Validated options with every input normalized. Building one is the only
// place configuration errors are raised.
struct BarConfig {
    std::optional<uint64_t> total;
    std::string desc;
    format::BarStyle style;
    format::Color color;
    int width;
    std::string unit;
    format::UnitScale unit_scale;
    double smoothing;
    double log_interval;
    bool log_timestamp;
    bool thread_safe;
    double min_redraw_interval;
    int max_suffix_lines;

    static BarConfig resolve(const BarOptions& options);
};

}}
