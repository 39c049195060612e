#include "livebar/core/bar_options.hpp"
#include "livebar/common/config.hpp"
#include "livebar/common/error_codes.hpp"
#include "livebar/common/logger.hpp"
#include <cmath>
#include <spdlog/fmt/fmt.h>

namespace livebar {
namespace core {

namespace {

[[noreturn]] void throwInvalid(common::BarErrorCode code, const std::string& key,
                               const std::string& value) {
    common::ErrorContext ctx;
    ctx.component = "BarConfig";
    ctx.details[key] = value;
    throw common::BarError(code, ctx);
}

bool nonNegative(double value) {
    return std::isfinite(value) && value >= 0.0;
}

}

BarOptions BarOptions::fromConfig() {
    const auto& global = common::Config::instance().global();

    BarOptions options;
    options.bar_style = global.bar.bar_style;
    options.color = global.bar.color;
    options.width = global.bar.width;
    options.unit = global.bar.unit;
    options.unit_scale = global.bar.unit_scale;
    options.smoothing = global.bar.smoothing;
    options.log_interval = global.bar.log_interval;
    options.log_timestamp = global.bar.log_timestamp;
    options.thread_safe = global.bar.thread_safe;
    options.min_redraw_interval = global.bar.min_redraw_interval;
    options.max_suffix_lines = global.render.max_suffix_lines;
    return options;
}

BarConfig BarConfig::resolve(const BarOptions& options) {
    using common::BarErrorCode;

    BarConfig config;

    if (options.total) {
        if (*options.total <= 0) {
            throwInvalid(BarErrorCode::CONFIG_INVALID_TOTAL, "total", std::to_string(*options.total));
        }
        config.total = static_cast<uint64_t>(*options.total);
    }

    if (options.width <= 0) {
        throwInvalid(BarErrorCode::CONFIG_INVALID_WIDTH, "width", std::to_string(options.width));
    }
    if (!std::isfinite(options.smoothing) || options.smoothing < 0.0 || options.smoothing > 1.0) {
        throwInvalid(BarErrorCode::CONFIG_INVALID_SMOOTHING, "smoothing",
                     fmt::format("{}", options.smoothing));
    }
    if (!nonNegative(options.log_interval)) {
        throwInvalid(BarErrorCode::CONFIG_INVALID_LOG_INTERVAL, "log_interval",
                     fmt::format("{}", options.log_interval));
    }
    if (!nonNegative(options.min_redraw_interval)) {
        throwInvalid(BarErrorCode::CONFIG_INVALID_REDRAW_INTERVAL, "min_redraw_interval",
                     fmt::format("{}", options.min_redraw_interval));
    }
    if (options.max_suffix_lines <= 0) {
        throwInvalid(BarErrorCode::CONFIG_INVALID_SUFFIX_LINES, "max_suffix_lines",
                     std::to_string(options.max_suffix_lines));
    }

    config.desc = options.desc;
    config.style = format::parseBarStyle(options.bar_style);
    config.color = format::resolveColor(options.color);
    config.width = options.width;
    config.unit = options.unit;
    config.unit_scale = format::parseUnitScale(options.unit_scale);
    config.smoothing = options.smoothing;
    config.log_interval = options.log_interval;
    config.log_timestamp = options.log_timestamp;
    config.thread_safe = options.thread_safe;
    config.min_redraw_interval = options.min_redraw_interval;
    config.max_suffix_lines = options.max_suffix_lines;

    common::Logger::instance().debug("[BarConfig] Resolved | desc={} | style={} | color={} | width={}",
                                     config.desc, format::to_string(config.style),
                                     config.color.name, config.width);
    return config;
}

}}
