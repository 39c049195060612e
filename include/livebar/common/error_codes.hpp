#pragma once

#include "error_framework.hpp"
#include <unordered_map>

namespace livebar {
namespace common {

enum class BarErrorCode {
    CONFIG_INVALID_COLOR = 100,
    CONFIG_UNKNOWN_STYLE = 101,
    CONFIG_INVALID_WIDTH = 102,
    CONFIG_INVALID_TOTAL = 103,
    CONFIG_INVALID_SMOOTHING = 104,
    CONFIG_INVALID_LOG_INTERVAL = 105,
    CONFIG_UNKNOWN_UNIT_SCALE = 106,
    CONFIG_INVALID_REDRAW_INTERVAL = 107,
    CONFIG_INVALID_SUFFIX_LINES = 108,

    STREAM_WRITE_FAILED = 300,
    STREAM_FLUSH_FAILED = 301,

    GROUP_CLOSED = 400
};

using BarErrorCodeHelper = ErrorRegistry<BarErrorCode>;
using BarError = CodedError<BarErrorCode>;

template<>
inline const std::unordered_map<BarErrorCode, ErrorInfo<BarErrorCode>>&
ErrorRegistry<BarErrorCode>::getInfoMap() {
    static const std::unordered_map<BarErrorCode, ErrorInfo<BarErrorCode>> map = {
        {BarErrorCode::CONFIG_INVALID_COLOR, {
            BarErrorCode::CONFIG_INVALID_COLOR,
            "CONFIG_INVALID_COLOR",
            "Invalid color specification"
        }},
        {BarErrorCode::CONFIG_UNKNOWN_STYLE, {
            BarErrorCode::CONFIG_UNKNOWN_STYLE,
            "CONFIG_UNKNOWN_STYLE",
            "Unknown bar style"
        }},
        {BarErrorCode::CONFIG_INVALID_WIDTH, {
            BarErrorCode::CONFIG_INVALID_WIDTH,
            "CONFIG_INVALID_WIDTH",
            "Bar width must be positive"
        }},
        {BarErrorCode::CONFIG_INVALID_TOTAL, {
            BarErrorCode::CONFIG_INVALID_TOTAL,
            "CONFIG_INVALID_TOTAL",
            "Total must be positive when present"
        }},
        {BarErrorCode::CONFIG_INVALID_SMOOTHING, {
            BarErrorCode::CONFIG_INVALID_SMOOTHING,
            "CONFIG_INVALID_SMOOTHING",
            "Smoothing factor must lie in [0, 1]"
        }},
        {BarErrorCode::CONFIG_INVALID_LOG_INTERVAL, {
            BarErrorCode::CONFIG_INVALID_LOG_INTERVAL,
            "CONFIG_INVALID_LOG_INTERVAL",
            "Log interval must not be negative"
        }},
        {BarErrorCode::CONFIG_UNKNOWN_UNIT_SCALE, {
            BarErrorCode::CONFIG_UNKNOWN_UNIT_SCALE,
            "CONFIG_UNKNOWN_UNIT_SCALE",
            "Unknown unit scale"
        }},
        {BarErrorCode::CONFIG_INVALID_REDRAW_INTERVAL, {
            BarErrorCode::CONFIG_INVALID_REDRAW_INTERVAL,
            "CONFIG_INVALID_REDRAW_INTERVAL",
            "Minimum redraw interval must not be negative"
        }},
        {BarErrorCode::CONFIG_INVALID_SUFFIX_LINES, {
            BarErrorCode::CONFIG_INVALID_SUFFIX_LINES,
            "CONFIG_INVALID_SUFFIX_LINES",
            "Maximum suffix lines must be positive"
        }},
        {BarErrorCode::STREAM_WRITE_FAILED, {
            BarErrorCode::STREAM_WRITE_FAILED,
            "STREAM_WRITE_FAILED",
            "Write to output stream failed"
        }},
        {BarErrorCode::STREAM_FLUSH_FAILED, {
            BarErrorCode::STREAM_FLUSH_FAILED,
            "STREAM_FLUSH_FAILED",
            "Flush of output stream failed"
        }},
        {BarErrorCode::GROUP_CLOSED, {
            BarErrorCode::GROUP_CLOSED,
            "GROUP_CLOSED",
            "Progress group is already closed"
        }}
    };
    return map;
}

}
}
