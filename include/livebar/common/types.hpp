#pragma once

#include <chrono>
#include <functional>
#include <string>

namespace livebar {
namespace common {

using SteadyClock = std::chrono::steady_clock;
using TimePoint = SteadyClock::time_point;
using WallTimePoint = std::chrono::system_clock::time_point;
using Seconds = std::chrono::duration<double>;

using ClockFn = std::function<TimePoint()>;
using WallClockFn = std::function<WallTimePoint()>;

enum class DisplayMode {
    ANIMATED,
    FALLBACK
};

enum class RedrawReason {
    START,
    UPDATE,
    SUFFIX,
    REFRESH,
    FINALIZE
};

enum class FramePhase {
    LIVE_TICK,
    LIVE_STATIC,
    FINAL
};

std::string to_string(DisplayMode mode);
std::string to_string(RedrawReason reason);

inline double toSeconds(TimePoint::duration d) {
    return std::chrono::duration_cast<Seconds>(d).count();
}

}}
