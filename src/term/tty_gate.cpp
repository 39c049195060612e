#include "livebar/term/tty_gate.hpp"
#include "livebar/common/logger.hpp"

namespace livebar {
namespace term {

TtyGate::TtyGate(const OutputSink& render_sink)
    : mode_(render_sink.isTerminal() ? common::DisplayMode::ANIMATED
                                     : common::DisplayMode::FALLBACK) {
    common::Logger::instance().debug("[TtyGate] Display mode selected | mode={} | columns={}",
                                     common::to_string(mode_), render_sink.columns());
}

bool TtyGate::elapsedAtLeast(const std::optional<common::TimePoint>& since,
                             common::TimePoint now, double seconds) {
    if (!since || seconds <= 0.0) {
        return true;
    }
    return common::toSeconds(now - *since) >= seconds;
}

bool TtyGate::admit(RowThrottle& throttle, common::TimePoint now,
                    common::RedrawReason reason) const {
    using common::RedrawReason;

    if (mode_ == common::DisplayMode::ANIMATED) {
        if (reason == RedrawReason::UPDATE &&
            !elapsedAtLeast(throttle.last_redraw, now, throttle.min_redraw_interval)) {
            return false;
        }
        throttle.last_redraw = now;
        return true;
    }

    if (reason != RedrawReason::START && reason != RedrawReason::FINALIZE &&
        !elapsedAtLeast(throttle.last_log, now, throttle.log_interval)) {
        return false;
    }
    throttle.last_log = now;
    return true;
}

}}
