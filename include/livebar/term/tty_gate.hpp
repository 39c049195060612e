#pragma once

#include "livebar/common/types.hpp"
#include "output_sink.hpp"
#include <optional>

namespace livebar {
namespace term {

// Per-row redraw bookkeeping consulted by TtyGate.
struct RowThrottle {
    double min_redraw_interval = 0.0;
    double log_interval = 0.0;
    std::optional<common::TimePoint> last_redraw;
    std::optional<common::TimePoint> last_log;
};

// Chooses between animated redraws and plain status lines. The decision is
// taken once, from the render sink, when the gate is built.
class TtyGate {
public:
    explicit TtyGate(const OutputSink& render_sink);

    common::DisplayMode mode() const { return mode_; }
    bool animated() const { return mode_ == common::DisplayMode::ANIMATED; }

    // Decides whether a redraw for reason may be emitted now and, if so,
    // records it in throttle.
    //
    // Animated: START, SUFFIX, REFRESH and FINALIZE always pass; UPDATE
    // passes once min_redraw_interval has elapsed since the last redraw.
    // Fallback: START and FINALIZE always pass; everything else passes once
    // log_interval has elapsed since the last line (0 disables the limit).
    bool admit(RowThrottle& throttle, common::TimePoint now, common::RedrawReason reason) const;

private:
    common::DisplayMode mode_;

    static bool elapsedAtLeast(const std::optional<common::TimePoint>& since,
                               common::TimePoint now, double seconds);
};

}}
