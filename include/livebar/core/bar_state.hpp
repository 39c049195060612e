#pragma once

#include "bar_options.hpp"
#include "smoother.hpp"
#include "livebar/common/types.hpp"
#include "livebar/format/frame_renderer.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace livebar {
namespace core {

// Live numeric state of one bar. Not synchronized; owners guard it.
class BarState {
public:
    BarState(BarConfig config, common::TimePoint now);

    // Adds delta to the count. The count is never clamped to total and floors
    // at zero for corrective decrements. Positive deltas are fed to the rate
    // estimator; deltas arriving with no elapsed time are carried into the
    // next sample.
    void apply(int64_t delta, common::TimePoint now);

    void setSuffix(std::string suffix) { suffix_ = std::move(suffix); }
    const std::string& suffix() const { return suffix_; }

    // Count back to zero, timing restarted, rate forgotten.
    void reset(common::TimePoint now);

    // One animation tick: spinner frame and bounce position move forward.
    void advanceAnimation();

    format::BarView view(common::TimePoint now) const;

    uint64_t current() const { return current_; }
    const std::optional<uint64_t>& total() const { return config_.total; }
    double percentage() const;
    double rate() const { return smoother_.rate(); }
    std::optional<double> eta() const;
    const BarConfig& config() const { return config_; }
    common::TimePoint startedAt() const { return started_at_; }
    common::TimePoint lastUpdateAt() const { return last_update_at_; }

private:
    BarConfig config_;
    uint64_t current_ = 0;
    common::TimePoint started_at_;
    common::TimePoint last_update_at_;
    common::TimePoint last_sample_at_;
    double pending_delta_ = 0.0;
    RateSmoother smoother_;
    BounceCursor bounce_;
    size_t spinner_frame_ = 0;
    std::string suffix_;
};

}}
