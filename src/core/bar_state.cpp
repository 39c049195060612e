#include "livebar/core/bar_state.hpp"
#include "livebar/format/glyphs.hpp"
#include <algorithm>

namespace livebar {
namespace core {

BarState::BarState(BarConfig config, common::TimePoint now)
    : config_(std::move(config)),
      started_at_(now),
      last_update_at_(now),
      last_sample_at_(now),
      smoother_(config_.smoothing),
      bounce_(format::bouncePositions(config_.width)) {}

void BarState::apply(int64_t delta, common::TimePoint now) {
    if (delta >= 0) {
        current_ += static_cast<uint64_t>(delta);
    } else {
        auto decrement = static_cast<uint64_t>(-(delta + 1)) + 1;
        current_ = decrement > current_ ? 0 : current_ - decrement;
    }
    last_update_at_ = now;

    if (delta <= 0) {
        return;
    }

    pending_delta_ += static_cast<double>(delta);
    double elapsed = common::toSeconds(now - last_sample_at_);
    if (elapsed < 0.0) {
        last_sample_at_ = now;
        return;
    }
    if (smoother_.addSample(elapsed, pending_delta_)) {
        pending_delta_ = 0.0;
        last_sample_at_ = now;
    }
}

void BarState::reset(common::TimePoint now) {
    current_ = 0;
    started_at_ = now;
    last_update_at_ = now;
    last_sample_at_ = now;
    pending_delta_ = 0.0;
    smoother_.reset();
    bounce_.reset();
    spinner_frame_ = 0;
}

void BarState::advanceAnimation() {
    ++spinner_frame_;
    bounce_.tick();
}

double BarState::percentage() const {
    if (!config_.total) {
        return 0.0;
    }
    uint64_t shown = std::min(current_, *config_.total);
    return static_cast<double>(shown) / static_cast<double>(*config_.total) * 100.0;
}

std::optional<double> BarState::eta() const {
    if (!config_.total || current_ >= *config_.total) {
        return std::nullopt;
    }
    return smoother_.eta(static_cast<double>(*config_.total - current_));
}

format::BarView BarState::view(common::TimePoint now) const {
    format::BarView view;
    view.desc = config_.desc;
    view.style = config_.style;
    view.color = config_.color;
    view.width = config_.width;
    view.unit = config_.unit;
    view.unit_scale = config_.unit_scale;

    view.current = current_;
    view.total = config_.total;
    view.elapsed_seconds = std::max(0.0, common::toSeconds(now - started_at_));
    if (smoother_.hasRate()) {
        view.rate = smoother_.rate();
    }
    view.eta_seconds = eta();

    view.suffix = suffix_;
    view.spinner_frame = spinner_frame_;
    view.bounce_position = bounce_.position();
    return view;
}

}}
