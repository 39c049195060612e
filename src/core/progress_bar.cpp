#include "livebar/core/progress_bar.hpp"
#include "livebar/common/error_codes.hpp"
#include "livebar/common/logger.hpp"
#include <spdlog/fmt/chrono.h>
#include <ctime>

namespace livebar {
namespace core {

ProgressBar::ProgressBar(const BarOptions& options, term::Environment env)
    : ProgressBar(BarConfig::resolve(options), nullptr) {
    coordinator_ = std::make_shared<group::GroupCoordinator>(std::move(env), state_.config().thread_safe);
    start();
}

ProgressBar::ProgressBar(GroupKey, BarConfig config, std::shared_ptr<group::GroupCoordinator> coordinator)
    : ProgressBar(std::move(config), std::move(coordinator)) {}

ProgressBar::ProgressBar(BarConfig config, std::shared_ptr<group::GroupCoordinator> coordinator)
    : coordinator_(std::move(coordinator)),
      grouped_(coordinator_ != nullptr),
      guard_(config.thread_safe),
      state_(config, coordinator_ ? coordinator_->now() : common::SteadyClock::now()),
      renderer_(config.max_suffix_lines) {
    throttle_.min_redraw_interval = config.min_redraw_interval;
    throttle_.log_interval = config.log_interval;
    if (grouped_) {
        start();
    }
}

ProgressBar::~ProgressBar() {
    try {
        close();
        if (grouped_) {
            coordinator_->detach(this);
        }
    } catch (const common::BarError& e) {
        common::Logger::instance().error("[ProgressBar] Final render failed | desc={} | code={} | error={}",
                                         state_.config().desc, e.codeString(), e.what());
    }
}

void ProgressBar::start() {
    {
        auto lock = guard_.acquire();
        state_.reset(coordinator_->now());
    }
    coordinator_->attach(this);
}

void ProgressBar::update(int64_t n) {
    {
        auto lock = guard_.acquire();
        state_.apply(n, coordinator_->now());
    }
    if (closed_.load()) {
        return;
    }
    coordinator_->redraw(this, common::RedrawReason::UPDATE);
}

void ProgressBar::setSuffix(const std::string& suffix) {
    {
        auto lock = guard_.acquire();
        state_.setSuffix(suffix);
    }
    if (closed_.load()) {
        return;
    }
    coordinator_->redraw(this, common::RedrawReason::SUFFIX);
}

void ProgressBar::reset() {
    {
        auto lock = guard_.acquire();
        state_.reset(coordinator_->now());
    }
    if (closed_.load()) {
        return;
    }
    coordinator_->redraw(this, common::RedrawReason::REFRESH);
}

void ProgressBar::println(const std::string& text) {
    coordinator_->println(text);
}

void ProgressBar::close() {
    if (closed_.exchange(true)) {
        return;
    }
    if (grouped_) {
        coordinator_->finalizeRow(this);
    } else {
        coordinator_->finalize();
    }
    common::Logger::instance().debug("[ProgressBar] Closed | desc={} | current={}",
                                     state_.config().desc, current());
}

uint64_t ProgressBar::current() const {
    auto lock = guard_.acquire();
    return state_.current();
}

std::optional<uint64_t> ProgressBar::total() const {
    return state_.total();
}

double ProgressBar::percentage() const {
    auto lock = guard_.acquire();
    return state_.percentage();
}

double ProgressBar::rate() const {
    auto lock = guard_.acquire();
    return state_.rate();
}

std::optional<double> ProgressBar::eta() const {
    auto lock = guard_.acquire();
    return state_.eta();
}

std::string ProgressBar::suffix() const {
    auto lock = guard_.acquire();
    return state_.suffix();
}

format::RenderFrame ProgressBar::renderFrame(common::TimePoint now, int columns,
                                             common::FramePhase phase) {
    format::BarView view;
    {
        auto lock = guard_.acquire();
        view = state_.view(now);
        if (phase == common::FramePhase::LIVE_TICK) {
            state_.advanceAnimation();
        }
    }
    return renderer_.render(view, columns, phase);
}

std::string ProgressBar::renderStatus(common::TimePoint now, bool final) {
    format::BarView view;
    {
        auto lock = guard_.acquire();
        view = state_.view(now);
    }
    std::string stamp = state_.config().log_timestamp ? timestamp() : std::string();
    return renderer_.statusLine(view, final, stamp);
}

std::string ProgressBar::timestamp() const {
    std::time_t seconds = std::chrono::system_clock::to_time_t(coordinator_->environment().wall_clock());
    return fmt::format("{:%Y-%m-%d %H:%M:%S}", fmt::localtime(seconds));
}

}}
