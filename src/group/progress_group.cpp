#include "livebar/group/progress_group.hpp"
#include "livebar/common/config.hpp"
#include "livebar/common/error_codes.hpp"
#include "livebar/common/logger.hpp"
#include <algorithm>

namespace livebar {
namespace group {

GroupOptions GroupOptions::fromConfig() {
    GroupOptions options;
    options.thread_safe = common::Config::instance().global().bar.thread_safe;
    return options;
}

ProgressGroup::ProgressGroup(GroupOptions options, term::Environment env)
    : options_(options),
      coordinator_(std::make_shared<GroupCoordinator>(std::move(env), true)),
      guard_(options.thread_safe) {}

ProgressGroup::~ProgressGroup() {
    try {
        close();
    } catch (const common::BarError& e) {
        common::Logger::instance().error("[ProgressGroup] Final render failed | code={} | error={}",
                                         e.codeString(), e.what());
    }
}

std::shared_ptr<core::ProgressBar> ProgressGroup::addBar(const core::BarOptions& options) {
    auto lock = guard_.acquire();

    if (closed_) {
        common::ErrorContext ctx;
        ctx.component = "ProgressGroup";
        ctx.details["desc"] = options.desc;
        throw common::BarError(common::BarErrorCode::GROUP_CLOSED, ctx);
    }

    core::BarConfig config = core::BarConfig::resolve(options);
    if (options_.thread_safe) {
        config.thread_safe = true;
    }

    auto bar = std::make_shared<core::ProgressBar>(core::ProgressBar::GroupKey(), std::move(config),
                                                   coordinator_);
    bars_.push_back(bar);
    return bar;
}

bool ProgressGroup::removeBar(const std::shared_ptr<core::ProgressBar>& bar) {
    auto lock = guard_.acquire();

    auto it = std::find(bars_.begin(), bars_.end(), bar);
    if (it == bars_.end()) {
        return false;
    }
    bars_.erase(it);
    return coordinator_->detach(bar.get());
}

void ProgressGroup::refresh() {
    coordinator_->refreshAll();
}

void ProgressGroup::println(const std::string& text) {
    coordinator_->println(text);
}

void ProgressGroup::close() {
    std::vector<std::shared_ptr<core::ProgressBar>> bars;
    {
        auto lock = guard_.acquire();
        if (closed_) {
            return;
        }
        closed_ = true;
        bars = bars_;
    }

    coordinator_->finalize();
    for (auto& bar : bars) {
        bar->close();
    }

    common::Logger::instance().debug("[ProgressGroup] Closed | bars={}", bars.size());
}

size_t ProgressGroup::size() const {
    auto lock = guard_.acquire();
    return bars_.size();
}

bool ProgressGroup::isClosed() const {
    auto lock = guard_.acquire();
    return closed_;
}

}}
