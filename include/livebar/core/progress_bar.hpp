#pragma once

#include "bar_options.hpp"
#include "bar_state.hpp"
#include "sync_guard.hpp"
#include "livebar/format/frame_renderer.hpp"
#include "livebar/group/group_coordinator.hpp"
#include "livebar/term/output_sink.hpp"
#include "livebar/term/tty_gate.hpp"
#include <atomic>
#include <memory>
#include <optional>
#include <string>

namespace livebar {
namespace group {
class ProgressGroup;
}

namespace core {

// A live progress bar. Construction validates the options (throwing
// BarError on bad input) and draws the first frame; destruction, or an
// explicit close(), draws the final frame and leaves the cursor on a fresh
// line. Bars created by a ProgressGroup share the group's rendered block.
class ProgressBar final : public group::Renderable {
public:
    // Only a ProgressGroup can mint one; it unlocks the grouped constructor.
    class GroupKey {
        friend class group::ProgressGroup;
        explicit GroupKey() = default;
    };

    explicit ProgressBar(const BarOptions& options = BarOptions(),
                         term::Environment env = term::Environment::standard());
    ProgressBar(GroupKey key, BarConfig config, std::shared_ptr<group::GroupCoordinator> coordinator);
    ~ProgressBar() override;

    ProgressBar(const ProgressBar&) = delete;
    ProgressBar& operator=(const ProgressBar&) = delete;

    void update(int64_t n = 1);
    void setSuffix(const std::string& suffix);
    void reset();
    void println(const std::string& text);
    void close();

    uint64_t current() const;
    std::optional<uint64_t> total() const;
    double percentage() const;
    double rate() const;
    std::optional<double> eta() const;
    std::string suffix() const;
    bool isClosed() const { return closed_.load(); }
    common::DisplayMode mode() const { return coordinator_->mode(); }

    format::RenderFrame renderFrame(common::TimePoint now, int columns,
                                    common::FramePhase phase) override;
    std::string renderStatus(common::TimePoint now, bool final) override;
    term::RowThrottle& throttle() override { return throttle_; }

private:
    ProgressBar(BarConfig config, std::shared_ptr<group::GroupCoordinator> coordinator);

    std::shared_ptr<group::GroupCoordinator> coordinator_;
    bool grouped_;
    SyncGuard guard_;
    BarState state_;
    format::FrameRenderer renderer_;
    term::RowThrottle throttle_;
    std::atomic<bool> closed_{false};

    void start();
    std::string timestamp() const;
};

}}
