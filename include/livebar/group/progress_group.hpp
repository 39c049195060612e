#pragma once

#include "group_coordinator.hpp"
#include "livebar/core/bar_options.hpp"
#include "livebar/core/progress_bar.hpp"
#include "livebar/core/sync_guard.hpp"
#include <memory>
#include <vector>

namespace livebar {
namespace group {

struct GroupOptions {
    // Makes every bar added to the group lock its own state and guards the
    // group's bar list. Writes to the shared block are always serialized.
    bool thread_safe = false;

    static GroupOptions fromConfig();
};

// Several bars drawn as one block. The group finalizes the block exactly
// once, on close() or destruction; bars outliving the group go silent.
class ProgressGroup {
public:
    explicit ProgressGroup(GroupOptions options = GroupOptions(),
                           term::Environment env = term::Environment::standard());
    ~ProgressGroup();

    ProgressGroup(const ProgressGroup&) = delete;
    ProgressGroup& operator=(const ProgressGroup&) = delete;

    // Throws BarError on invalid options or when the group is closed.
    std::shared_ptr<core::ProgressBar> addBar(const core::BarOptions& options);
    bool removeBar(const std::shared_ptr<core::ProgressBar>& bar);

    void refresh();
    void println(const std::string& text);
    void close();

    size_t size() const;
    bool isClosed() const;
    common::DisplayMode mode() const { return coordinator_->mode(); }
    const GroupCoordinator& coordinator() const { return *coordinator_; }

private:
    GroupOptions options_;
    std::shared_ptr<GroupCoordinator> coordinator_;
    core::SyncGuard guard_;
    std::vector<std::shared_ptr<core::ProgressBar>> bars_;
    bool closed_ = false;
};

}}
