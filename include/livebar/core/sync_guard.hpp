#pragma once

#include <mutex>

namespace livebar {
namespace core {

// Optional mutual exclusion. A disabled guard hands out empty locks, so
// callers write the same scoped code either way.
class SyncGuard {
public:
    explicit SyncGuard(bool enabled) : enabled_(enabled) {}

    SyncGuard(const SyncGuard&) = delete;
    SyncGuard& operator=(const SyncGuard&) = delete;

    std::unique_lock<std::mutex> acquire() const {
        if (!enabled_) {
            return std::unique_lock<std::mutex>();
        }
        return std::unique_lock<std::mutex>(mutex_);
    }

    bool enabled() const { return enabled_; }

private:
    bool enabled_;
    mutable std::mutex mutex_;
};

}}
