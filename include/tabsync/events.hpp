#pragma once

#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>
#include <vector>

namespace tabsync {

// Progress notifications from the sync engine to whoever renders them.
enum class SyncEventKind {
    PlanProgress,         // completed/total manifest paths inspected
    PlanComputed,         // total = manifest size, count = tasks planned, completed = skipped
    TransferCycleStarted, // cycle = 1-based transfer cycle, count = tasks handed over
    ValidationStarted,    // cycle (0 = pre-download check), total = files to validate
    ValidationProgress,   // completed/total files validated in this pass
    CycleFinished         // cycle, exitCode, failed = files that failed verification
};

struct SyncEvent {
    SyncEventKind kind{SyncEventKind::PlanProgress};
    int cycle{0};
    size_t completed{0};
    size_t total{0};
    size_t count{0};
    size_t failed{0};
    int exitCode{0};
};

// Receives events. ValidationProgress is delivered from verifier worker threads,
// so implementations must be safe to call concurrently.
class SyncObserver {
public:
    virtual ~SyncObserver() = default;
    virtual void onEvent(const SyncEvent& ev) = 0;
};

// Null-safe dispatch helper.
inline void notify(SyncObserver* observer, const SyncEvent& ev) {
    if (observer) observer->onEvent(ev);
}

// Observer that buffers events for a consumer on another thread.
class SyncEventQueue : public SyncObserver {
public:
    void onEvent(const SyncEvent& ev) override { push(ev); }

    void push(const SyncEvent& ev) {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.push(ev);
    }

    std::optional<SyncEvent> pop() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.empty()) return std::nullopt;
        SyncEvent ev = queue_.front();
        queue_.pop();
        return ev;
    }

    std::vector<SyncEvent> drain() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<SyncEvent> out;
        out.reserve(queue_.size());
        while (!queue_.empty()) {
            out.push_back(queue_.front());
            queue_.pop();
        }
        return out;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::queue<SyncEvent> empty;
        std::swap(queue_, empty);
    }

private:
    std::mutex mutex_;
    std::queue<SyncEvent> queue_;
};

} // namespace tabsync
