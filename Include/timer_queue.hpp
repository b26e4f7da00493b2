#pragma once

#include <algorithm>
#include <cstdint>
#include <functional>
#include <map>
#include <utility>

using TimerId = std::uint64_t;

inline constexpr TimerId kInvalidTimer = 0;

// ============================================================
//  TimerQueue  –  one-shot deferred callbacks
// ============================================================

/**
 * Deferred callbacks on a clock that only moves when advance() is
 * called. Due timers fire in due-time order (ties in scheduling order);
 * a callback may schedule or cancel other timers, and a timer it
 * schedules fires within the same advance() if it is already due.
 */
class TimerQueue {
public:
    TimerId schedule(double delaySeconds, std::function<void()> callback) {
        const TimerId id = nextId_++;
        timers_.emplace(id, Entry{ now_ + std::max(delaySeconds, 0.0), std::move(callback) });
        return id;
    }

    /// Returns false when `id` already fired or was never scheduled.
    bool cancel(TimerId id) noexcept { return timers_.erase(id) > 0; }

    void advance(double dt) {
        now_ += std::max(dt, 0.0);

        for (;;) {
            auto due = timers_.end();
            for (auto it = timers_.begin(); it != timers_.end(); ++it)
                if (it->second.dueAt <= now_
                    && (due == timers_.end() || it->second.dueAt < due->second.dueAt))
                    due = it;

            if (due == timers_.end()) break;

            auto callback = std::move(due->second.callback);
            timers_.erase(due);
            if (callback) callback();
        }
    }

    void clear() noexcept { timers_.clear(); }

    // ── Accessors ────────────────────────────────────────────
    [[nodiscard]] double      now()     const noexcept { return now_; }
    [[nodiscard]] std::size_t pending() const noexcept { return timers_.size(); }
    [[nodiscard]] bool isPending(TimerId id) const noexcept { return timers_.contains(id); }

private:
    struct Entry {
        double                dueAt;
        std::function<void()> callback;
    };

    std::map<TimerId, Entry> timers_;     // id order == scheduling order
    TimerId                  nextId_{ 1 };
    double                   now_   { 0.0 };
};
