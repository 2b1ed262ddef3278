#pragma once

/**
 * @file timer_queue.hpp
 * @brief Deferred callbacks on a match clock
 */

#include "core/types.hpp"

#include <functional>
#include <map>
#include <unordered_map>
#include <utility>

namespace salvo::sim {

using CancelToken = u64;
constexpr CancelToken INVALID_CANCEL_TOKEN = 0;

/**
 * @brief Timer host collaborator
 */
class SchedulerHost {
public:
    virtual ~SchedulerHost() = default;

    /// Run `callback` once, `delayMs` from now (negative delays run on the next advance)
    virtual CancelToken scheduleCallback(TimeMs delayMs, std::function<void()> callback) = 0;

    /// Cancel a pending callback; false if it already ran or was cancelled
    virtual bool cancel(CancelToken token) = 0;

    /// Current host time in ms
    virtual TimeMs now() const = 0;
};

/**
 * @brief Manually advanced timer queue
 *
 * Callbacks run in due-time order, ties in scheduling order. The server tick
 * loop advances one queue per match; tests advance it directly.
 */
class TimerQueue final : public SchedulerHost {
public:
    CancelToken scheduleCallback(TimeMs delayMs, std::function<void()> callback) override;
    bool cancel(CancelToken token) override;
    TimeMs now() const override { return m_now; }

    /**
     * @brief Move the clock forward, running every callback that comes due
     *
     * Callbacks scheduled while advancing run in the same call if they come
     * due before the new time.
     */
    void advance(TimeMs deltaMs);

    /// Number of callbacks still pending
    size_t pending() const { return m_timers.size(); }

    /// Drop every pending callback without running it
    void clear();

private:
    using Key = std::pair<TimeMs, CancelToken>;

    std::map<Key, std::function<void()>> m_timers;
    std::unordered_map<CancelToken, TimeMs> m_dueTimes;
    CancelToken m_nextToken = 1;
    TimeMs m_now = 0.0;
};

} // namespace salvo::sim
