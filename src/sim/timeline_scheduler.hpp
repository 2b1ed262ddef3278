#pragma once

/**
 * @file timeline_scheduler.hpp
 * @brief Real-time playback of a frozen timeline's gameplay effects
 */

#include "sim/timeline.hpp"
#include "sim/timer_queue.hpp"

#include <memory>
#include <vector>

namespace salvo::sim {

/**
 * @brief Receiver of authoritative side effects during playback
 */
class EffectSink {
public:
    virtual ~EffectSink() = default;

    virtual void onImpact(const ImpactEvent& impact) = 0;
    virtual void onTargetDestroyed(const TargetDestroyedEvent& event) = 0;
};

/**
 * @brief A timeline bound to a fire instant and its pending timers
 *
 * Only Impact and TargetDestroyed events are scheduled; Spawn, Move and
 * Expired exist for client animation. Each effect is applied at
 * `fireMoment + event.time`, equal times in timeline order. cancel() drops
 * every pending effect and may be called any number of times. Destroying the
 * playback cancels it. The host must outlive the playback.
 */
class ScheduledPlayback {
public:
    ScheduledPlayback(std::shared_ptr<const Timeline> timeline, SchedulerHost& host,
                      EffectSink& sink, TimeMs fireMoment);
    ~ScheduledPlayback();

    ScheduledPlayback(const ScheduledPlayback&) = delete;
    ScheduledPlayback& operator=(const ScheduledPlayback&) = delete;

    /// Cancel every pending effect
    void cancel();

    bool isCancelled() const { return m_state->cancelled; }

    /// True once every scheduled effect has been applied
    bool isComplete() const { return m_state->applied == m_tokens.size(); }

    size_t scheduledEffects() const { return m_tokens.size(); }
    size_t appliedEffects() const { return m_state->applied; }

    const Timeline& timeline() const { return *m_state->timeline; }
    TimeMs fireMoment() const { return m_fireMoment; }

private:
    struct State {
        std::shared_ptr<const Timeline> timeline;
        EffectSink* sink = nullptr;
        size_t applied = 0;
        bool cancelled = false;
    };

    static void applyEvent(const std::weak_ptr<State>& weakState, size_t index);

    std::shared_ptr<State> m_state;
    SchedulerHost& m_host;
    std::vector<CancelToken> m_tokens;
    TimeMs m_fireMoment;
};

} // namespace salvo::sim
