#include "sim/timeline_scheduler.hpp"
#include "core/logging/logger.hpp"

namespace salvo::sim {

ScheduledPlayback::ScheduledPlayback(std::shared_ptr<const Timeline> timeline, SchedulerHost& host,
                                     EffectSink& sink, TimeMs fireMoment)
    : m_state(std::make_shared<State>())
    , m_host(host)
    , m_fireMoment(fireMoment) {
    m_state->timeline = std::move(timeline);
    m_state->sink = &sink;

    const auto& events = m_state->timeline->events();
    std::weak_ptr<State> weakState = m_state;

    for (size_t i = 0; i < events.size(); ++i) {
        const auto& event = events[i];
        if (!std::holds_alternative<ImpactEvent>(event) &&
            !std::holds_alternative<TargetDestroyedEvent>(event)) {
            continue;
        }

        const TimeMs delay = m_fireMoment + eventTime(event) - m_host.now();
        m_tokens.push_back(m_host.scheduleCallback(delay, [weakState, i]() {
            applyEvent(weakState, i);
        }));
    }

    LOG_DEBUG("Scheduled {} effects over {:.0f} ms", m_tokens.size(), m_state->timeline->maxTime());
}

ScheduledPlayback::~ScheduledPlayback() {
    cancel();
}

void ScheduledPlayback::cancel() {
    if (m_state->cancelled) {
        return;
    }
    m_state->cancelled = true;

    for (CancelToken token : m_tokens) {
        m_host.cancel(token);
    }
}

void ScheduledPlayback::applyEvent(const std::weak_ptr<State>& weakState, size_t index) {
    auto state = weakState.lock();
    if (!state || state->cancelled) {
        return;
    }

    const auto& event = state->timeline->events()[index];
    if (const auto* impact = std::get_if<ImpactEvent>(&event)) {
        state->sink->onImpact(*impact);
    } else if (const auto* destroyed = std::get_if<TargetDestroyedEvent>(&event)) {
        state->sink->onTargetDestroyed(*destroyed);
    }
    ++state->applied;
}

} // namespace salvo::sim
