#include "sim/timeline.hpp"
#include "core/logging/logger.hpp"

#include <algorithm>

namespace salvo::sim {

TimeMs eventTime(const TimelineEvent& event) {
    return std::visit([](const auto& e) { return e.time; }, event);
}

ProjectileId eventProjectile(const TimelineEvent& event) {
    return std::visit([](const auto& e) { return e.projectileId; }, event);
}

const char* eventTypeName(const TimelineEvent& event) {
    struct Namer {
        const char* operator()(const SpawnEvent&) const { return "projectileSpawn"; }
        const char* operator()(const MoveEvent&) const { return "projectileMove"; }
        const char* operator()(const ImpactEvent&) const { return "projectileImpact"; }
        const char* operator()(const ExpiredEvent&) const { return "projectileExpired"; }
        const char* operator()(const TargetDestroyedEvent&) const { return "targetDestroyed"; }
    };
    return std::visit(Namer{}, event);
}

void Timeline::append(TimelineEvent event) {
    if (m_frozen) {
        LOG_ERROR("Dropping {} event for projectile {}: timeline is frozen",
                  eventTypeName(event), eventProjectile(event));
        return;
    }
    m_events.push_back(std::move(event));
}

void Timeline::merge(const Timeline& other) {
    for (const auto& event : other.m_events) {
        append(event);
    }
}

void Timeline::truncateAfter(ProjectileId projectileId, TimeMs time) {
    if (m_frozen) {
        LOG_ERROR("Cannot truncate projectile {}: timeline is frozen", projectileId);
        return;
    }
    std::erase_if(m_events, [&](const TimelineEvent& event) {
        return eventProjectile(event) == projectileId && eventTime(event) > time;
    });
}

void Timeline::freeze() {
    if (m_frozen) return;
    std::stable_sort(m_events.begin(), m_events.end(),
                     [](const TimelineEvent& a, const TimelineEvent& b) {
                         return eventTime(a) < eventTime(b);
                     });
    m_frozen = true;
}

TimeMs Timeline::maxTime() const {
    TimeMs result = 0.0;
    for (const auto& event : m_events) {
        result = std::max(result, eventTime(event));
    }
    return result;
}

std::vector<TimelineEvent> Timeline::eventsFor(ProjectileId projectileId) const {
    std::vector<TimelineEvent> result;
    for (const auto& event : m_events) {
        if (eventProjectile(event) == projectileId) {
            result.push_back(event);
        }
    }
    return result;
}

size_t Timeline::projectileCount() const {
    return count<SpawnEvent>();
}

} // namespace salvo::sim
