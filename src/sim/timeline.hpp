#pragma once

/**
 * @file timeline.hpp
 * @brief Time-stamped events describing the resolved outcome of one fire
 */

#include "core/types.hpp"
#include "core/math/math.hpp"
#include "sim/projectile_spec.hpp"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace salvo::sim {

// ============================================================================
// Events
// ============================================================================

struct SpawnEvent {
    TimeMs time = 0.0;
    ProjectileId projectileId = INVALID_PROJECTILE_ID;
    Vec3 position{0.0f};
    Vec3 direction{0.0f};
    f32 power = 0.0f;
    f32 craterSize = 0.0f;
    bool isFinalProjectile = false;
    bool doesCollide = true;
    std::string weaponCode;
    PlayerId owner = INVALID_PLAYER_ID;
    VisualStyle visual;
};

struct MoveEvent {
    TimeMs time = 0.0;
    ProjectileId projectileId = INVALID_PROJECTILE_ID;
    Vec3 position{0.0f};
    Vec3 velocity{0.0f};
};

enum class ImpactKind : u8 {
    Terrain,
    DynamicTarget
};

/// Damage one target takes from a mid-air impact
struct TargetHit {
    TargetId targetId = INVALID_TARGET_ID;
    f32 damage = 0.0f;
};

/**
 * @brief Terminal hit on the terrain or on a dynamic target
 */
struct ImpactEvent {
    TimeMs time = 0.0;
    ProjectileId projectileId = INVALID_PROJECTILE_ID;
    ImpactKind kind = ImpactKind::Terrain;
    TargetId targetId = INVALID_TARGET_ID;    ///< Only for DynamicTarget

    Vec3 position{0.0f};
    Vec3 velocity{0.0f};
    Vec3 normal{0.0f, 1.0f, 0.0f};

    f32 power = 0.0f;
    f32 gravity = 0.0f;
    f64 timeFactor = 1.0;
    f32 baseDamage = 0.0f;
    f32 craterSize = 0.0f;
    f32 aoeSize = 0.0f;
    u32 bounceCount = 0;
    bool isFinalProjectile = false;

    /// Per-target damage resolved at simulation time (DynamicTarget only)
    std::vector<TargetHit> targetHits;

    std::optional<WeaponInstanceId> weaponInstance;
    std::string weaponCode;
    PlayerId owner = INVALID_PLAYER_ID;
    VisualStyle visual;

    bool isTargetHit() const { return kind == ImpactKind::DynamicTarget; }
};

struct ExpiredEvent {
    TimeMs time = 0.0;
    ProjectileId projectileId = INVALID_PROJECTILE_ID;
    Vec3 position{0.0f};
};

struct TargetDestroyedEvent {
    TimeMs time = 0.0;
    ProjectileId projectileId = INVALID_PROJECTILE_ID;
    TargetId targetId = INVALID_TARGET_ID;
    Vec3 position{0.0f};
};

using TimelineEvent = std::variant<SpawnEvent, MoveEvent, ImpactEvent, ExpiredEvent, TargetDestroyedEvent>;

TimeMs eventTime(const TimelineEvent& event);
ProjectileId eventProjectile(const TimelineEvent& event);
const char* eventTypeName(const TimelineEvent& event);

// ============================================================================
// Timeline
// ============================================================================

/**
 * @brief Ordered event log of one fire
 *
 * Events are appended while the fire is simulated (handlers may append out
 * of time order). freeze() sorts them by time, keeping insertion order for
 * equal times, after which the timeline is read-only.
 */
class Timeline {
public:
    /// Append an event; ignored with an error log once frozen
    void append(TimelineEvent event);

    /// Append every event of another timeline (scratch simulations)
    void merge(const Timeline& other);

    /// Drop every event of `projectileId` later than `time`
    void truncateAfter(ProjectileId projectileId, TimeMs time);

    /// Sort by time and make read-only
    void freeze();
    bool isFrozen() const { return m_frozen; }

    const std::vector<TimelineEvent>& events() const { return m_events; }
    size_t size() const { return m_events.size(); }
    bool empty() const { return m_events.empty(); }

    /// Largest event time (0 when empty)
    TimeMs maxTime() const;

    /// Events of one projectile in stored order
    std::vector<TimelineEvent> eventsFor(ProjectileId projectileId) const;

    /// Number of Spawn events
    size_t projectileCount() const;

    /// Number of events holding alternative T
    template<typename T>
    size_t count() const {
        size_t n = 0;
        for (const auto& event : m_events) {
            if (std::holds_alternative<T>(event)) ++n;
        }
        return n;
    }

private:
    std::vector<TimelineEvent> m_events;
    bool m_frozen = false;
};

} // namespace salvo::sim
