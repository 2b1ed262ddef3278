#pragma once

/**
 * @file target_registry.hpp
 * @brief Moving targets that projectiles can hit mid-air and home on
 */

#include "core/types.hpp"
#include "core/math/math.hpp"
#include "ecs/world/world.hpp"
#include "ecs/systems/system.hpp"

#include <optional>
#include <random>
#include <vector>

namespace salvo::world {

class HeightField;

/**
 * @brief Read-only view of one live target
 */
struct TargetSnapshot {
    TargetId id = INVALID_TARGET_ID;
    Vec3 position{0.0f};
    Vec3 velocity{0.0f};
    f32 boundingRadius = 0.0f;
    f32 health = 0.0f;
};

struct TargetDamageResult {
    bool destroyed = false;
    f32 remainingHealth = 0.0f;
};

/**
 * @brief Dynamic target collaborator
 */
class DynamicTargetRegistry {
public:
    virtual ~DynamicTargetRegistry() = default;

    /// All targets currently alive
    virtual std::vector<TargetSnapshot> liveTargets() const = 0;

    /// Subtract health; fails for unknown or already removed targets
    virtual Result<TargetDamageResult> applyDamage(TargetId id, f32 amount) = 0;

    /// Where a target is expected to be `timeFromNow` ms from now
    virtual std::optional<Vec3> predictedPositionAt(TargetId id, TimeMs timeFromNow) const = 0;

    /// Remove a target; returns false if it was already gone
    virtual bool remove(TargetId id) = 0;
};

/**
 * @brief Helicopter fleet stored in the match ECS world
 */
class TargetFleet final : public DynamicTargetRegistry {
public:
    static constexpr f32 DEFAULT_HEALTH = 100.0f;
    static constexpr f32 DEFAULT_BOUNDING_RADIUS = 100.0f;

    explicit TargetFleet(ecs::World& world);

    /// Spawn a target flying toward `waypoint`
    TargetId spawnTarget(Vec3 position, Vec3 waypoint,
                         f32 health = DEFAULT_HEALTH,
                         f32 boundingRadius = DEFAULT_BOUNDING_RADIUS);

    std::vector<TargetSnapshot> liveTargets() const override;
    Result<TargetDamageResult> applyDamage(TargetId id, f32 amount) override;
    std::optional<Vec3> predictedPositionAt(TargetId id, TimeMs timeFromNow) const override;
    bool remove(TargetId id) override;

    /// Number of live targets
    size_t count() const;

    /// Random waypoint inside the patrol box
    static Vec3 randomWaypoint(std::mt19937& rng);

private:
    entt::entity find(TargetId id) const;

    ecs::World& m_world;
    TargetId m_nextId = 1;
};

/**
 * @brief Flies every target toward its waypoint each tick
 *
 * Targets hold at least `minHeightAboveTerrain` over the height field and
 * pick a fresh random waypoint on arrival.
 */
class FlightSystem final : public ecs::System {
public:
    FlightSystem(const HeightField* heightField, u32 seed);

    void fixedUpdate(entt::registry& registry, f32 fixedDeltaTime) override;

private:
    const HeightField* m_heightField;
    std::mt19937 m_rng;
};

} // namespace salvo::world
