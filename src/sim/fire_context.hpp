#pragma once

/**
 * @file fire_context.hpp
 * @brief Per-fire simulation state and weapon handler registry
 */

#include "core/types.hpp"
#include "core/math/math.hpp"
#include "sim/simulation_config.hpp"
#include "sim/projectile_spec.hpp"
#include "sim/timeline.hpp"
#include "world/target_registry.hpp"

#include <functional>
#include <optional>
#include <random>
#include <unordered_map>
#include <vector>

namespace salvo::world {
class HeightField;
}

namespace salvo::sim {

class SimulationContext;

/// Impact callback; may simulate sub-projectiles into the timeline
using WeaponHandler = std::function<void(const ImpactEvent&, Timeline&, SimulationContext&)>;

/**
 * @brief Terminal result of one simulated projectile
 */
struct ProjectileOutcome {
    ProjectileId id = INVALID_PROJECTILE_ID;
    TimeMs endTime = 0.0;
    std::optional<ImpactEvent> impact;  ///< Empty when the projectile expired
};

/**
 * @brief State owned by one fire while its timeline is being built
 *
 * Holds the handler map keyed by weapon instance, projectile id and produced
 * counters, the fire's RNG, and a health ledger of the dynamic targets so
 * destruction can be predicted before playback. Destroyed together with the
 * fire once the timeline is frozen; handlers never outlive their fire.
 */
class SimulationContext {
public:
    SimulationContext(const SimulationConfig& config,
                      const world::HeightField* heightField,
                      const world::DynamicTargetRegistry* targets,
                      u32 seed);

    SimulationContext(const SimulationContext&) = delete;
    SimulationContext& operator=(const SimulationContext&) = delete;

    // ========================================================================
    // Handlers
    // ========================================================================

    /// Register an impact handler under a fresh weapon instance id
    WeaponInstanceId registerHandler(WeaponHandler handler);

    /// Handler for a weapon instance (nullptr if none)
    const WeaponHandler* findHandler(WeaponInstanceId id) const;

    // ========================================================================
    // Simulation
    // ========================================================================

    /// Simulate one projectile starting at `startTime` into `timeline`
    Result<ProjectileOutcome> simulate(const ProjectileSpec& spec, TimeMs startTime, Timeline& timeline);

    /**
     * @brief Simulate a child spawned by a handler
     *
     * The start time is clamped to >= 0. Invalid specs and spawns past the
     * recursion limit are logged and skipped.
     */
    std::optional<ProjectileOutcome> spawnChild(const ProjectileSpec& spec, TimeMs startTime, Timeline& timeline);

    ProjectileId nextProjectileId() { return m_nextProjectileId++; }

    /// Projectiles simulated so far in this fire
    u32 producedCount() const { return m_produced; }

    u32 depth() const { return m_depth; }

    // ========================================================================
    // Randomness
    // ========================================================================

    /// Uniform in [0, 1)
    f32 random();

    /// Uniform in [-0.5, 0.5)
    f32 randomCentered() { return random() - 0.5f; }

    // ========================================================================
    // World Queries
    // ========================================================================

    const SimulationConfig& config() const { return m_config; }
    const world::HeightField* heightField() const { return m_heightField; }

    /// Targets still alive according to the fire's ledger
    std::vector<world::TargetSnapshot> liveTargets() const;

    /// Live targets placed at their predicted positions `timeMs` after the fire
    std::vector<world::TargetSnapshot> liveTargetsAt(TimeMs timeMs) const;

    /// Predicted target position `timeMs` from the fire instant
    std::optional<Vec3> predictedTargetPosition(TargetId id, TimeMs timeMs) const;

    /**
     * @brief Record damage against the ledger
     * @return true if this damage destroys the target
     */
    bool recordTargetDamage(TargetId id, f32 amount);

private:
    friend class DepthGuard;

    SimulationConfig m_config;
    const world::HeightField* m_heightField;
    const world::DynamicTargetRegistry* m_targets;

    std::unordered_map<WeaponInstanceId, WeaponHandler> m_handlers;
    WeaponInstanceId m_nextInstanceId = 1;

    ProjectileId m_nextProjectileId = 1;
    u32 m_produced = 0;
    u32 m_depth = 0;

    std::mt19937 m_rng;
    std::uniform_real_distribution<f32> m_unit{0.0f, 1.0f};

    std::vector<world::TargetSnapshot> m_ledger;
};

} // namespace salvo::sim
