#pragma once

/**
 * @file agent_roster.hpp
 * @brief Ground agents (tanks) and damage resolution
 */

#include "core/types.hpp"
#include "core/math/math.hpp"
#include "ecs/world/world.hpp"
#include "world/damage.hpp"

#include <optional>
#include <string>
#include <vector>

namespace salvo::world {

class HeightField;

struct AgentSnapshot {
    PlayerId id = INVALID_PLAYER_ID;
    Vec3 position{0.0f};
};

/**
 * @brief Damage resolution collaborator
 */
class DamageResolution {
public:
    virtual ~DamageResolution() = default;

    /// Agents that can still take damage
    virtual std::vector<AgentSnapshot> livingAgents() const = 0;

    /// Apply damage to one agent
    virtual Result<DamageDistribution> applyDamage(PlayerId id, f32 amount) = 0;

    /// Called after the terrain was deformed
    virtual void onTerrainChanged(const HeightField& heightField) { (void)heightField; }
};

/**
 * @brief Agents of one match stored in the ECS world
 */
class AgentRoster final : public DamageResolution {
public:
    explicit AgentRoster(ecs::World& world);

    Result<void> spawnAgent(PlayerId id, const std::string& name, Vec3 position,
                            f32 health = 100.0f, f32 armor = 0.0f, f32 shield = 0.0f);

    std::vector<AgentSnapshot> livingAgents() const override;
    Result<DamageDistribution> applyDamage(PlayerId id, f32 amount) override;

    /// Add armor or shield points (purchases)
    Result<void> addArmor(PlayerId id, f32 amount);
    Result<void> addShield(PlayerId id, f32 amount);

    /// Drop every agent onto the terrain surface
    void onTerrainChanged(const HeightField& heightField) override;

    std::optional<f32> healthOf(PlayerId id) const;
    std::optional<Vec3> positionOf(PlayerId id) const;
    size_t livingCount() const;

private:
    entt::entity find(PlayerId id) const;

    ecs::World& m_world;
};

} // namespace salvo::world
