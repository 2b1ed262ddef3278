#pragma once

#include "core/types.hpp"
#include <entt/entt.hpp>
#include <string>

namespace salvo::ecs {

/**
 * @brief Agent component
 * 
 * A ground unit (tank) controlled by a player.
 */
struct AgentComponent {
    PlayerId playerId = INVALID_PLAYER_ID;
    std::string name;
    bool isAlive = true;
};

/**
 * @brief Health, armor and shield pool
 */
struct HealthComponent {
    f32 health = 100.0f;
    f32 maxHealth = 100.0f;
    f32 armor = 0.0f;
    f32 shield = 0.0f;
    
    /// Check if the owner is dead
    bool isDead() const { return health <= 0.0f; }
};

/**
 * @brief Dynamic target component (airborne unit)
 */
struct TargetComponent {
    TargetId targetId = INVALID_TARGET_ID;
    f32 health = 100.0f;
};

} // namespace salvo::ecs
