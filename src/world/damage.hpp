#pragma once

/**
 * @file damage.hpp
 * @brief Area damage falloff and shield/armor distribution
 */

#include "core/types.hpp"

namespace salvo::ecs {
struct HealthComponent;
}

namespace salvo::world {

/**
 * @brief Area-of-effect damage at `distance` from the blast center
 *
 * round(baseDamage * (1 - 0.5 * distance / aoeSize)) inside the radius
 * (inclusive), 0 outside it or when aoeSize <= 0.
 */
f32 falloffDamage(f32 baseDamage, f32 distance, f32 aoeSize);

/**
 * @brief How one hit was split over shield, armor and health
 */
struct DamageDistribution {
    f32 shieldDamage = 0.0f;
    f32 armorDamage = 0.0f;
    f32 healthDamage = 0.0f;
    f32 remainingHealth = 0.0f;
    bool destroyed = false;
};

/**
 * @brief Split `amount` over a health pool and apply it
 *
 * Shields absorb first. If armor covers at least half of what is left,
 * armor and health each take half; otherwise the armor is used up and
 * health takes the rest.
 */
DamageDistribution distributeDamage(ecs::HealthComponent& pool, f32 amount);

} // namespace salvo::world
