#include "world/damage.hpp"
#include "ecs/components/combatant.hpp"

#include <algorithm>
#include <cmath>

namespace salvo::world {

f32 falloffDamage(f32 baseDamage, f32 distance, f32 aoeSize) {
    if (aoeSize <= 0.0f || distance > aoeSize || distance < 0.0f) {
        return 0.0f;
    }
    const f32 multiplier = 1.0f - 0.5f * (distance / aoeSize);
    return std::round(baseDamage * multiplier);
}

DamageDistribution distributeDamage(ecs::HealthComponent& pool, f32 amount) {
    DamageDistribution result;
    f32 remaining = std::max(0.0f, amount);

    if (pool.shield > 0.0f) {
        result.shieldDamage = std::min(pool.shield, remaining);
        pool.shield -= result.shieldDamage;
        remaining -= result.shieldDamage;
    }

    if (remaining > 0.0f) {
        if (pool.armor >= remaining / 2.0f) {
            result.armorDamage = remaining / 2.0f;
            result.healthDamage = remaining / 2.0f;
            pool.armor -= result.armorDamage;
        } else {
            result.armorDamage = pool.armor;
            result.healthDamage = remaining - pool.armor;
            pool.armor = 0.0f;
        }
        pool.health -= result.healthDamage;
    }

    result.remainingHealth = pool.health;
    result.destroyed = pool.isDead();
    return result;
}

} // namespace salvo::world
