#pragma once

/**
 * @file bounce_weapons.hpp
 * @brief Weapons that continue by reflecting off the terrain
 */

#include "gameplay/weapons/weapon.hpp"

namespace salvo::gameplay {

/**
 * @brief BB01: one reflected child per impact, up to MAX_BOUNCES times
 *
 * Each bounce reflects the incoming velocity about the surface normal,
 * loses energy, gains a growing upward bias and a shrinking random
 * sideways spread. The child of the last bounce is final.
 */
class BouncingBettyWeapon final : public Weapon {
public:
    static constexpr u32 MAX_BOUNCES = 4;
    static constexpr f32 SPREAD = 0.4f;
    static constexpr f32 POWER_RETENTION = 0.8f;
    static constexpr f32 UPWARD_BIAS = 0.5f;
    static constexpr f32 CRATER_SIZE = 50.0f;

    WeaponCode id() const override { return WeaponCode::BouncingBetty; }
    Result<void> fire(const FireRequest& request, sim::Timeline& timeline,
                      sim::SimulationContext& context) override;

    /// Child spec for the bounce after `impact`
    static sim::ProjectileSpec bounceChild(const sim::ImpactEvent& impact, sim::SimulationContext& context);
};

/**
 * @brief BR01: every bounce splits into three reflected children
 *
 * A per-fire counter caps the total number of projectiles at
 * MAX_TOTAL_PROJECTILES. Children are forced final (and lose their handler
 * link) once another split would not fit under the cap.
 */
class BouncingRabbitWeapon final : public Weapon {
public:
    static constexpr u32 MAX_BOUNCES = 4;
    static constexpr u32 SPLIT_COUNT = 3;
    static constexpr u32 MAX_TOTAL_PROJECTILES = 27;
    static constexpr f32 BOUNCINESS = 0.85f;
    static constexpr f32 POWER_RETENTION = 0.8f;
    static constexpr f32 UPWARD_BIAS = 0.4f;
    static constexpr f32 MIN_VERTICAL = 0.5f;
    static constexpr f32 SPREAD_VARIANCE = 0.6f;
    static constexpr f64 CHILD_TIME_FACTOR = 0.8;

    WeaponCode id() const override { return WeaponCode::BouncingRabbit; }
    Result<void> fire(const FireRequest& request, sim::Timeline& timeline,
                      sim::SimulationContext& context) override;

    /// Reflected direction for one split child (`offset` is -1..1 sideways)
    static Vec3 splitDirection(const sim::ImpactEvent& impact, u32 bounce, f32 offset,
                               sim::SimulationContext& context);

    /// Set the produced-projectile cap (tests)
    void setCeiling(u32 ceiling) { m_ceiling = ceiling; }

private:
    u32 m_ceiling = MAX_TOTAL_PROJECTILES;
};

} // namespace salvo::gameplay
