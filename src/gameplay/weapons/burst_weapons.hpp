#pragma once

/**
 * @file burst_weapons.hpp
 * @brief Weapons that spray children around their impact point
 */

#include "gameplay/weapons/weapon.hpp"

#include <array>

namespace salvo::gameplay {

/**
 * @brief JB01 / PC01: chains of short hops near the previous impact
 *
 * Every impact spawns `childrenPerImpact` hops landing a small random
 * distance away, each one smaller, weaker and faster on the timeline than
 * the last, until `maxBounces` is reached.
 */
class PepperBurstWeapon final : public Weapon {
public:
    struct Params {
        WeaponCode code;
        u32 childrenPerImpact;
        u32 maxBounces;
        f32 bounceRadius;       ///< Mean hop distance
        f32 radiusJitter;       ///< Random hop distance range
        f32 aimJitter;          ///< Random aim point range
        f64 baseTimeFactor;
        f64 timeFactorDecay;    ///< Time factor divided by this per bounce
        f64 minTimeFactor;
        f32 baseScale;
        f32 scaleDecay;
        f32 minScale;
        f32 baseDamage;
        f32 damageDecay;
        f32 minDamage;
        f32 craterSize;
        f32 hopPower;
        f32 verticalBias;
        f32 hopGravity;
        const char* hopStyle;
    };

    static Params jumpingBean();
    static Params popcorn();

    explicit PepperBurstWeapon(const Params& params);

    WeaponCode id() const override { return m_params.code; }
    const Params& params() const { return m_params; }

    Result<void> fire(const FireRequest& request, sim::Timeline& timeline,
                      sim::SimulationContext& context) override;

    /// Hop spawned by an impact at bounce `currentBounce`
    static sim::ProjectileSpec hopChild(const Params& params, const sim::ImpactEvent& impact,
                                        sim::SimulationContext& context);

private:
    Params m_params;
};

/**
 * @brief MM01: a fountain of near-vertical shells from the impact
 *
 * One generation only: children carry no handler link.
 */
class MountainMercWeapon final : public Weapon {
public:
    static constexpr u32 CHILD_COUNT = 7;
    static constexpr f32 TILT_SPREAD = 0.25f;
    static constexpr f32 CHILD_POWER_FACTOR = 0.9f;
    static constexpr f32 CRATER_SIZE = 80.0f;
    static constexpr f32 DAMAGE = 50.0f;

    WeaponCode id() const override { return WeaponCode::MountainMerc; }
    Result<void> fire(const FireRequest& request, sim::Timeline& timeline,
                      sim::SimulationContext& context) override;
};

/**
 * @brief SW01: a ring of shells at four powers around the impact
 *
 * Ring positions fire one after another, every second position first, so
 * the ring fills in two interleaved passes.
 */
class SprinklerWeapon final : public Weapon {
public:
    static constexpr u32 RING_STEPS = 12;
    static constexpr std::array<f32, 4> POWERS = {5.0f, 10.0f, 15.0f, 20.0f};
    static constexpr TimeMs STEP_DELAY = 600.0;
    static constexpr f32 VERTICAL_ANGLE = math::PI / 3.0f;
    static constexpr f32 CHILD_GRAVITY = -30.0f;
    static constexpr f32 DAMAGE = 30.0f;
    static constexpr f32 AOE_SIZE = 5.0f;
    static constexpr f32 CRATER_SIZE = 15.0f;

    WeaponCode id() const override { return WeaponCode::Sprinkler; }
    Result<void> fire(const FireRequest& request, sim::Timeline& timeline,
                      sim::SimulationContext& context) override;

    /// Ring positions in firing order
    static std::array<u32, RING_STEPS> firingOrder();
};

} // namespace salvo::gameplay
