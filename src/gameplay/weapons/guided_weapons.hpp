#pragma once

/**
 * @file guided_weapons.hpp
 * @brief Missiles that home on dynamic targets
 */

#include "gameplay/weapons/weapon.hpp"

#include <vector>

namespace salvo::gameplay {

/// Half extent of the world-space engagement box on X and Z, centered on the map origin
constexpr f32 ENGAGEMENT_HALF_EXTENT = 1200.0f;

/// Targets predicted inside the engagement box `lookaheadMs` after launch
std::vector<world::TargetSnapshot> eligibleTargets(const sim::SimulationContext& context, TimeMs lookaheadMs);

/**
 * @brief GW01: one missile homing on a random eligible target
 *
 * Falls back to a single unguided final shot when no target is eligible.
 */
class GuidedWeapon final : public Weapon {
public:
    static constexpr TimeMs ENGAGEMENT_LOOKAHEAD = 8000.0;
    static constexpr f32 POWER_FACTOR = 0.8f;
    static constexpr f32 DAMAGE = 40.0f;
    static constexpr f32 UNGUIDED_DAMAGE = 30.0f;
    static constexpr f32 CRATER_SIZE = 25.0f;
    static constexpr f32 MAX_TURN_RATE = 0.01f;
    static constexpr TimeMs GUIDANCE_DELAY = 2000.0;
    static constexpr f32 ACCELERATION = 350.0f;

    WeaponCode id() const override { return WeaponCode::Guided; }
    Result<void> fire(const FireRequest& request, sim::Timeline& timeline,
                      sim::SimulationContext& context) override;
};

/**
 * @brief MGW01: one missile per eligible target
 *
 * Guidance engages in a staggered order; the last missile is final. Falls
 * back to a single unguided shot when no target is eligible.
 */
class MultiGuidedWeapon final : public Weapon {
public:
    static constexpr TimeMs ENGAGEMENT_LOOKAHEAD = 6000.0;
    static constexpr f32 POWER_FACTOR = 0.8f;
    static constexpr f32 DAMAGE = 35.0f;
    static constexpr f32 UNGUIDED_DAMAGE = 30.0f;
    static constexpr f32 CRATER_SIZE = 20.0f;
    static constexpr f32 MAX_TURN_RATE = 0.05f;
    static constexpr TimeMs GUIDANCE_DELAY = 2000.0;
    static constexpr TimeMs GUIDANCE_STAGGER = 300.0;
    static constexpr f32 ACCELERATION = 330.0f;
    static constexpr f32 SPREAD = 0.2f;

    WeaponCode id() const override { return WeaponCode::MultiGuided; }
    Result<void> fire(const FireRequest& request, sim::Timeline& timeline,
                      sim::SimulationContext& context) override;
};

} // namespace salvo::gameplay
