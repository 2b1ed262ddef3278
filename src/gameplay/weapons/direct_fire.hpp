#pragma once

/**
 * @file direct_fire.hpp
 * @brief Weapons that only fire straight shells (no impact handler)
 */

#include "gameplay/weapons/weapon.hpp"

namespace salvo::gameplay {

/**
 * @brief BW01: one shell, one impact
 */
class BasicShotWeapon final : public Weapon {
public:
    static constexpr f32 DAMAGE = 20.0f;
    static constexpr f32 CRATER_SIZE = 30.0f;

    WeaponCode id() const override { return WeaponCode::BasicShot; }
    Result<void> fire(const FireRequest& request, sim::Timeline& timeline,
                      sim::SimulationContext& context) override;
};

/**
 * @brief N straight shells with random spread
 *
 * Shots leave together (VW01) or one every `shotInterval` ms (MS01). Only
 * the last shot is flagged final.
 */
class SalvoWeapon final : public Weapon {
public:
    struct Params {
        WeaponCode code;
        u32 shotCount;
        f32 spread;             ///< Max per-axis direction jitter
        TimeMs shotInterval;    ///< 0 for a simultaneous volley
        f32 damage;
        f32 craterSize;
    };

    static Params volley();
    static Params multiShot();

    explicit SalvoWeapon(const Params& params);

    WeaponCode id() const override { return m_params.code; }
    const Params& params() const { return m_params; }

    Result<void> fire(const FireRequest& request, sim::Timeline& timeline,
                      sim::SimulationContext& context) override;

private:
    Params m_params;
};

} // namespace salvo::gameplay
