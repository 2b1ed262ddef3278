#pragma once

/**
 * @file carrier_weapons.hpp
 * @brief Weapons whose carrier flight is simulated first and then cut up
 */

#include "gameplay/weapons/weapon.hpp"

namespace salvo::gameplay {

/**
 * @brief RF01: a slow carrier that drops bomblets on a fixed cadence
 *
 * The carrier flies with low gravity and does not collide. After
 * INITIAL_DELAY one bomblet drops from the carrier's position every
 * DROP_INTERVAL ms until BOMB_COUNT are out or the carrier reaches the
 * ground. A carrier still flying after the last bomblet self-destructs.
 */
class AirstrikeWeapon final : public Weapon {
public:
    static constexpr u32 BOMB_COUNT = 40;
    static constexpr TimeMs DROP_INTERVAL = 100.0;
    static constexpr TimeMs INITIAL_DELAY = 1000.0;
    static constexpr f32 DROP_SPREAD = math::PI / 3.0f;
    static constexpr f32 CARRIER_GRAVITY = -100.0f;
    static constexpr f32 BOMB_POWER = 100.0f;
    static constexpr f32 BOMB_CRATER_SIZE = 75.0f;
    static constexpr f32 BOMB_AOE_SIZE = 150.0f;
    static constexpr f32 BOMB_DAMAGE = 50.0f;

    WeaponCode id() const override { return WeaponCode::Airstrike; }
    Result<void> fire(const FireRequest& request, sim::Timeline& timeline,
                      sim::SimulationContext& context) override;
};

/**
 * @brief CW01: a carrier that bursts into CLUSTER_COUNT shells at its apex
 *
 * The carrier's flight past the apex is discarded and replaced by a
 * harmless burst Impact. Children fly along the apex velocity with random
 * spread; only the last is final.
 */
class ClusterWeapon final : public Weapon {
public:
    static constexpr u32 CLUSTER_COUNT = 10;
    static constexpr f32 SPREAD = 0.3f;
    static constexpr f32 CHILD_POWER = 200.0f;
    static constexpr f32 CHILD_CRATER_SIZE = 25.0f;

    WeaponCode id() const override { return WeaponCode::Cluster; }
    Result<void> fire(const FireRequest& request, sim::Timeline& timeline,
                      sim::SimulationContext& context) override;
};

} // namespace salvo::gameplay
