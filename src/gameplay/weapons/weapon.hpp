#pragma once

/**
 * @file weapon.hpp
 * @brief Weapon catalog and the fire interface shared by every weapon
 */

#include "core/types.hpp"
#include "core/math/math.hpp"
#include "sim/fire_context.hpp"
#include "sim/timeline.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace salvo::gameplay {

// ============================================================================
// Weapon Codes
// ============================================================================

enum class WeaponCode : u8 {
    BasicShot = 0,      // BW01
    BouncingBetty,      // BB01
    BouncingRabbit,     // BR01
    Airstrike,          // RF01
    Cluster,            // CW01
    JumpingBean,        // JB01
    Popcorn,            // PC01
    MountainMerc,       // MM01
    Sprinkler,          // SW01
    Guided,             // GW01
    MultiGuided,        // MGW01
    Volley,             // VW01
    MultiShot,          // MS01

    Count
};

/// Catalog code of airstrike bomblets (display only, no handler)
constexpr const char* AIRSTRIKE_BOMBLET_CODE = "RF01B";

// ============================================================================
// Weapon Data
// ============================================================================

/**
 * @brief Static weapon data (shop and display)
 */
struct WeaponData {
    WeaponCode id;
    const char* code;           // Stable catalog code sent to clients
    const char* name;
    const char* description;
    i32 price;
};

/**
 * @brief Get weapon data by code
 */
const WeaponData& getWeaponData(WeaponCode id);

/// Look up a catalog code ("BW01", ...)
std::optional<WeaponCode> parseWeaponCode(std::string_view code);

/// Every catalog entry in code order
std::vector<WeaponCode> allWeaponCodes();

// ============================================================================
// Fire Interface
// ============================================================================

/**
 * @brief Where and how hard the firing tank shoots
 */
struct FireRequest {
    Vec3 origin{0.0f};          // Barrel tip
    Vec3 direction{0.0f, 1.0f, 0.0f};
    f32 power = 0.0f;
    PlayerId owner = INVALID_PLAYER_ID;
};

/**
 * @brief Weapon instance for one fire
 *
 * fire() registers the weapon's impact handler (if any) on the fire's
 * context and simulates the initial projectiles. The weapon object only
 * lives for one fire; handlers capture their parameters by value.
 */
class Weapon {
public:
    virtual ~Weapon() = default;

    virtual WeaponCode id() const = 0;

    const WeaponData& data() const { return getWeaponData(id()); }

    /// Simulate the whole fire into `timeline`
    virtual Result<void> fire(const FireRequest& request, sim::Timeline& timeline,
                              sim::SimulationContext& context) = 0;

protected:
    /// Spec pre-filled with the request's origin, direction, power and owner
    sim::ProjectileSpec baseSpec(const FireRequest& request) const;
};

/**
 * @brief Create the weapon implementing a catalog code
 */
std::unique_ptr<Weapon> createWeapon(WeaponCode id);

} // namespace salvo::gameplay
