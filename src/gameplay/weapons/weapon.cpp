#include "gameplay/weapons/weapon.hpp"
#include "gameplay/weapons/direct_fire.hpp"
#include "gameplay/weapons/bounce_weapons.hpp"
#include "gameplay/weapons/burst_weapons.hpp"
#include "gameplay/weapons/carrier_weapons.hpp"
#include "gameplay/weapons/guided_weapons.hpp"

#include <array>

namespace salvo::gameplay {

// ============================================================================
// Weapon Data Table
// ============================================================================

namespace {

constexpr std::array<WeaponData, static_cast<size_t>(WeaponCode::Count)> WEAPON_TABLE = {{
    { WeaponCode::BasicShot,      "BW01",  "Poverty Shot",      "Single shell with a small blast.",                      1 },
    { WeaponCode::BouncingBetty,  "BB01",  "Bouncing Betty",    "Bounces off the ground four times before it settles.",  300 },
    { WeaponCode::BouncingRabbit, "BR01",  "Bouncing Rabbit",   "Splits into three on every bounce.",                   500 },
    { WeaponCode::Airstrike,      "RF01",  "Rain Of Fire",      "Carrier that drops a stream of bomblets.",             2300 },
    { WeaponCode::Cluster,        "CW01",  "Cluster Weapon",    "Carrier that bursts at the top of its arc.",           1250 },
    { WeaponCode::JumpingBean,    "JB01",  "Jumping Bean",      "Hops around the impact point, weaker every hop.",      1250 },
    { WeaponCode::Popcorn,        "PC01",  "Popcorn",           "Every impact pops two more.",                          1250 },
    { WeaponCode::MountainMerc,   "MM01",  "Mountain Merc",     "Throws a fountain of shells straight up on impact.",   900 },
    { WeaponCode::Sprinkler,      "SW01",  "Sprinkler",         "Sprays a ring of shells around the impact.",           1250 },
    { WeaponCode::Guided,         "GW01",  "Heli Killer",       "Homes on a helicopter after launch.",                  1250 },
    { WeaponCode::MultiGuided,    "MGW01", "Multi Heli Killer", "One homing missile per helicopter in range.",          1250 },
    { WeaponCode::Volley,         "VW01",  "Volley Weapon",     "Ten shells at once with medium spread.",               950 },
    { WeaponCode::MultiShot,      "MS01",  "Pea Shooter",       "Eight consecutive shots with medium deviation.",       100 },
}};

} // namespace

const WeaponData& getWeaponData(WeaponCode id) {
    return WEAPON_TABLE[static_cast<size_t>(id)];
}

std::optional<WeaponCode> parseWeaponCode(std::string_view code) {
    for (const auto& data : WEAPON_TABLE) {
        if (code == data.code) {
            return data.id;
        }
    }
    return std::nullopt;
}

std::vector<WeaponCode> allWeaponCodes() {
    std::vector<WeaponCode> codes;
    codes.reserve(WEAPON_TABLE.size());
    for (const auto& data : WEAPON_TABLE) {
        codes.push_back(data.id);
    }
    return codes;
}

// ============================================================================
// Weapon
// ============================================================================

sim::ProjectileSpec Weapon::baseSpec(const FireRequest& request) const {
    sim::ProjectileSpec spec;
    spec.startPosition = request.origin;
    spec.direction = request.direction;
    spec.power = request.power;
    spec.owner = request.owner;
    spec.weaponCode = data().code;
    return spec;
}

std::unique_ptr<Weapon> createWeapon(WeaponCode id) {
    switch (id) {
        case WeaponCode::BasicShot:      return std::make_unique<BasicShotWeapon>();
        case WeaponCode::BouncingBetty:  return std::make_unique<BouncingBettyWeapon>();
        case WeaponCode::BouncingRabbit: return std::make_unique<BouncingRabbitWeapon>();
        case WeaponCode::Airstrike:      return std::make_unique<AirstrikeWeapon>();
        case WeaponCode::Cluster:        return std::make_unique<ClusterWeapon>();
        case WeaponCode::JumpingBean:    return std::make_unique<PepperBurstWeapon>(PepperBurstWeapon::jumpingBean());
        case WeaponCode::Popcorn:        return std::make_unique<PepperBurstWeapon>(PepperBurstWeapon::popcorn());
        case WeaponCode::MountainMerc:   return std::make_unique<MountainMercWeapon>();
        case WeaponCode::Sprinkler:      return std::make_unique<SprinklerWeapon>();
        case WeaponCode::Guided:         return std::make_unique<GuidedWeapon>();
        case WeaponCode::MultiGuided:    return std::make_unique<MultiGuidedWeapon>();
        case WeaponCode::Volley:         return std::make_unique<SalvoWeapon>(SalvoWeapon::volley());
        case WeaponCode::MultiShot:      return std::make_unique<SalvoWeapon>(SalvoWeapon::multiShot());
        case WeaponCode::Count:          break;
    }
    return nullptr;
}

} // namespace salvo::gameplay
