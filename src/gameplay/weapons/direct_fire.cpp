#include "gameplay/weapons/direct_fire.hpp"
#include "core/logging/logger.hpp"

namespace salvo::gameplay {

// ============================================================================
// BasicShotWeapon
// ============================================================================

Result<void> BasicShotWeapon::fire(const FireRequest& request, sim::Timeline& timeline,
                                   sim::SimulationContext& context) {
    sim::ProjectileSpec spec = baseSpec(request);
    spec.isFinalProjectile = true;
    spec.baseDamage = DAMAGE;
    spec.craterSize = CRATER_SIZE;

    auto outcome = context.simulate(spec, 0.0, timeline);
    if (!outcome) {
        return std::unexpected(outcome.error());
    }
    return {};
}

// ============================================================================
// SalvoWeapon
// ============================================================================

SalvoWeapon::Params SalvoWeapon::volley() {
    return Params{WeaponCode::Volley, 10, 0.1f, 0.0, 25.0f, 25.0f};
}

SalvoWeapon::Params SalvoWeapon::multiShot() {
    return Params{WeaponCode::MultiShot, 8, 0.15f, 500.0, 20.0f, 30.0f};
}

SalvoWeapon::SalvoWeapon(const Params& params)
    : m_params(params) {
}

Result<void> SalvoWeapon::fire(const FireRequest& request, sim::Timeline& timeline,
                               sim::SimulationContext& context) {
    for (u32 i = 0; i < m_params.shotCount; ++i) {
        sim::ProjectileSpec spec = baseSpec(request);
        const Vec3 jitter{context.randomCentered(), context.randomCentered(), context.randomCentered()};
        spec.direction = math::safeNormalize(request.direction + jitter * m_params.spread, request.direction);
        spec.isFinalProjectile = (i + 1 == m_params.shotCount);
        spec.baseDamage = m_params.damage;
        spec.craterSize = m_params.craterSize;

        const TimeMs startTime = static_cast<TimeMs>(i) * m_params.shotInterval;
        auto outcome = context.simulate(spec, startTime, timeline);
        if (!outcome) {
            return std::unexpected(outcome.error());
        }
    }

    LOG_DEBUG("{} fired {} shots", data().code, m_params.shotCount);
    return {};
}

} // namespace salvo::gameplay
