#include "gameplay/weapons/guided_weapons.hpp"
#include "core/logging/logger.hpp"

#include <algorithm>
#include <cmath>

namespace salvo::gameplay {

namespace {

Result<void> fireUnguided(sim::ProjectileSpec spec, f32 damage, f32 craterSize,
                          sim::Timeline& timeline, sim::SimulationContext& context) {
    spec.isFinalProjectile = true;
    spec.baseDamage = damage;
    spec.craterSize = craterSize;
    spec.guidance.reset();
    spec.visual.explosionType = "guided";
    spec.visual.projectileScale = 1.5f;

    auto outcome = context.simulate(spec, 0.0, timeline);
    if (!outcome) {
        return std::unexpected(outcome.error());
    }
    return {};
}

} // namespace

std::vector<world::TargetSnapshot> eligibleTargets(const sim::SimulationContext& context, TimeMs lookaheadMs) {
    std::vector<world::TargetSnapshot> eligible;
    for (const auto& target : context.liveTargets()) {
        const auto future = context.predictedTargetPosition(target.id, lookaheadMs);
        if (!future) continue;
        if (std::abs(future->x) <= ENGAGEMENT_HALF_EXTENT && std::abs(future->z) <= ENGAGEMENT_HALF_EXTENT) {
            eligible.push_back(target);
        }
    }
    return eligible;
}

// ============================================================================
// GuidedWeapon
// ============================================================================

Result<void> GuidedWeapon::fire(const FireRequest& request, sim::Timeline& timeline,
                                sim::SimulationContext& context) {
    const auto targets = eligibleTargets(context, ENGAGEMENT_LOOKAHEAD);
    if (targets.empty()) {
        LOG_DEBUG("GW01: no target in range, firing unguided");
        return fireUnguided(baseSpec(request), UNGUIDED_DAMAGE, CRATER_SIZE, timeline, context);
    }

    const size_t pick = std::min(targets.size() - 1,
                                 static_cast<size_t>(context.random() * static_cast<f32>(targets.size())));
    const auto& target = targets[pick];

    sim::ProjectileSpec spec = baseSpec(request);
    spec.power = request.power * POWER_FACTOR;
    spec.acceleration = ACCELERATION;
    spec.isFinalProjectile = true;
    spec.baseDamage = DAMAGE;
    spec.craterSize = CRATER_SIZE;
    spec.guidance = sim::GuidanceSpec{target.id, MAX_TURN_RATE, GUIDANCE_DELAY};
    spec.visual.explosionType = "guided";
    spec.visual.explosionSize = 1.5f;
    spec.visual.projectileScale = 1.5f;

    LOG_DEBUG("GW01 homing on target {}", target.id);
    auto outcome = context.simulate(spec, 0.0, timeline);
    if (!outcome) {
        return std::unexpected(outcome.error());
    }
    return {};
}

// ============================================================================
// MultiGuidedWeapon
// ============================================================================

Result<void> MultiGuidedWeapon::fire(const FireRequest& request, sim::Timeline& timeline,
                                     sim::SimulationContext& context) {
    const auto targets = eligibleTargets(context, ENGAGEMENT_LOOKAHEAD);
    if (targets.empty()) {
        LOG_DEBUG("MGW01: no target in range, firing unguided");
        return fireUnguided(baseSpec(request), UNGUIDED_DAMAGE, CRATER_SIZE, timeline, context);
    }

    for (size_t i = 0; i < targets.size(); ++i) {
        Vec3 direction = request.direction;
        if (targets.size() > 1) {
            direction.x += (context.random() * 2.0f - 1.0f) * SPREAD;
            direction.y += (context.random() * 2.0f - 1.0f) * SPREAD;
        }

        sim::ProjectileSpec spec = baseSpec(request);
        spec.direction = math::safeNormalize(direction, request.direction);
        spec.power = request.power * POWER_FACTOR;
        spec.acceleration = ACCELERATION;
        spec.isFinalProjectile = (i + 1 == targets.size());
        spec.baseDamage = DAMAGE;
        spec.craterSize = CRATER_SIZE;
        spec.guidance = sim::GuidanceSpec{targets[i].id, MAX_TURN_RATE,
                                          GUIDANCE_DELAY + static_cast<TimeMs>(i) * GUIDANCE_STAGGER};
        spec.visual.explosionType = "guided";
        spec.visual.explosionSize = 1.2f;
        spec.visual.projectileScale = 0.7f;

        auto outcome = context.simulate(spec, 0.0, timeline);
        if (!outcome) {
            return std::unexpected(outcome.error());
        }
    }

    LOG_DEBUG("MGW01 launched {} missiles", targets.size());
    return {};
}

} // namespace salvo::gameplay
