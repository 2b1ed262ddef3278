#include "gameplay/weapons/burst_weapons.hpp"
#include "core/logging/logger.hpp"

#include <algorithm>
#include <cmath>

namespace salvo::gameplay {

// ============================================================================
// PepperBurstWeapon
// ============================================================================

PepperBurstWeapon::Params PepperBurstWeapon::jumpingBean() {
    Params p{};
    p.code = WeaponCode::JumpingBean;
    p.childrenPerImpact = 1;
    p.maxBounces = 15;
    p.bounceRadius = 10.0f;
    p.radiusJitter = 0.5f;
    p.aimJitter = 0.5f;
    p.baseTimeFactor = 0.8;
    p.timeFactorDecay = 1.1;
    p.minTimeFactor = 0.25;
    p.baseScale = 1.2f;
    p.scaleDecay = 0.98f;
    p.minScale = 0.5f;
    p.baseDamage = 15.0f;
    p.damageDecay = 0.9f;
    p.minDamage = 5.0f;
    p.craterSize = 20.0f;
    p.hopPower = 300.0f;
    p.verticalBias = 1.6f;
    p.hopGravity = -1500.0f;
    p.hopStyle = "spike_bomb";
    return p;
}

PepperBurstWeapon::Params PepperBurstWeapon::popcorn() {
    Params p{};
    p.code = WeaponCode::Popcorn;
    p.childrenPerImpact = 2;
    p.maxBounces = 5;
    p.bounceRadius = 15.0f;
    p.radiusJitter = 12.0f;
    p.aimJitter = 4.0f;
    p.baseTimeFactor = 1.0;
    p.timeFactorDecay = 1.15;
    p.minTimeFactor = 0.8;
    p.baseScale = 1.2f;
    p.scaleDecay = 0.85f;
    p.minScale = 0.4f;
    p.baseDamage = 28.0f;
    p.damageDecay = 0.8f;
    p.minDamage = 8.0f;
    p.craterSize = 15.0f;
    p.hopPower = 150.0f;
    p.verticalBias = 1.7f;
    p.hopGravity = -800.0f;
    p.hopStyle = "popcorn";
    return p;
}

PepperBurstWeapon::PepperBurstWeapon(const Params& params)
    : m_params(params) {
}

Result<void> PepperBurstWeapon::fire(const FireRequest& request, sim::Timeline& timeline,
                                     sim::SimulationContext& context) {
    sim::ProjectileSpec spec = baseSpec(request);
    spec.isFinalProjectile = false;
    spec.bounceCount = 0;
    spec.timeFactor = m_params.baseTimeFactor;
    spec.baseDamage = m_params.baseDamage;
    spec.craterSize = m_params.craterSize;
    spec.visual.projectileScale = m_params.baseScale;
    spec.visual.explosionSize = 1.2f;

    const Params params = m_params;
    spec.weaponInstance = context.registerHandler(
        [params](const sim::ImpactEvent& impact, sim::Timeline& tl, sim::SimulationContext& ctx) {
            if (impact.isTargetHit() || impact.bounceCount >= params.maxBounces) {
                return;
            }
            for (u32 i = 0; i < params.childrenPerImpact; ++i) {
                ctx.spawnChild(hopChild(params, impact, ctx), impact.time, tl);
            }
        });

    auto outcome = context.simulate(spec, 0.0, timeline);
    if (!outcome) {
        return std::unexpected(outcome.error());
    }
    return {};
}

sim::ProjectileSpec PepperBurstWeapon::hopChild(const Params& params, const sim::ImpactEvent& impact,
                                                sim::SimulationContext& context) {
    const u32 currentBounce = impact.bounceCount;
    const f32 n = static_cast<f32>(currentBounce);

    const f32 angle = context.random() * math::TWO_PI;
    const f32 radius = params.bounceRadius + context.randomCentered() * params.radiusJitter;

    const Vec3 start{impact.position.x + std::cos(angle) * radius,
                     impact.position.y + 3.0f,
                     impact.position.z + std::sin(angle) * radius};
    const Vec3 aim{start.x + context.randomCentered() * params.aimJitter,
                   impact.position.y,
                   start.z + context.randomCentered() * params.aimJitter};

    Vec3 direction = math::safeNormalize(aim - start, -math::UP);
    direction.y += params.verticalBias;

    sim::ProjectileSpec spec;
    spec.startPosition = start;
    spec.direction = math::safeNormalize(direction);
    spec.power = params.hopPower;
    spec.gravity = params.hopGravity;
    spec.timeFactor = std::max(params.baseTimeFactor / std::pow(params.timeFactorDecay, static_cast<f64>(currentBounce)),
                               params.minTimeFactor);
    spec.bounceCount = currentBounce + 1;
    spec.isFinalProjectile = (currentBounce + 1 >= params.maxBounces);
    spec.weaponInstance = spec.isFinalProjectile ? std::nullopt : impact.weaponInstance;
    spec.baseDamage = std::max(params.baseDamage * std::pow(params.damageDecay, n), params.minDamage);
    spec.craterSize = params.craterSize;
    spec.aoeSize = impact.aoeSize;
    spec.owner = impact.owner;
    spec.weaponCode = impact.weaponCode;
    spec.visual.projectileStyle = params.hopStyle;
    spec.visual.projectileScale = std::max(params.baseScale * std::pow(params.scaleDecay, n), params.minScale);
    spec.visual.explosionSize = 0.6f;
    return spec;
}

// ============================================================================
// MountainMercWeapon
// ============================================================================

Result<void> MountainMercWeapon::fire(const FireRequest& request, sim::Timeline& timeline,
                                      sim::SimulationContext& context) {
    sim::ProjectileSpec spec = baseSpec(request);
    spec.isFinalProjectile = false;
    spec.baseDamage = DAMAGE;
    spec.craterSize = CRATER_SIZE;

    spec.weaponInstance = context.registerHandler(
        [](const sim::ImpactEvent& impact, sim::Timeline& tl, sim::SimulationContext& ctx) {
            if (impact.isTargetHit()) {
                return;
            }
            for (u32 i = 0; i < CHILD_COUNT; ++i) {
                Vec3 direction = math::UP;
                direction = math::rotateY(direction, ctx.randomCentered() * TILT_SPREAD);
                direction = math::rotateAroundAxis(direction, Vec3(1.0f, 0.0f, 0.0f), ctx.randomCentered() * TILT_SPREAD);
                direction = math::rotateAroundAxis(direction, Vec3(0.0f, 0.0f, 1.0f), ctx.randomCentered() * TILT_SPREAD);

                sim::ProjectileSpec child;
                child.startPosition = impact.position + Vec3(0.0f, 5.0f, 0.0f);
                child.direction = direction;
                child.power = impact.power * CHILD_POWER_FACTOR * (0.5f + ctx.random());
                child.isFinalProjectile = (i + 1 == CHILD_COUNT);
                child.baseDamage = DAMAGE;
                child.craterSize = CRATER_SIZE;
                child.owner = impact.owner;
                child.weaponCode = impact.weaponCode;
                child.visual.projectileScale = 0.7f * (0.5f + ctx.random());

                ctx.spawnChild(child, impact.time, tl);
            }
        });

    auto outcome = context.simulate(spec, 0.0, timeline);
    if (!outcome) {
        return std::unexpected(outcome.error());
    }
    return {};
}

// ============================================================================
// SprinklerWeapon
// ============================================================================

std::array<u32, SprinklerWeapon::RING_STEPS> SprinklerWeapon::firingOrder() {
    std::array<u32, RING_STEPS> order{};
    size_t next = 0;
    for (u32 step = 0; step < RING_STEPS; step += 2) {
        order[next++] = step;
    }
    // Second pass starts from the far end of the ring
    order[next++] = RING_STEPS - 1;
    for (u32 step = 1; step < RING_STEPS - 1; step += 2) {
        order[next++] = step;
    }
    return order;
}

Result<void> SprinklerWeapon::fire(const FireRequest& request, sim::Timeline& timeline,
                                   sim::SimulationContext& context) {
    sim::ProjectileSpec spec = baseSpec(request);
    spec.isFinalProjectile = false;

    spec.weaponInstance = context.registerHandler(
        [](const sim::ImpactEvent& impact, sim::Timeline& tl, sim::SimulationContext& ctx) {
            if (impact.isTargetHit()) {
                return;
            }
            const f32 stepAngle = math::TWO_PI / static_cast<f32>(RING_STEPS);
            const auto order = firingOrder();

            for (size_t i = 0; i < order.size(); ++i) {
                const f32 angle = static_cast<f32>(order[i]) * stepAngle;
                const Vec3 direction = glm::normalize(
                    Vec3(std::cos(angle), std::tan(VERTICAL_ANGLE), std::sin(angle)));
                const TimeMs startTime = impact.time + static_cast<TimeMs>(i) * STEP_DELAY;

                for (f32 power : POWERS) {
                    sim::ProjectileSpec child;
                    child.startPosition = impact.position + Vec3(0.0f, 3.0f, 0.0f);
                    child.direction = direction;
                    child.power = power;
                    child.gravity = CHILD_GRAVITY;
                    child.timeFactor = 0.9;
                    child.isFinalProjectile = true;
                    child.baseDamage = DAMAGE;
                    child.aoeSize = AOE_SIZE;
                    child.craterSize = CRATER_SIZE;
                    child.owner = impact.owner;
                    child.weaponCode = impact.weaponCode;
                    child.visual.projectileScale = 0.5f + ctx.random() * 0.3f;

                    ctx.spawnChild(child, startTime, tl);
                }
            }
        });

    auto outcome = context.simulate(spec, 0.0, timeline);
    if (!outcome) {
        return std::unexpected(outcome.error());
    }
    return {};
}

} // namespace salvo::gameplay
