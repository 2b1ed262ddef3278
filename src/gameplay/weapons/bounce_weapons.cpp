#include "gameplay/weapons/bounce_weapons.hpp"
#include "core/logging/logger.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <memory>

namespace salvo::gameplay {

namespace {

// Children start slightly above the impact so they do not re-collide on the first step
constexpr f32 BOUNCE_LIFT = 2.0f;

Vec3 incomingDirection(const sim::ImpactEvent& impact) {
    return math::safeNormalize(impact.velocity, -math::UP);
}

Vec3 surfaceNormal(const sim::ImpactEvent& impact) {
    return math::safeNormalize(impact.normal, math::UP);
}

/// Fields every bounce child inherits from its parent's impact
sim::ProjectileSpec inheritFromImpact(const sim::ImpactEvent& impact) {
    sim::ProjectileSpec spec;
    spec.startPosition = impact.position + Vec3(0.0f, BOUNCE_LIFT, 0.0f);
    spec.gravity = impact.gravity;
    spec.owner = impact.owner;
    spec.weaponCode = impact.weaponCode;
    spec.visual = impact.visual;
    return spec;
}

} // namespace

// ============================================================================
// BouncingBettyWeapon
// ============================================================================

Result<void> BouncingBettyWeapon::fire(const FireRequest& request, sim::Timeline& timeline,
                                       sim::SimulationContext& context) {
    sim::ProjectileSpec spec = baseSpec(request);
    spec.isFinalProjectile = false;
    spec.bounceCount = 0;
    spec.craterSize = CRATER_SIZE;
    spec.visual.explosionSize = 2.0f;

    spec.weaponInstance = context.registerHandler(
        [](const sim::ImpactEvent& impact, sim::Timeline& tl, sim::SimulationContext& ctx) {
            if (impact.bounceCount >= MAX_BOUNCES) {
                return;
            }
            ctx.spawnChild(bounceChild(impact, ctx), impact.time, tl);
        });

    auto outcome = context.simulate(spec, 0.0, timeline);
    if (!outcome) {
        return std::unexpected(outcome.error());
    }
    return {};
}

sim::ProjectileSpec BouncingBettyWeapon::bounceChild(const sim::ImpactEvent& impact,
                                                     sim::SimulationContext& context) {
    const u32 bounce = impact.bounceCount + 1;

    Vec3 direction = math::reflect(incomingDirection(impact), surfaceNormal(impact)) * POWER_RETENTION;
    direction.y += UPWARD_BIAS * (1.0f + 0.25f * static_cast<f32>(bounce));

    // Spread narrows with every bounce
    const f32 spread = SPREAD / static_cast<f32>(bounce);
    direction = math::rotateY(direction, context.randomCentered() * 2.0f * spread);

    sim::ProjectileSpec spec = inheritFromImpact(impact);
    spec.direction = math::safeNormalize(direction);
    spec.power = impact.power * POWER_RETENTION;
    spec.timeFactor = impact.timeFactor;
    spec.bounceCount = bounce;
    spec.isFinalProjectile = (bounce >= MAX_BOUNCES);
    spec.weaponInstance = spec.isFinalProjectile ? std::nullopt : impact.weaponInstance;
    spec.baseDamage = impact.baseDamage;
    spec.craterSize = CRATER_SIZE;
    spec.aoeSize = impact.aoeSize;
    spec.visual.projectileScale = std::max(1.0f - 0.2f * static_cast<f32>(bounce), 0.25f);
    return spec;
}

// ============================================================================
// BouncingRabbitWeapon
// ============================================================================

Result<void> BouncingRabbitWeapon::fire(const FireRequest& request, sim::Timeline& timeline,
                                        sim::SimulationContext& context) {
    sim::ProjectileSpec spec = baseSpec(request);
    spec.isFinalProjectile = false;
    spec.bounceCount = 0;
    spec.baseDamage = 40.0f;
    spec.craterSize = 30.0f;
    spec.visual.projectileScale = 3.0f;

    // The initial shell counts toward the cap
    auto produced = std::make_shared<u32>(1);
    const u32 ceiling = m_ceiling;

    spec.weaponInstance = context.registerHandler(
        [produced, ceiling](const sim::ImpactEvent& impact, sim::Timeline& tl, sim::SimulationContext& ctx) {
            if (impact.isTargetHit() || impact.bounceCount >= MAX_BOUNCES) {
                return;
            }
            if (*produced + SPLIT_COUNT > ceiling) {
                LOG_DEBUG("BR01 split refused: {} of {} projectiles used", *produced, ceiling);
                return;
            }
            *produced += SPLIT_COUNT;

            const u32 bounce = impact.bounceCount + 1;
            const bool finalSplit = (*produced + SPLIT_COUNT > ceiling) || bounce >= MAX_BOUNCES;

            constexpr std::array<f32, SPLIT_COUNT> OFFSETS = {0.0f, -0.8f, 0.8f};
            for (f32 offset : OFFSETS) {
                sim::ProjectileSpec child = inheritFromImpact(impact);
                child.direction = splitDirection(impact, bounce, offset, ctx);
                child.power = impact.power * std::pow(POWER_RETENTION, static_cast<f32>(bounce));
                child.timeFactor = CHILD_TIME_FACTOR;
                child.bounceCount = bounce;
                child.isFinalProjectile = finalSplit;
                child.weaponInstance = finalSplit ? std::nullopt : impact.weaponInstance;
                child.baseDamage = 20.0f;
                child.craterSize = 30.0f;
                child.aoeSize = impact.aoeSize;
                child.visual.explosionSize = static_cast<f32>(bounce);
                child.visual.projectileScale = std::max(2.0f - 0.2f * static_cast<f32>(bounce), 0.25f);

                ctx.spawnChild(child, impact.time, tl);
            }
        });

    auto outcome = context.simulate(spec, 0.0, timeline);
    if (!outcome) {
        return std::unexpected(outcome.error());
    }
    return {};
}

Vec3 BouncingRabbitWeapon::splitDirection(const sim::ImpactEvent& impact, u32 bounce, f32 offset,
                                          sim::SimulationContext& context) {
    Vec3 direction = math::reflect(incomingDirection(impact), surfaceNormal(impact));
    direction = math::safeNormalize(direction) * BOUNCINESS;
    direction.y += UPWARD_BIAS * (1.0f + 0.15f * static_cast<f32>(bounce));

    if (direction.y < MIN_VERTICAL) {
        direction.y = MIN_VERTICAL;
        direction = glm::normalize(direction);
    }

    if (offset != 0.0f) {
        const Vec3 right = math::safeNormalize(glm::cross(math::UP, direction), Vec3(1.0f, 0.0f, 0.0f));
        direction += right * (offset * SPREAD_VARIANCE);
        direction = math::rotateY(direction, context.randomCentered() * 0.3f);
    }

    return math::safeNormalize(direction);
}

} // namespace salvo::gameplay
