#include "sim/projectile_simulator.hpp"
#include "world/height_field.hpp"
#include "world/damage.hpp"
#include "core/logging/logger.hpp"

#include <algorithm>

namespace salvo::sim {

namespace {

ImpactEvent makeImpact(const ProjectileSpec& spec, ProjectileId id, TimeMs time,
                       const Vec3& position, const Vec3& velocity, const Vec3& normal) {
    ImpactEvent impact;
    impact.time = time;
    impact.projectileId = id;
    impact.position = position;
    impact.velocity = velocity;
    impact.normal = normal;
    impact.power = spec.power;
    impact.gravity = spec.gravity;
    impact.timeFactor = spec.timeFactor;
    impact.baseDamage = spec.baseDamage;
    impact.craterSize = spec.craterSize;
    impact.aoeSize = spec.aoeSize;
    impact.bounceCount = spec.bounceCount;
    impact.isFinalProjectile = spec.isFinalProjectile;
    impact.weaponInstance = spec.weaponInstance;
    impact.weaponCode = spec.weaponCode;
    impact.owner = spec.owner;
    impact.visual = spec.visual;
    return impact;
}

/// First live target whose bounding sphere contains the projectile
const world::TargetSnapshot* findTargetHit(const std::vector<world::TargetSnapshot>& targets,
                                           const Vec3& position, f32 projectileRadius) {
    for (const auto& target : targets) {
        if (math::spheresTouch(position, projectileRadius, target.position, target.boundingRadius)) {
            return &target;
        }
    }
    return nullptr;
}

/// Resolve target damage against the ledger and emit TargetDestroyed events
void resolveTargetImpact(ImpactEvent& impact, TargetId directHit,
                         const std::vector<world::TargetSnapshot>& targets,
                         Timeline& timeline, SimulationContext& context) {
    std::vector<TargetDestroyedEvent> destroyed;

    for (const auto& target : targets) {
        f32 damage = 0.0f;
        if (target.id == directHit) {
            damage = impact.baseDamage;
        } else {
            const f32 distance = glm::length(target.position - impact.position);
            damage = world::falloffDamage(impact.baseDamage, distance, impact.aoeSize);
        }
        if (damage <= 0.0f) continue;

        impact.targetHits.push_back(TargetHit{target.id, damage});
        if (context.recordTargetDamage(target.id, damage)) {
            destroyed.push_back(TargetDestroyedEvent{impact.time, impact.projectileId, target.id, target.position});
        }
    }

    timeline.append(impact);
    for (auto& event : destroyed) {
        LOG_DEBUG("Target {} predicted destroyed at {:.0f} ms", event.targetId, event.time);
        timeline.append(std::move(event));
    }
}

} // namespace

ProjectileOutcome simulateProjectile(const ProjectileSpec& spec, TimeMs startTime,
                                     Timeline& timeline, SimulationContext& context) {
    const SimulationConfig& config = context.config();
    const world::HeightField* heightField = context.heightField();

    const f32 dt = config.stepMs / 1000.0f;
    const TimeMs timelineStep = static_cast<TimeMs>(config.stepMs) * spec.timeFactor;

    ProjectileOutcome outcome;
    outcome.id = context.nextProjectileId();

    SpawnEvent spawn;
    spawn.time = startTime;
    spawn.projectileId = outcome.id;
    spawn.position = spec.startPosition;
    spawn.direction = spec.direction;
    spawn.power = spec.power;
    spawn.craterSize = spec.craterSize;
    spawn.isFinalProjectile = spec.isFinalProjectile;
    spawn.doesCollide = spec.doesCollide;
    spawn.weaponCode = spec.weaponCode;
    spawn.owner = spec.owner;
    spawn.visual = spec.visual;
    timeline.append(std::move(spawn));

    Vec3 position = spec.startPosition;
    Vec3 heading = spec.direction;
    Vec3 velocity{0.0f};
    f32 speed = 0.0f;

    bool guided = spec.guidance.has_value();
    f32 elapsedMs = 0.0f;
    TimeMs time = startTime;

    while (elapsedMs < config.maxDurationMs) {
        elapsedMs += config.stepMs;
        time += timelineStep;

        // Steering: only once the delay has passed and while the target lives
        std::optional<Vec3> aimPoint;
        if (guided && elapsedMs >= spec.guidance->guidanceDelay) {
            aimPoint = context.predictedTargetPosition(spec.guidance->targetId, time);
            if (!aimPoint) {
                LOG_DEBUG("Projectile {} lost target {}, continuing unguided", outcome.id, spec.guidance->targetId);
                guided = false;
                heading = math::safeNormalize(velocity, heading);
            }
        }

        if (aimPoint) {
            const Vec3 desired = math::safeNormalize(*aimPoint - position, heading);
            heading = math::rotateTowards(heading, desired, spec.guidance->maxTurnRate);
            speed = std::min(spec.power, speed + spec.acceleration * dt);
            velocity = heading * speed;
        } else {
            if (speed < spec.power) {
                speed = std::min(spec.power, speed + spec.acceleration * dt);
                velocity = heading * speed;
            }
            velocity.y += spec.gravity * dt;
        }

        position += velocity * dt;

        // Terrain first
        if (heightField) {
            const f32 ground = heightField->groundLevelAt(position.x, position.z);
            if (position.y <= ground) {
                outcome.endTime = time;
                if (!spec.doesCollide) {
                    timeline.append(ExpiredEvent{time, outcome.id, position});
                    return outcome;
                }

                const Vec3 impactPosition{position.x, ground, position.z};
                ImpactEvent impact = makeImpact(spec, outcome.id, time, impactPosition, velocity,
                                                heightField->normalAt(position.x, position.z));
                timeline.append(impact);
                outcome.impact = impact;
                break;
            }
        }

        // Then dynamic targets
        if (spec.doesCollide) {
            const auto targets = context.liveTargetsAt(time);
            if (const auto* hit = findTargetHit(targets, position, config.projectileRadius)) {
                outcome.endTime = time;
                ImpactEvent impact = makeImpact(spec, outcome.id, time, position, velocity,
                                                math::safeNormalize(position - hit->position));
                impact.kind = ImpactKind::DynamicTarget;
                impact.targetId = hit->id;
                resolveTargetImpact(impact, hit->id, targets, timeline, context);
                outcome.impact = impact;
                break;
            }
        }

        timeline.append(MoveEvent{time, outcome.id, position, velocity});
    }

    if (!outcome.impact) {
        outcome.endTime = time;
        timeline.append(ExpiredEvent{time, outcome.id, position});
        return outcome;
    }

    // Final projectiles never spawn children
    if (!spec.isFinalProjectile && spec.weaponInstance) {
        if (const WeaponHandler* found = context.findHandler(*spec.weaponInstance)) {
            // Copy: the handler may register further handlers and rehash the map
            const WeaponHandler handler = *found;
            handler(*outcome.impact, timeline, context);
        }
    }

    return outcome;
}

} // namespace salvo::sim
