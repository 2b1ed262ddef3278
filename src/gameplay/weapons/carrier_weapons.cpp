#include "gameplay/weapons/carrier_weapons.hpp"
#include "world/height_field.hpp"
#include "core/logging/logger.hpp"

#include <vector>

namespace salvo::gameplay {

namespace {

/// Move events of one projectile, in time order
std::vector<sim::MoveEvent> movesOf(const sim::Timeline& timeline, ProjectileId id) {
    std::vector<sim::MoveEvent> moves;
    for (const auto& event : timeline.events()) {
        if (const auto* move = std::get_if<sim::MoveEvent>(&event); move && move->projectileId == id) {
            moves.push_back(*move);
        }
    }
    return moves;
}

/// Impact synthesized for a carrier that ends outside the simulator
sim::ImpactEvent carrierImpact(const sim::ProjectileSpec& carrier, ProjectileId id, TimeMs time,
                               const Vec3& position, const Vec3& velocity) {
    sim::ImpactEvent impact;
    impact.time = time;
    impact.projectileId = id;
    impact.position = position;
    impact.velocity = velocity;
    impact.power = carrier.power;
    impact.gravity = carrier.gravity;
    impact.timeFactor = carrier.timeFactor;
    impact.baseDamage = carrier.baseDamage;
    impact.craterSize = carrier.craterSize;
    impact.aoeSize = carrier.aoeSize;
    impact.isFinalProjectile = true;
    impact.weaponCode = carrier.weaponCode;
    impact.owner = carrier.owner;
    impact.visual = carrier.visual;
    return impact;
}

} // namespace

// ============================================================================
// AirstrikeWeapon
// ============================================================================

Result<void> AirstrikeWeapon::fire(const FireRequest& request, sim::Timeline& timeline,
                                   sim::SimulationContext& context) {
    sim::ProjectileSpec carrier = baseSpec(request);
    carrier.gravity = CARRIER_GRAVITY;
    carrier.doesCollide = false;
    carrier.isFinalProjectile = true;
    carrier.baseDamage = 20.0f;
    carrier.craterSize = 20.0f;
    carrier.visual.projectileScale = 4.0f;

    sim::Timeline scratch;
    auto outcome = context.simulate(carrier, 0.0, scratch);
    if (!outcome) {
        return std::unexpected(outcome.error());
    }

    const ProjectileId carrierId = outcome->id;
    const auto moves = movesOf(scratch, carrierId);

    // Drop cadence, sampled from the carrier's own Move events
    std::vector<const sim::MoveEvent*> drops;
    size_t cursor = 0;
    for (u32 bomb = 0; bomb < BOMB_COUNT; ++bomb) {
        const TimeMs dropTime = INITIAL_DELAY + static_cast<TimeMs>(bomb) * DROP_INTERVAL;
        while (cursor < moves.size() && moves[cursor].time < dropTime) {
            ++cursor;
        }
        if (cursor >= moves.size()) {
            break;
        }
        drops.push_back(&moves[cursor]);
    }

    // End of the carrier: self-destruct after the last drop, or ground contact
    if (!drops.empty() && drops.back()->time < outcome->endTime) {
        const sim::MoveEvent& last = *drops.back();
        scratch.truncateAfter(carrierId, last.time);
        sim::ImpactEvent selfDestruct = carrierImpact(carrier, carrierId, last.time, last.position, last.velocity);
        selfDestruct.baseDamage = 0.0f;
        selfDestruct.craterSize = 0.0f;
        selfDestruct.aoeSize = 0.0f;
        scratch.append(selfDestruct);
    } else {
        const TimeMs lastMove = moves.empty() ? 0.0 : moves.back().time;
        scratch.truncateAfter(carrierId, lastMove);

        Vec3 ground = moves.empty() ? carrier.startPosition : moves.back().position;
        if (const auto* heightField = context.heightField()) {
            ground.y = heightField->groundLevelAt(ground.x, ground.z);
        }
        const Vec3 velocity = moves.empty() ? Vec3{0.0f} : moves.back().velocity;
        scratch.append(carrierImpact(carrier, carrierId, outcome->endTime, ground, velocity));
    }

    timeline.merge(scratch);

    const Vec3 baseDirection = math::safeNormalize(request.direction);
    for (size_t i = 0; i < drops.size(); ++i) {
        sim::ProjectileSpec bomb;
        bomb.startPosition = drops[i]->position;
        bomb.direction = math::rotateY(baseDirection, context.randomCentered() * DROP_SPREAD);
        bomb.power = BOMB_POWER;
        bomb.isFinalProjectile = true;
        bomb.baseDamage = BOMB_DAMAGE;
        bomb.craterSize = BOMB_CRATER_SIZE;
        bomb.aoeSize = BOMB_AOE_SIZE;
        bomb.owner = request.owner;
        bomb.weaponCode = AIRSTRIKE_BOMBLET_CODE;
        bomb.visual.projectileStyle = "bomblet";
        bomb.visual.explosionSize = 3.0f;

        context.spawnChild(bomb, drops[i]->time, timeline);
    }

    LOG_DEBUG("RF01 carrier {} dropped {} bomblets", carrierId, drops.size());
    return {};
}

// ============================================================================
// ClusterWeapon
// ============================================================================

Result<void> ClusterWeapon::fire(const FireRequest& request, sim::Timeline& timeline,
                                 sim::SimulationContext& context) {
    sim::ProjectileSpec carrier = baseSpec(request);
    carrier.doesCollide = false;
    carrier.isFinalProjectile = true;
    carrier.baseDamage = 20.0f;
    carrier.craterSize = 5.0f;
    carrier.visual.projectileScale = 2.0f;

    sim::Timeline scratch;
    auto outcome = context.simulate(carrier, 0.0, scratch);
    if (!outcome) {
        return std::unexpected(outcome.error());
    }

    const ProjectileId carrierId = outcome->id;
    const auto moves = movesOf(scratch, carrierId);
    if (moves.empty()) {
        LOG_DEBUG("CW01 carrier {} never left the ground, no cluster", carrierId);
        timeline.merge(scratch);
        return {};
    }

    size_t apex = 0;
    for (size_t i = 1; i < moves.size(); ++i) {
        if (moves[i].position.y > moves[apex].position.y) {
            apex = i;
        }
    }

    // Direction of travel at the apex from the neighbouring samples
    Vec3 apexVelocity = moves[apex].velocity;
    if (moves.size() > 1) {
        const size_t before = apex > 0 ? apex - 1 : apex;
        const size_t after = apex + 1 < moves.size() ? apex + 1 : apex;
        const TimeMs span = moves[after].time - moves[before].time;
        if (span > 0.0) {
            apexVelocity = (moves[after].position - moves[before].position) / static_cast<f32>(span / 1000.0);
        }
    }
    const Vec3 apexDirection = math::safeNormalize(apexVelocity, math::safeNormalize(request.direction));

    const sim::MoveEvent& burstPoint = moves[apex];
    scratch.truncateAfter(carrierId, burstPoint.time);
    sim::ImpactEvent burst = carrierImpact(carrier, carrierId, burstPoint.time,
                                           burstPoint.position, apexVelocity);
    burst.baseDamage = 0.0f;
    burst.craterSize = 0.0f;
    burst.aoeSize = 0.0f;
    scratch.append(burst);
    timeline.merge(scratch);

    for (u32 i = 0; i < CLUSTER_COUNT; ++i) {
        const Vec3 jitter{context.randomCentered(), context.randomCentered(), context.randomCentered()};

        sim::ProjectileSpec child;
        child.startPosition = burstPoint.position;
        child.direction = math::safeNormalize(apexDirection + jitter * SPREAD, apexDirection);
        child.power = CHILD_POWER;
        child.isFinalProjectile = (i + 1 == CLUSTER_COUNT);
        child.craterSize = CHILD_CRATER_SIZE;
        child.owner = request.owner;
        child.weaponCode = carrier.weaponCode;

        context.spawnChild(child, burstPoint.time, timeline);
    }

    LOG_DEBUG("CW01 carrier {} burst at {:.0f} ms", carrierId, burstPoint.time);
    return {};
}

} // namespace salvo::gameplay
