#include "world/target_registry.hpp"
#include "world/height_field.hpp"
#include "ecs/components/transform.hpp"
#include "ecs/components/physics.hpp"
#include "ecs/components/combatant.hpp"
#include "core/logging/logger.hpp"

#include <algorithm>
#include <iterator>
#include <string>

namespace salvo::world {

namespace {

// Patrol box for waypoints (matches the playable terrain area)
constexpr f32 PATROL_HALF_EXTENT = 750.0f;
constexpr f32 PATROL_MIN_ALTITUDE = 200.0f;
constexpr f32 PATROL_ALTITUDE_RANGE = 200.0f;

} // namespace

// ============================================================================
// TargetFleet
// ============================================================================

TargetFleet::TargetFleet(ecs::World& world)
    : m_world(world) {
}

TargetId TargetFleet::spawnTarget(Vec3 position, Vec3 waypoint, f32 health, f32 boundingRadius) {
    const TargetId id = m_nextId++;

    auto entity = m_world.createEntity();
    m_world.addComponent<ecs::TargetComponent>(entity, ecs::TargetComponent{id, health});
    auto& transform = m_world.addComponent<ecs::TransformComponent>(entity);
    transform.position = position;
    transform.faceTowards(waypoint - position);
    m_world.addComponent<ecs::VelocityComponent>(entity);
    m_world.addComponent<ecs::BoundingSphereComponent>(entity, ecs::BoundingSphereComponent{boundingRadius});
    auto& flight = m_world.addComponent<ecs::FlightComponent>(entity);
    flight.waypoint = waypoint;

    LOG_DEBUG("Target {} spawned at ({:.1f}, {:.1f}, {:.1f})", id, position.x, position.y, position.z);
    return id;
}

std::vector<TargetSnapshot> TargetFleet::liveTargets() const {
    std::vector<TargetSnapshot> targets;
    const auto& registry = m_world.getRegistry();
    auto view = registry.view<const ecs::TargetComponent, const ecs::TransformComponent,
                              const ecs::BoundingSphereComponent>();

    for (auto [entity, target, transform, sphere] : view.each()) {
        if (target.health <= 0.0f) continue;

        TargetSnapshot snapshot;
        snapshot.id = target.targetId;
        snapshot.position = transform.position;
        snapshot.boundingRadius = sphere.radius;
        snapshot.health = target.health;
        if (const auto* velocity = registry.try_get<ecs::VelocityComponent>(entity)) {
            snapshot.velocity = velocity->linear;
        }
        targets.push_back(snapshot);
    }

    // Stable order so "first overlap wins" does not depend on storage layout
    std::sort(targets.begin(), targets.end(),
              [](const TargetSnapshot& a, const TargetSnapshot& b) { return a.id < b.id; });
    return targets;
}

Result<TargetDamageResult> TargetFleet::applyDamage(TargetId id, f32 amount) {
    const auto entity = find(id);
    if (entity == entt::null) {
        return std::unexpected(Error{"Unknown target: " + std::to_string(id)});
    }

    auto& target = m_world.getComponent<ecs::TargetComponent>(entity);
    target.health -= amount;
    return TargetDamageResult{target.health <= 0.0f, target.health};
}

std::optional<Vec3> TargetFleet::predictedPositionAt(TargetId id, TimeMs timeFromNow) const {
    const auto entity = find(id);
    if (entity == entt::null) {
        return std::nullopt;
    }

    const auto& registry = m_world.getRegistry();
    const auto& transform = registry.get<ecs::TransformComponent>(entity);
    const auto* velocity = registry.try_get<ecs::VelocityComponent>(entity);
    if (!velocity) {
        return transform.position;
    }

    // Linear extrapolation along the current velocity
    const f32 seconds = static_cast<f32>(timeFromNow / 1000.0);
    return transform.position + velocity->linear * seconds;
}

bool TargetFleet::remove(TargetId id) {
    const auto entity = find(id);
    if (entity == entt::null) {
        return false;
    }
    m_world.destroyEntity(entity);
    LOG_DEBUG("Target {} removed", id);
    return true;
}

size_t TargetFleet::count() const {
    const auto& registry = m_world.getRegistry();
    auto view = registry.view<const ecs::TargetComponent>();
    return static_cast<size_t>(std::distance(view.begin(), view.end()));
}

Vec3 TargetFleet::randomWaypoint(std::mt19937& rng) {
    std::uniform_real_distribution<f32> horizontal(-PATROL_HALF_EXTENT, PATROL_HALF_EXTENT);
    std::uniform_real_distribution<f32> altitude(0.0f, PATROL_ALTITUDE_RANGE);
    return Vec3{horizontal(rng), PATROL_MIN_ALTITUDE + altitude(rng), horizontal(rng)};
}

entt::entity TargetFleet::find(TargetId id) const {
    const auto& registry = m_world.getRegistry();
    auto view = registry.view<const ecs::TargetComponent>();
    for (auto entity : view) {
        if (view.get<const ecs::TargetComponent>(entity).targetId == id) {
            return entity;
        }
    }
    return entt::null;
}

// ============================================================================
// FlightSystem
// ============================================================================

FlightSystem::FlightSystem(const HeightField* heightField, u32 seed)
    : m_heightField(heightField)
    , m_rng(seed) {
}

void FlightSystem::fixedUpdate(entt::registry& registry, f32 fixedDeltaTime) {
    auto view = registry.view<ecs::TransformComponent, ecs::VelocityComponent, ecs::FlightComponent>();

    for (auto [entity, transform, velocity, flight] : view.each()) {
        Vec3 toWaypoint = flight.waypoint - transform.position;
        toWaypoint.y = 0.0f;
        const f32 distance = glm::length(toWaypoint);

        if (distance < flight.arrivalThreshold) {
            flight.waypoint = TargetFleet::randomWaypoint(m_rng);
            continue;
        }

        // Brake when the stopping distance reaches the waypoint
        const f32 stoppingDistance =
            (flight.currentSpeed * flight.currentSpeed) / (2.0f * flight.deceleration);
        if (distance < stoppingDistance) {
            flight.currentSpeed = std::max(0.0f, flight.currentSpeed - flight.deceleration * fixedDeltaTime);
        } else {
            flight.currentSpeed = std::min(flight.maxSpeed, flight.currentSpeed + flight.acceleration * fixedDeltaTime);
        }

        const Vec3 heading = toWaypoint / distance;
        Vec3 step = heading * std::min(flight.currentSpeed * fixedDeltaTime, distance);

        // Hold altitude over the terrain
        f32 targetHeight = flight.waypoint.y;
        if (m_heightField) {
            const f32 ground = m_heightField->heightAt(transform.position.x, transform.position.z);
            targetHeight = std::max(targetHeight, ground + flight.minHeightAboveTerrain);
        }
        step.y = (targetHeight - transform.position.y) * std::min(1.0f, flight.heightLerpSpeed * fixedDeltaTime);

        transform.position += step;
        transform.faceTowards(heading);
        velocity.linear = fixedDeltaTime > 0.0f ? step / fixedDeltaTime : Vec3{0.0f};
    }
}

} // namespace salvo::world
