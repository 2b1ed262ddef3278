#pragma once

#include "core/types.hpp"
#include "core/math/math.hpp"
#include <entt/entt.hpp>

namespace salvo::ecs {

/**
 * @brief Velocity component
 */
struct VelocityComponent {
    Vec3 linear{0.0f};
};

/**
 * @brief Bounding sphere used for mid-air projectile hits
 */
struct BoundingSphereComponent {
    f32 radius = 100.0f;
};

/**
 * @brief Waypoint flight state for airborne targets
 * 
 * Speeds are in world units per second.
 */
struct FlightComponent {
    Vec3 waypoint{0.0f};            ///< Current destination
    f32 currentSpeed = 0.0f;        ///< Current ground speed
    f32 maxSpeed = 100.0f;          ///< Cruise speed
    f32 acceleration = 10.0f;       ///< Speed gain per second
    f32 deceleration = 15.0f;       ///< Speed loss per second when arriving
    f32 arrivalThreshold = 5.0f;    ///< Distance at which a waypoint counts as reached
    f32 minHeightAboveTerrain = 75.0f;
    f32 heightLerpSpeed = 0.5f;     ///< Fraction of the height error corrected per second
};

} // namespace salvo::ecs
