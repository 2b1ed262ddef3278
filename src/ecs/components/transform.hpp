#pragma once

#include "core/types.hpp"
#include "core/math/math.hpp"
#include <entt/entt.hpp>

namespace salvo::ecs {

/**
 * @brief Transform component
 * 
 * Position and heading in world space.
 */
struct TransformComponent {
    Vec3 position{0.0f};
    Quat rotation{1.0f, 0.0f, 0.0f, 0.0f};  // Identity quaternion

    /// Face along a horizontal direction (yaw only)
    void faceTowards(Vec3 direction) {
        direction.y = 0.0f;
        if (math::lengthSquared(direction) < math::EPSILON) {
            return;
        }
        direction = glm::normalize(direction);
        rotation = glm::angleAxis(std::atan2(direction.x, direction.z), math::UP);
    }
};

} // namespace salvo::ecs
