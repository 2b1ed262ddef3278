#pragma once

#include "core/types.hpp"

#include <cmath>

namespace salvo::sim {

/**
 * @brief Physics settings shared by every fire of a match
 */
struct SimulationConfig {
    f32 stepMs = 50.0f;                 ///< Fixed physics step
    f32 maxDurationMs = 10000.0f;       ///< Physics time before a projectile expires
    f32 projectileRadius = 1.0f;        ///< Radius used against target bounding spheres
    u32 maxRecursionDepth = 64;         ///< Hard cap on handler re-entry
};

/// Reject settings that would stall or invert the step loop
inline Result<void> validateConfig(const SimulationConfig& config) {
    if (!std::isfinite(config.stepMs) || config.stepMs <= 0.0f) {
        return std::unexpected(Error{"Simulation step must be positive"});
    }
    if (!std::isfinite(config.maxDurationMs) || config.maxDurationMs <= 0.0f) {
        return std::unexpected(Error{"Maximum flight duration must be positive"});
    }
    if (!std::isfinite(config.projectileRadius) || config.projectileRadius < 0.0f) {
        return std::unexpected(Error{"Projectile radius must not be negative"});
    }
    return {};
}

} // namespace salvo::sim
