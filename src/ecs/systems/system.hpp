#pragma once

#include "core/types.hpp"
#include <entt/entt.hpp>

namespace salvo::ecs {

/**
 * @brief Per-tick behavior over the match registry
 */
class System {
public:
    virtual ~System() = default;

    /// Advance by one match tick
    virtual void fixedUpdate(entt::registry& registry, f32 fixedDeltaTime) = 0;

    /// Called once when registered with a World
    virtual void initialize(entt::registry& registry) {
        (void)registry;
    }

    /// Called when the World is cleared
    virtual void shutdown(entt::registry& registry) {
        (void)registry;
    }

    void setEnabled(bool enabled) { m_enabled = enabled; }
    bool isEnabled() const { return m_enabled; }

protected:
    bool m_enabled = true;
};

} // namespace salvo::ecs
