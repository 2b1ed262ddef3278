#pragma once

#include "core/types.hpp"
#include <entt/entt.hpp>
#include <array>
#include <vector>
#include <memory>

namespace salvo::ecs {

class System;

/**
 * @brief Order in which registered systems run within one match tick
 */
enum class SystemPhase {
    PreSimulation,  ///< Orders and AI decisions
    Simulation,     ///< Movement of agents and targets
    PostSimulation  ///< Bookkeeping after movement
};

/**
 * @brief Entity store of one match
 *
 * Agents and dynamic targets live here as entities. The server tick loop
 * advances the registered systems with fixedUpdate(); combat resolution
 * reads and writes the components through the rosters.
 */
class World {
public:
    World() = default;
    ~World();

    World(const World&) = delete;
    World& operator=(const World&) = delete;

    entt::registry& getRegistry() { return m_registry; }
    const entt::registry& getRegistry() const { return m_registry; }

    // ========================================================================
    // Entities
    // ========================================================================

    entt::entity createEntity();

    /// Destroy an entity (ignored if already gone)
    void destroyEntity(entt::entity entity);

    template<typename T, typename... Args>
    T& addComponent(entt::entity entity, Args&&... args) {
        return m_registry.emplace<T>(entity, std::forward<Args>(args)...);
    }

    template<typename T>
    T& getComponent(entt::entity entity) {
        return m_registry.get<T>(entity);
    }

    template<typename T>
    const T& getComponent(entt::entity entity) const {
        return m_registry.get<T>(entity);
    }

    template<typename... Components>
    auto view() {
        return m_registry.view<Components...>();
    }

    // ========================================================================
    // Systems
    // ========================================================================

    /// Construct, initialize and register a system in `phase`
    template<typename T, typename... Args>
    T* registerSystem(SystemPhase phase, Args&&... args) {
        auto system = std::make_unique<T>(std::forward<Args>(args)...);
        T* ptr = system.get();
        ptr->initialize(m_registry);
        m_systems[static_cast<size_t>(phase)].push_back(std::move(system));
        return ptr;
    }

    /// Run one match tick of every enabled system
    void fixedUpdate(f32 fixedDeltaTime);

    /// Shut down every system and drop every entity
    void clear();

    /// Ticks advanced since creation or the last clear()
    Tick currentTick() const { return m_currentTick; }

private:
    static constexpr size_t PHASE_COUNT = 3;

    entt::registry m_registry;
    std::array<std::vector<std::unique_ptr<System>>, PHASE_COUNT> m_systems;
    Tick m_currentTick = 0;
};

} // namespace salvo::ecs
