#include "ecs/world/world.hpp"
#include "ecs/systems/system.hpp"
#include "core/logging/logger.hpp"

namespace salvo::ecs {

World::~World() {
    clear();
}

entt::entity World::createEntity() {
    return m_registry.create();
}

void World::destroyEntity(entt::entity entity) {
    if (m_registry.valid(entity)) {
        m_registry.destroy(entity);
    }
}

void World::fixedUpdate(f32 fixedDeltaTime) {
    for (auto& phase : m_systems) {
        for (auto& system : phase) {
            if (system->isEnabled()) {
                system->fixedUpdate(m_registry, fixedDeltaTime);
            }
        }
    }

    ++m_currentTick;
}

void World::clear() {
    for (auto& phase : m_systems) {
        for (auto& system : phase) {
            system->shutdown(m_registry);
        }
        phase.clear();
    }

    m_registry.clear();

    LOG_DEBUG("Match world cleared after {} ticks", m_currentTick);
    m_currentTick = 0;
}

} // namespace salvo::ecs
