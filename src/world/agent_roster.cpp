#include "world/agent_roster.hpp"
#include "world/height_field.hpp"
#include "ecs/components/transform.hpp"
#include "ecs/components/combatant.hpp"
#include "core/logging/logger.hpp"

#include <algorithm>

namespace salvo::world {

AgentRoster::AgentRoster(ecs::World& world)
    : m_world(world) {
}

Result<void> AgentRoster::spawnAgent(PlayerId id, const std::string& name, Vec3 position,
                                     f32 health, f32 armor, f32 shield) {
    if (find(id) != entt::null) {
        return std::unexpected(Error{"Agent already exists: " + std::to_string(id)});
    }

    auto entity = m_world.createEntity();
    m_world.addComponent<ecs::AgentComponent>(entity, ecs::AgentComponent{id, name, true});
    m_world.addComponent<ecs::HealthComponent>(entity, ecs::HealthComponent{health, health, armor, shield});
    auto& transform = m_world.addComponent<ecs::TransformComponent>(entity);
    transform.position = position;

    LOG_DEBUG("Agent {} ({}) spawned at ({:.1f}, {:.1f}, {:.1f})", id, name, position.x, position.y, position.z);
    return {};
}

std::vector<AgentSnapshot> AgentRoster::livingAgents() const {
    std::vector<AgentSnapshot> agents;
    const auto& registry = m_world.getRegistry();
    auto view = registry.view<const ecs::AgentComponent, const ecs::TransformComponent>();

    for (auto [entity, agent, transform] : view.each()) {
        if (!agent.isAlive) continue;
        agents.push_back(AgentSnapshot{agent.playerId, transform.position});
    }

    std::sort(agents.begin(), agents.end(),
              [](const AgentSnapshot& a, const AgentSnapshot& b) { return a.id < b.id; });
    return agents;
}

Result<DamageDistribution> AgentRoster::applyDamage(PlayerId id, f32 amount) {
    const auto entity = find(id);
    if (entity == entt::null) {
        return std::unexpected(Error{"Unknown agent: " + std::to_string(id)});
    }

    auto& agent = m_world.getComponent<ecs::AgentComponent>(entity);
    if (!agent.isAlive) {
        return std::unexpected(Error{"Agent already defeated: " + std::to_string(id)});
    }

    auto& pool = m_world.getComponent<ecs::HealthComponent>(entity);
    DamageDistribution result = distributeDamage(pool, amount);
    if (result.destroyed) {
        agent.isAlive = false;
        LOG_INFO("Agent {} ({}) defeated", id, agent.name);
    }
    return result;
}

Result<void> AgentRoster::addArmor(PlayerId id, f32 amount) {
    const auto entity = find(id);
    if (entity == entt::null) {
        return std::unexpected(Error{"Unknown agent: " + std::to_string(id)});
    }
    m_world.getComponent<ecs::HealthComponent>(entity).armor += amount;
    return {};
}

Result<void> AgentRoster::addShield(PlayerId id, f32 amount) {
    const auto entity = find(id);
    if (entity == entt::null) {
        return std::unexpected(Error{"Unknown agent: " + std::to_string(id)});
    }
    m_world.getComponent<ecs::HealthComponent>(entity).shield += amount;
    return {};
}

void AgentRoster::onTerrainChanged(const HeightField& heightField) {
    auto view = m_world.view<ecs::AgentComponent, ecs::TransformComponent>();
    for (auto [entity, agent, transform] : view.each()) {
        transform.position.y = heightField.heightAt(transform.position.x, transform.position.z);
    }
}

std::optional<f32> AgentRoster::healthOf(PlayerId id) const {
    const auto entity = find(id);
    if (entity == entt::null) {
        return std::nullopt;
    }
    return m_world.getComponent<ecs::HealthComponent>(entity).health;
}

std::optional<Vec3> AgentRoster::positionOf(PlayerId id) const {
    const auto entity = find(id);
    if (entity == entt::null) {
        return std::nullopt;
    }
    return m_world.getComponent<ecs::TransformComponent>(entity).position;
}

size_t AgentRoster::livingCount() const {
    return livingAgents().size();
}

entt::entity AgentRoster::find(PlayerId id) const {
    const auto& registry = m_world.getRegistry();
    auto view = registry.view<const ecs::AgentComponent>();
    for (auto entity : view) {
        if (view.get<const ecs::AgentComponent>(entity).playerId == id) {
            return entity;
        }
    }
    return entt::null;
}

} // namespace salvo::world
