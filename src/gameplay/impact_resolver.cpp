#include "gameplay/impact_resolver.hpp"
#include "world/damage.hpp"
#include "sim/timeline_json.hpp"
#include "core/logging/logger.hpp"

namespace salvo::gameplay {

ImpactResolver::ImpactResolver(world::HeightField* heightField,
                               world::DamageResolution* agents,
                               world::DynamicTargetRegistry* targets,
                               EventBus& bus)
    : m_heightField(heightField)
    , m_agents(agents)
    , m_targets(targets)
    , m_bus(bus) {
}

void ImpactResolver::onImpact(const sim::ImpactEvent& impact) {
    if (m_detached) {
        return;
    }

    if (impact.isTargetHit()) {
        applyTargetImpact(impact);
    } else {
        applyTerrainImpact(impact);
    }
    ++m_impactsApplied;
}

void ImpactResolver::onTargetDestroyed(const sim::TargetDestroyedEvent& event) {
    if (m_detached || !m_targets) {
        return;
    }

    if (!m_targets->remove(event.targetId)) {
        LOG_DEBUG("Target {} already gone at {:.0f} ms", event.targetId, event.time);
        return;
    }

    m_bus.broadcast(events::TARGET_DESTROYED, {
        {"targetId", event.targetId},
        {"position", sim::vec3ToJson(event.position)},
    });
    LOG_INFO("Target {} destroyed", event.targetId);
}

void ImpactResolver::detach() {
    m_detached = true;
    m_heightField = nullptr;
    m_agents = nullptr;
    m_targets = nullptr;
}

// ============================================================================
// Terrain
// ============================================================================

void ImpactResolver::applyTerrainImpact(const sim::ImpactEvent& impact) {
    if (m_heightField && impact.craterSize > 0.0f) {
        const auto cells = m_heightField->deform(impact.position.x, impact.position.z,
                                                 impact.craterSize, world::DeformMode::Crater);
        if (!cells.empty()) {
            nlohmann::json patch = nlohmann::json::array();
            for (const auto& cell : cells) {
                patch.push_back({{"index", cell.index}, {"height", cell.height}});
            }
            m_bus.broadcast(events::TERRAIN_MODIFIED, {
                {"x", impact.position.x},
                {"z", impact.position.z},
                {"radius", impact.craterSize},
                {"mode", "crater"},
                {"patch", std::move(patch)},
            });
        }
    }

    if (!m_agents) {
        return;
    }

    for (const auto& agent : m_agents->livingAgents()) {
        const f32 distance = math::distanceXZ(agent.position, impact.position);
        const f32 damage = world::falloffDamage(impact.baseDamage, distance, impact.aoeSize);
        if (damage <= 0.0f) continue;

        auto result = m_agents->applyDamage(agent.id, damage);
        if (!result) {
            LOG_WARN("Could not damage agent {}: {}", agent.id, result.error().message);
            continue;
        }

        m_bus.broadcast(events::PLAYER_DAMAGED, {
            {"id", agent.id},
            {"damage", damage},
            {"damageDistribution", {
                {"shieldDamage", result->shieldDamage},
                {"armorDamage", result->armorDamage},
                {"healthDamage", result->healthDamage},
            }},
            {"currentHealth", result->remainingHealth},
        });

        if (result->destroyed) {
            m_bus.broadcast(events::PLAYER_DEFEATED, {{"id", agent.id}});
        }
    }

    if (m_heightField) {
        m_agents->onTerrainChanged(*m_heightField);
    }
}

// ============================================================================
// Dynamic Targets
// ============================================================================

void ImpactResolver::applyTargetImpact(const sim::ImpactEvent& impact) {
    if (!m_targets) {
        return;
    }

    for (const auto& hit : impact.targetHits) {
        auto result = m_targets->applyDamage(hit.targetId, hit.damage);
        if (!result) {
            LOG_DEBUG("Skipping damage on target {}: {}", hit.targetId, result.error().message);
            continue;
        }

        m_bus.broadcast(events::TARGET_DAMAGED, {
            {"targetId", hit.targetId},
            {"damage", hit.damage},
            {"remainingHealth", result->remainingHealth},
        });
    }
}

} // namespace salvo::gameplay
