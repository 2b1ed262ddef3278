#pragma once

/**
 * @file impact_resolver.hpp
 * @brief Applies played-back impacts to the match world
 */

#include "sim/timeline_scheduler.hpp"
#include "world/height_field.hpp"
#include "world/agent_roster.hpp"
#include "world/target_registry.hpp"
#include "gameplay/event_bus.hpp"

namespace salvo::gameplay {

/**
 * @brief Authoritative side effects of Impact and TargetDestroyed events
 *
 * Terrain impacts dig a crater and damage living agents by horizontal
 * distance. Target impacts apply the per-target damage resolved during
 * simulation. Each effect is broadcast on the bus. A detached resolver
 * (match torn down) ignores everything.
 */
class ImpactResolver final : public sim::EffectSink {
public:
    ImpactResolver(world::HeightField* heightField,
                   world::DamageResolution* agents,
                   world::DynamicTargetRegistry* targets,
                   EventBus& bus);

    void onImpact(const sim::ImpactEvent& impact) override;
    void onTargetDestroyed(const sim::TargetDestroyedEvent& event) override;

    /// Drop every collaborator; later effects are ignored
    void detach();
    bool isDetached() const { return m_detached; }

    size_t impactsApplied() const { return m_impactsApplied; }

private:
    void applyTerrainImpact(const sim::ImpactEvent& impact);
    void applyTargetImpact(const sim::ImpactEvent& impact);

    world::HeightField* m_heightField;
    world::DamageResolution* m_agents;
    world::DynamicTargetRegistry* m_targets;
    EventBus& m_bus;

    bool m_detached = false;
    size_t m_impactsApplied = 0;
};

} // namespace salvo::gameplay
