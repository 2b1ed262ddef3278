#include "sim/fire_context.hpp"
#include "sim/projectile_simulator.hpp"
#include "core/logging/logger.hpp"

#include <algorithm>

namespace salvo::sim {

/// Tracks handler re-entry depth for the lifetime of one simulate() call
class DepthGuard {
public:
    explicit DepthGuard(SimulationContext& context) : m_context(context) { ++m_context.m_depth; }
    ~DepthGuard() { --m_context.m_depth; }

    DepthGuard(const DepthGuard&) = delete;
    DepthGuard& operator=(const DepthGuard&) = delete;

private:
    SimulationContext& m_context;
};

SimulationContext::SimulationContext(const SimulationConfig& config,
                                     const world::HeightField* heightField,
                                     const world::DynamicTargetRegistry* targets,
                                     u32 seed)
    : m_config(config)
    , m_heightField(heightField)
    , m_targets(targets)
    , m_rng(seed) {
    if (m_targets) {
        m_ledger = m_targets->liveTargets();
    }
}

WeaponInstanceId SimulationContext::registerHandler(WeaponHandler handler) {
    const WeaponInstanceId id = m_nextInstanceId++;
    m_handlers.emplace(id, std::move(handler));
    return id;
}

const WeaponHandler* SimulationContext::findHandler(WeaponInstanceId id) const {
    auto it = m_handlers.find(id);
    return it != m_handlers.end() ? &it->second : nullptr;
}

Result<ProjectileOutcome> SimulationContext::simulate(const ProjectileSpec& spec, TimeMs startTime,
                                                      Timeline& timeline) {
    if (auto valid = validateConfig(m_config); !valid) {
        return std::unexpected(valid.error());
    }
    if (m_depth >= m_config.maxRecursionDepth) {
        return std::unexpected(Error{fmt::format(
            "Recursion depth limit {} reached", m_config.maxRecursionDepth)});
    }

    auto normalized = normalizeSpec(spec);
    if (!normalized) {
        return std::unexpected(normalized.error());
    }

    DepthGuard guard(*this);
    ++m_produced;
    return simulateProjectile(*normalized, std::max(0.0, startTime), timeline, *this);
}

std::optional<ProjectileOutcome> SimulationContext::spawnChild(const ProjectileSpec& spec, TimeMs startTime,
                                                               Timeline& timeline) {
    auto outcome = simulate(spec, startTime, timeline);
    if (!outcome) {
        LOG_WARN("Skipping {} child at {:.0f} ms: {}", spec.weaponCode, startTime, outcome.error().message);
        return std::nullopt;
    }
    return *outcome;
}

f32 SimulationContext::random() {
    return m_unit(m_rng);
}

std::vector<world::TargetSnapshot> SimulationContext::liveTargets() const {
    std::vector<world::TargetSnapshot> live;
    for (const auto& target : m_ledger) {
        if (target.health > 0.0f) {
            live.push_back(target);
        }
    }
    return live;
}

std::vector<world::TargetSnapshot> SimulationContext::liveTargetsAt(TimeMs timeMs) const {
    std::vector<world::TargetSnapshot> live = liveTargets();
    if (m_targets) {
        for (auto& target : live) {
            if (auto predicted = m_targets->predictedPositionAt(target.id, timeMs)) {
                target.position = *predicted;
            }
        }
    }
    return live;
}

std::optional<Vec3> SimulationContext::predictedTargetPosition(TargetId id, TimeMs timeMs) const {
    auto it = std::find_if(m_ledger.begin(), m_ledger.end(),
                           [id](const world::TargetSnapshot& t) { return t.id == id; });
    if (it == m_ledger.end() || it->health <= 0.0f) {
        return std::nullopt;
    }
    if (m_targets) {
        if (auto predicted = m_targets->predictedPositionAt(id, timeMs)) {
            return predicted;
        }
    }
    return it->position;
}

bool SimulationContext::recordTargetDamage(TargetId id, f32 amount) {
    auto it = std::find_if(m_ledger.begin(), m_ledger.end(),
                           [id](const world::TargetSnapshot& t) { return t.id == id; });
    if (it == m_ledger.end() || it->health <= 0.0f) {
        return false;
    }
    it->health -= amount;
    return it->health <= 0.0f;
}

} // namespace salvo::sim
