#include "gameplay/combat_session.hpp"
#include "sim/fire_context.hpp"
#include "sim/timeline_json.hpp"
#include "core/logging/logger.hpp"

#include <algorithm>
#include <string>

namespace salvo::gameplay {

namespace {

u32 sessionSeed(u32 configured) {
    if (configured != 0) {
        return configured;
    }
    std::random_device device;
    return device();
}

} // namespace

CombatSession::CombatSession(const SessionConfig& config,
                             sim::SchedulerHost& host,
                             world::HeightField* heightField,
                             world::DamageResolution* agents,
                             world::DynamicTargetRegistry* targets,
                             EventBus& bus)
    : m_config(config)
    , m_host(host)
    , m_heightField(heightField)
    , m_targets(targets)
    , m_bus(bus)
    , m_resolver(heightField, agents, targets, bus)
    , m_seedSource(sessionSeed(config.rngSeed)) {
}

CombatSession::~CombatSession() {
    teardown();
}

Result<FireReceipt> CombatSession::fire(std::string_view weaponCode, const FireRequest& request) {
    if (m_tornDown) {
        LOG_ERROR("Fire of {} rejected: match already torn down", weaponCode);
        return std::unexpected(Error{"Match has been torn down"});
    }

    const auto code = parseWeaponCode(weaponCode);
    if (!code) {
        LOG_ERROR("Fire rejected: unknown weapon code '{}'", weaponCode);
        return std::unexpected(Error{"Unknown weapon code: " + std::string(weaponCode)});
    }
    return fire(*code, request);
}

Result<FireReceipt> CombatSession::fire(WeaponCode code, const FireRequest& request) {
    if (code >= WeaponCode::Count) {
        LOG_ERROR("Fire rejected: weapon id {} out of range", static_cast<int>(code));
        return std::unexpected(Error{"No weapon for code " + std::to_string(static_cast<int>(code))});
    }
    if (m_tornDown) {
        LOG_ERROR("Fire of {} rejected: match already torn down", getWeaponData(code).code);
        return std::unexpected(Error{"Match has been torn down"});
    }
    if (auto valid = sim::validateConfig(m_config.simulation); !valid) {
        LOG_ERROR("Fire of {} rejected: {}", getWeaponData(code).code, valid.error().message);
        return std::unexpected(valid.error());
    }

    auto weapon = createWeapon(code);
    if (!weapon) {
        return std::unexpected(Error{"No weapon for code " + std::to_string(static_cast<int>(code))});
    }

    auto timeline = std::make_shared<sim::Timeline>();
    {
        // Handlers live only as long as the fire's context
        sim::SimulationContext context(m_config.simulation, m_heightField, m_targets, m_seedSource());
        auto fired = weapon->fire(request, *timeline, context);
        if (!fired) {
            LOG_WARN("{} fire failed: {}", weapon->data().code, fired.error().message);
            return std::unexpected(fired.error());
        }
    }
    timeline->freeze();

    FireReceipt receipt;
    receipt.fireId = m_nextFireId++;
    receipt.timeline = timeline;
    receipt.projectileCount = timeline->projectileCount();
    receipt.finalEventTime = timeline->maxTime();

    m_bus.broadcast(events::FULL_PROJECTILE_TIMELINE, sim::timelineToJson(*timeline));

    pruneFinished();
    m_playbacks.push_back(std::make_unique<sim::ScheduledPlayback>(
        receipt.timeline, m_host, m_resolver, m_host.now()));

    const u64 fireId = receipt.fireId;
    const TimeMs finalTime = receipt.finalEventTime;
    m_turnTokens.emplace(fireId, m_host.scheduleCallback(finalTime + m_config.turnChangeDelayMs,
        [this, fireId, finalTime]() { onSequenceComplete(fireId, finalTime); }));

    LOG_INFO("Fire {} ({}): {} projectiles, {} events, last at {:.0f} ms",
             receipt.fireId, weapon->data().code, receipt.projectileCount, timeline->size(), finalTime);
    return receipt;
}

void CombatSession::teardown() {
    if (m_tornDown) {
        return;
    }
    m_tornDown = true;

    for (auto& playback : m_playbacks) {
        playback->cancel();
    }
    for (const auto& [fireId, token] : m_turnTokens) {
        m_host.cancel(token);
    }
    m_turnTokens.clear();
    m_resolver.detach();

    LOG_INFO("Combat session torn down ({} playbacks cancelled)", m_playbacks.size());
    m_playbacks.clear();
}

size_t CombatSession::activePlaybacks() const {
    return static_cast<size_t>(std::count_if(m_playbacks.begin(), m_playbacks.end(),
        [](const auto& playback) { return !playback->isCancelled() && !playback->isComplete(); }));
}

void CombatSession::onSequenceComplete(u64 fireId, TimeMs finalEventTime) {
    if (m_tornDown) {
        return;
    }
    m_turnTokens.erase(fireId);

    m_bus.broadcast(events::FIRE_SEQUENCE_COMPLETE, {
        {"fireId", fireId},
        {"finalEventTime", finalEventTime},
    });

    if (m_turnListener) {
        m_turnListener->onFireSequenceComplete(finalEventTime);
    }
    pruneFinished();
}

void CombatSession::pruneFinished() {
    std::erase_if(m_playbacks, [](const auto& playback) {
        return playback->isCancelled() || playback->isComplete();
    });
}

} // namespace salvo::gameplay
