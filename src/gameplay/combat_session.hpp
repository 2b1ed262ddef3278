#pragma once

/**
 * @file combat_session.hpp
 * @brief Per-match fire resolution: simulate, broadcast, schedule
 */

#include "core/types.hpp"
#include "sim/simulation_config.hpp"
#include "sim/timeline.hpp"
#include "sim/timeline_scheduler.hpp"
#include "sim/timer_queue.hpp"
#include "gameplay/event_bus.hpp"
#include "gameplay/impact_resolver.hpp"
#include "gameplay/weapons/weapon.hpp"

#include <memory>
#include <random>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace salvo::gameplay {

/**
 * @brief Settings of one match
 */
struct SessionConfig {
    TimeMs turnChangeDelayMs = 4000.0;  ///< Grace period after the last event
    u32 rngSeed = 0;                    ///< 0 draws a seed from std::random_device
    sim::SimulationConfig simulation;
};

/**
 * @brief Turn state machine hook
 */
class TurnListener {
public:
    virtual ~TurnListener() = default;

    /// Called once per fire, turnChangeDelay after its last event
    virtual void onFireSequenceComplete(TimeMs finalEventTimeMs) = 0;
};

/**
 * @brief Result of an accepted fire
 */
struct FireReceipt {
    u64 fireId = 0;
    std::shared_ptr<const sim::Timeline> timeline;
    size_t projectileCount = 0;
    TimeMs finalEventTime = 0.0;
};

/**
 * @brief Combat core of one match
 *
 * fire() resolves the whole outcome synchronously, broadcasts the frozen
 * timeline once, hands it to the scheduler and arms the turn callback.
 * teardown() cancels every outstanding timer of the match; it is idempotent
 * and runs on destruction. Collaborators and the host must outlive the
 * session.
 */
class CombatSession {
public:
    CombatSession(const SessionConfig& config,
                  sim::SchedulerHost& host,
                  world::HeightField* heightField,
                  world::DamageResolution* agents,
                  world::DynamicTargetRegistry* targets,
                  EventBus& bus);
    ~CombatSession();

    CombatSession(const CombatSession&) = delete;
    CombatSession& operator=(const CombatSession&) = delete;

    /// Fire by catalog code; unknown codes fail without side effects
    Result<FireReceipt> fire(std::string_view weaponCode, const FireRequest& request);
    Result<FireReceipt> fire(WeaponCode code, const FireRequest& request);

    /// Cancel all pending effects and turn callbacks
    void teardown();
    bool isTornDown() const { return m_tornDown; }

    void setTurnListener(TurnListener* listener) { m_turnListener = listener; }

    /// Playbacks with effects still pending
    size_t activePlaybacks() const;

    /// Turn callbacks armed but not yet delivered
    size_t pendingTurnCallbacks() const { return m_turnTokens.size(); }

    const SessionConfig& config() const { return m_config; }

private:
    void onSequenceComplete(u64 fireId, TimeMs finalEventTime);
    void pruneFinished();

    SessionConfig m_config;
    sim::SchedulerHost& m_host;
    world::HeightField* m_heightField;
    world::DynamicTargetRegistry* m_targets;
    EventBus& m_bus;
    ImpactResolver m_resolver;
    TurnListener* m_turnListener = nullptr;

    std::vector<std::unique_ptr<sim::ScheduledPlayback>> m_playbacks;
    std::unordered_map<u64, sim::CancelToken> m_turnTokens;

    std::mt19937 m_seedSource;
    u64 m_nextFireId = 1;
    bool m_tornDown = false;
};

} // namespace salvo::gameplay
