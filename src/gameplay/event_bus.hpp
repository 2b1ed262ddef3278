#pragma once

/**
 * @file event_bus.hpp
 * @brief Outbound notifications for match observers
 */

#include "core/types.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace salvo::gameplay {

namespace events {
constexpr const char* FULL_PROJECTILE_TIMELINE = "fullProjectileTimeline";
constexpr const char* TERRAIN_MODIFIED = "terrainModified";
constexpr const char* PLAYER_DAMAGED = "playerDamaged";
constexpr const char* PLAYER_DEFEATED = "playerDefeated";
constexpr const char* TARGET_DAMAGED = "targetDamaged";
constexpr const char* TARGET_DESTROYED = "targetDestroyed";
constexpr const char* FIRE_SEQUENCE_COMPLETE = "fireSequenceComplete";
}

/**
 * @brief Broadcast channel to every observer of a match
 */
class EventBus {
public:
    virtual ~EventBus() = default;

    virtual void broadcast(const std::string& eventName, const nlohmann::json& payload) = 0;
};

/**
 * @brief Bus that writes every broadcast to the log
 */
class LogEventBus final : public EventBus {
public:
    void broadcast(const std::string& eventName, const nlohmann::json& payload) override;

    size_t broadcastCount() const { return m_count; }

private:
    size_t m_count = 0;
};

} // namespace salvo::gameplay
