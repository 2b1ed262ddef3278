#include "gameplay/event_bus.hpp"
#include "core/logging/logger.hpp"

namespace salvo::gameplay {

void LogEventBus::broadcast(const std::string& eventName, const nlohmann::json& payload) {
    ++m_count;
    if (eventName == events::FULL_PROJECTILE_TIMELINE) {
        LOG_DEBUG("[bus] {} ({} events)", eventName, payload.size());
        return;
    }
    LOG_DEBUG("[bus] {} {}", eventName, payload.dump());
}

} // namespace salvo::gameplay
