#include "sim/timeline_json.hpp"

namespace salvo::sim {

namespace {

void addVisual(nlohmann::json& j, const VisualStyle& visual) {
    j["projectileStyle"] = visual.projectileStyle;
    j["projectileScale"] = visual.projectileScale;
    j["explosionType"] = visual.explosionType;
    j["explosionSize"] = visual.explosionSize;
}

nlohmann::json ownerToJson(PlayerId owner) {
    if (owner == INVALID_PLAYER_ID) return nullptr;
    return owner;
}

struct EventWriter {
    nlohmann::json operator()(const SpawnEvent& e) const {
        nlohmann::json j{
            {"type", "projectileSpawn"},
            {"time", e.time},
            {"projectileId", e.projectileId},
            {"playerId", ownerToJson(e.owner)},
            {"startPos", vec3ToJson(e.position)},
            {"direction", vec3ToJson(e.direction)},
            {"power", e.power},
            {"weaponCode", e.weaponCode},
            {"craterSize", e.craterSize},
            {"isFinalProjectile", e.isFinalProjectile},
            {"doesCollide", e.doesCollide},
        };
        addVisual(j, e.visual);
        return j;
    }

    nlohmann::json operator()(const MoveEvent& e) const {
        return {
            {"type", "projectileMove"},
            {"time", e.time},
            {"projectileId", e.projectileId},
            {"position", vec3ToJson(e.position)},
        };
    }

    nlohmann::json operator()(const ImpactEvent& e) const {
        nlohmann::json j{
            {"type", "projectileImpact"},
            {"time", e.time},
            {"projectileId", e.projectileId},
            {"playerId", ownerToJson(e.owner)},
            {"position", vec3ToJson(e.position)},
            {"surfaceNormal", vec3ToJson(e.normal)},
            {"isFinalProjectile", e.isFinalProjectile},
            {"craterSize", e.craterSize},
            {"aoeSize", e.aoeSize},
            {"damage", e.baseDamage},
            {"bounceCount", e.bounceCount},
            {"weaponCode", e.weaponCode},
            {"isTargetHit", e.isTargetHit()},
            {"hitTargetId", e.isTargetHit() ? nlohmann::json(e.targetId) : nlohmann::json(nullptr)},
        };
        addVisual(j, e.visual);
        return j;
    }

    nlohmann::json operator()(const ExpiredEvent& e) const {
        return {
            {"type", "projectileExpired"},
            {"time", e.time},
            {"projectileId", e.projectileId},
        };
    }

    nlohmann::json operator()(const TargetDestroyedEvent& e) const {
        return {
            {"type", "targetDestroyed"},
            {"time", e.time},
            {"projectileId", e.projectileId},
            {"targetId", e.targetId},
            {"position", vec3ToJson(e.position)},
        };
    }
};

} // namespace

nlohmann::json vec3ToJson(const Vec3& v) {
    return {{"x", v.x}, {"y", v.y}, {"z", v.z}};
}

nlohmann::json eventToJson(const TimelineEvent& event) {
    return std::visit(EventWriter{}, event);
}

nlohmann::json timelineToJson(const Timeline& timeline) {
    nlohmann::json events = nlohmann::json::array();
    for (const auto& event : timeline.events()) {
        events.push_back(eventToJson(event));
    }
    return events;
}

} // namespace salvo::sim
