#pragma once

/**
 * @file timeline_json.hpp
 * @brief JSON payloads for timeline broadcasts
 */

#include "sim/timeline.hpp"

#include <nlohmann/json.hpp>

namespace salvo::sim {

nlohmann::json vec3ToJson(const Vec3& v);

/// One event as a JSON object tagged with "type"
nlohmann::json eventToJson(const TimelineEvent& event);

/// Whole timeline as a JSON array in stored order
nlohmann::json timelineToJson(const Timeline& timeline);

} // namespace salvo::sim
