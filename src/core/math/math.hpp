#pragma once

/**
 * @file math.hpp
 * @brief Math types and helpers (glm based)
 */

#include "core/types.hpp"

#include <glm/glm.hpp>
#include <glm/gtc/constants.hpp>
#include <glm/gtc/quaternion.hpp>

#include <algorithm>
#include <cmath>

namespace salvo {

using Vec3 = glm::vec3;
using Quat = glm::quat;

namespace math {

constexpr f32 PI = glm::pi<f32>();
constexpr f32 TWO_PI = glm::two_pi<f32>();
constexpr f32 EPSILON = 1e-6f;

inline const Vec3 UP{0.0f, 1.0f, 0.0f};

template<typename T>
inline T clamp(T value, T lo, T hi) { return std::clamp(value, lo, hi); }

inline f32 lengthSquared(const Vec3& v) { return glm::dot(v, v); }

/// True when two spheres overlap or touch
inline bool spheresTouch(const Vec3& a, f32 radiusA, const Vec3& b, f32 radiusB) {
    const f32 reach = radiusA + radiusB;
    return lengthSquared(a - b) <= reach * reach;
}

/// Horizontal (XZ plane) distance between two points
inline f32 distanceXZ(const Vec3& a, const Vec3& b) {
    const f32 dx = a.x - b.x;
    const f32 dz = a.z - b.z;
    return std::sqrt(dx * dx + dz * dz);
}

inline bool isFinite(const Vec3& v) {
    return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z);
}

/// Normalize, returning `fallback` for (near) zero-length input
inline Vec3 safeNormalize(const Vec3& v, const Vec3& fallback = UP) {
    const f32 len2 = lengthSquared(v);
    if (len2 < EPSILON * EPSILON) {
        return fallback;
    }
    return v / std::sqrt(len2);
}

/**
 * @brief Reflect an incoming vector about a surface normal
 *
 * R = I - 2(I.N)N. The normal is expected to be unit length.
 */
inline Vec3 reflect(const Vec3& incoming, const Vec3& normal) {
    return incoming - normal * (2.0f * glm::dot(incoming, normal));
}

/// Rotate a vector around a unit axis by `angle` radians
inline Vec3 rotateAroundAxis(const Vec3& v, const Vec3& axis, f32 angle) {
    return glm::angleAxis(angle, axis) * v;
}

/// Rotate a vector around the world up axis
inline Vec3 rotateY(const Vec3& v, f32 angle) {
    return rotateAroundAxis(v, UP, angle);
}

/**
 * @brief Turn a unit heading toward a desired unit heading
 *
 * The rotation is capped at `maxAngle` radians. Both inputs must be unit
 * length; the result is unit length.
 */
inline Vec3 rotateTowards(const Vec3& heading, const Vec3& desired, f32 maxAngle) {
    const f32 cosAngle = clamp(glm::dot(heading, desired), -1.0f, 1.0f);
    const f32 angle = std::acos(cosAngle);
    if (angle <= maxAngle || angle < EPSILON) {
        return desired;
    }

    Vec3 axis = glm::cross(heading, desired);
    if (lengthSquared(axis) < EPSILON * EPSILON) {
        // Opposite headings: any perpendicular axis works
        axis = glm::cross(heading, std::abs(heading.y) < 0.99f ? UP : Vec3(1.0f, 0.0f, 0.0f));
    }
    return glm::normalize(rotateAroundAxis(heading, glm::normalize(axis), maxAngle));
}

} // namespace math

} // namespace salvo
