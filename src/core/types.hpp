#pragma once

/**
 * @file types.hpp
 * @brief Fundamental type aliases and error handling
 */

#include <cstdint>
#include <cstddef>
#include <chrono>
#include <expected>
#include <string>

namespace salvo {

// ============================================================================
// Integer / Float Aliases
// ============================================================================

using i8  = std::int8_t;
using i16 = std::int16_t;
using i32 = std::int32_t;
using i64 = std::int64_t;

using u8  = std::uint8_t;
using u16 = std::uint16_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;

using f32 = float;
using f64 = double;

// ============================================================================
// Game Identifiers
// ============================================================================

using Tick = u64;
using Clock = std::chrono::steady_clock;

/// Millisecond offset on a fire timeline (fractional when timeFactor != 1)
using TimeMs = f64;

using PlayerId = u32;
using TargetId = u32;
using ProjectileId = u32;
using WeaponInstanceId = u64;

constexpr PlayerId INVALID_PLAYER_ID = 0xFFFFFFFF;
constexpr TargetId INVALID_TARGET_ID = 0xFFFFFFFF;
constexpr ProjectileId INVALID_PROJECTILE_ID = 0xFFFFFFFF;

// ============================================================================
// Error Handling
// ============================================================================

/**
 * @brief Error carried by a failed Result
 */
struct Error {
    std::string message;
};

/// Value-or-error return type used throughout the code base
template<typename T>
using Result = std::expected<T, Error>;

} // namespace salvo
