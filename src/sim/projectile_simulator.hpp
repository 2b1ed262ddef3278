#pragma once

/**
 * @file projectile_simulator.hpp
 * @brief Fixed-step flight of one projectile to its terminal event
 */

#include "sim/fire_context.hpp"

namespace salvo::sim {

/**
 * @brief Simulate a validated spec into `timeline`
 *
 * Emits one Spawn, one Move per step that ends above ground, and exactly
 * one terminal event (Impact or Expired). Target impacts also emit
 * TargetDestroyed for every target the ledger predicts destroyed. When the
 * projectile is not final and carries a weapon instance, the registered
 * handler runs synchronously on the Impact before this returns.
 *
 * Callers go through SimulationContext::simulate, which validates the spec
 * and enforces the recursion limit.
 */
ProjectileOutcome simulateProjectile(const ProjectileSpec& spec, TimeMs startTime,
                                     Timeline& timeline, SimulationContext& context);

} // namespace salvo::sim
