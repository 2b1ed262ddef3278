#pragma once

/**
 * @file ecs.hpp
 * @brief Match entity store (EnTT)
 *
 * Components for agents and dynamic targets, the World that owns them and
 * the System interface the server tick loop drives.
 */

#include "ecs/components/transform.hpp"
#include "ecs/components/physics.hpp"
#include "ecs/components/combatant.hpp"
#include "ecs/world/world.hpp"
#include "ecs/systems/system.hpp"
