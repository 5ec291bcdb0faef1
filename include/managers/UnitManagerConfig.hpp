/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef UNIT_MANAGER_CONFIG_HPP
#define UNIT_MANAGER_CONFIG_HPP

#include "ai/BehaviorConfig.hpp"
#include "controllers/combat/CombatConfig.hpp"
#include <cstddef>
#include <cstdint>

namespace Warband {

/**
 * @brief Tuning for UnitManager and the controllers it owns
 *
 * Physics values are the defaults for units whose definition carries no
 * physics overrides.
 */
struct UnitManagerConfig {
    bool enabled = true;                // update() is a no-op when false
    size_t maxUnits = 1000;             // hard spawn ceiling

    // Collision separation
    bool enableCollision = true;
    float minDistance = 1.0f;           // pairs closer than this are pushed apart
    float pushStrength = 0.5f;          // fraction of the overlap corrected per frame

    // Physics
    float knockbackFriction = 0.9f;     // knockback velocity multiplier per update
    float velocityThreshold = 0.0001f;  // squared speed below which a channel snaps to zero
    float defaultMass = 1.0f;
    float velocityDecay = 0.0f;         // fraction of velocity lost per second (0 = none)
    bool enableGravity = false;
    float gravityForce = 9.8f;
    bool snapToTerrainOnSpawn = true;   // only with a TerrainQuery attached

    uint32_t randomSeed = 0;            // AI RNG seed, 0 = nondeterministic

    AIBehaviorConfig ai{};              // units whose definition has no AI config
    CombatConfig combat{};              // units whose definition has no combat config
};

} // namespace Warband

#endif // UNIT_MANAGER_CONFIG_HPP
