/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef BEHAVIOR_CONFIG_HPP
#define BEHAVIOR_CONFIG_HPP

namespace Warband
{

/**
 * Configuration for the unit behavior state machine
 *
 * Controls how non-player units notice the player, chase and attack it,
 * and wander around their home position when nothing is in range.
 * Distances are world units, times are seconds.
 */
struct AIBehaviorConfig
{
    // Perception
    float detectionRange = 10.0f;                 // Player within this distance triggers chase
    float attackRange = 1.5f;                     // Chase switches to attack inside this distance

    // Movement
    float speed = 4.0f;                           // Units per second while patrolling/chasing/returning
    float rotationSpeed = 10.0f;                  // Facing interpolation rate (per second)

    // Timing
    float pauseDurationMax = 5.0f;                // Upper bound of the random "thinking" pause
    float targetUpdateInterval = 3.0f;            // Upper bound of the random target reselection delay

    // Wandering
    float patrolRadius = 5.0f;                    // Patrol points are picked within this radius of home

    /**
     * Aggressive preset: notices the player sooner, moves faster and
     * re-evaluates targets more often.
     */
    static AIBehaviorConfig aggressive()
    {
        AIBehaviorConfig config;
        config.detectionRange = 15.0f;
        config.attackRange = 2.0f;
        config.speed = 6.0f;
        config.rotationSpeed = 15.0f;
        config.pauseDurationMax = 2.0f;
        config.targetUpdateInterval = 2.0f;
        return config;
    }

    /**
     * Passive preset: short sight, slow movement, long pauses.
     */
    static AIBehaviorConfig passive()
    {
        AIBehaviorConfig config;
        config.detectionRange = 5.0f;
        config.attackRange = 1.0f;
        config.speed = 2.0f;
        config.rotationSpeed = 5.0f;
        config.pauseDurationMax = 8.0f;
        config.targetUpdateInterval = 5.0f;
        return config;
    }
};

} // namespace Warband

#endif // BEHAVIOR_CONFIG_HPP
