/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef TEST_UNIT_DEFINITIONS_HPP
#define TEST_UNIT_DEFINITIONS_HPP

#include "entities/Unit.hpp"
#include <optional>
#include <string>

// Shared unit templates for the test suites
namespace TestUnits {

inline UnitDefinition makeDefinition(const std::string& id, UnitType type, float health = 100.0f,
                                     float radius = 0.5f) {
    UnitDefinition definition;
    definition.id = id;
    definition.type = type;
    definition.stats.health = health;
    definition.stats.collisionRadius = radius;
    return definition;
}

inline UnitDefinition player() {
    return makeDefinition("player", UnitType::Player);
}

// Enemy with a fixed, non-random AI setup (target updates every frame)
inline UnitDefinition enemy(const std::string& id = "enemy", float health = 100.0f) {
    UnitDefinition definition = makeDefinition(id, UnitType::Enemy, health);
    Warband::AIBehaviorConfig ai;
    ai.detectionRange = 10.0f;
    ai.attackRange = 1.5f;
    ai.speed = 4.0f;
    ai.targetUpdateInterval = 0.0f;
    ai.pauseDurationMax = 0.0f;
    definition.ai = ai;
    return definition;
}

inline UnitDefinition dummy(const std::string& id = "dummy", float health = 100.0f) {
    return makeDefinition(id, UnitType::NPC, health);
}

} // namespace TestUnits

#endif // TEST_UNIT_DEFINITIONS_HPP
