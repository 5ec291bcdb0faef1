/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "utils/UnitConfigLoader.hpp"
#include "core/Logger.hpp"
#include <cmath>
#include <format>

namespace Warband {

bool UnitConfigLoader::loadFromFile(const std::string& path, UnitSimulationConfig& outConfig) {
    m_lastError.clear();

    JsonReader reader;
    if (!reader.loadFromFile(path)) {
        return fail(std::format("Failed to read '{}': {}", path, reader.getLastError()));
    }

    if (!parseRoot(reader.getRoot(), outConfig)) {
        return false;
    }
    CONFIG_INFO(std::format("Loaded {} unit definition(s) from {}", outConfig.definitions.size(), path));
    return true;
}

bool UnitConfigLoader::loadFromString(const std::string& json, UnitSimulationConfig& outConfig) {
    m_lastError.clear();

    JsonReader reader;
    if (!reader.parse(json)) {
        return fail(std::format("Invalid JSON: {}", reader.getLastError()));
    }
    return parseRoot(reader.getRoot(), outConfig);
}

UnitSimulationConfig UnitConfigLoader::makeDefaultConfig() {
    UnitSimulationConfig config;

    UnitDefinition human;
    human.id = "human-player";
    human.type = UnitType::Player;
    human.stats.speed = 1.0f;
    human.stats.health = 100.0f;
    human.stats.attackDamage = 25.0f;
    human.stats.collisionRadius = 0.5f;
    config.definitions.push_back(human);

    UnitDefinition zombie;
    zombie.id = "zombie-enemy";
    zombie.type = UnitType::Enemy;
    zombie.stats.speed = 0.8f;
    zombie.stats.health = 75.0f;
    zombie.stats.attackDamage = 15.0f;
    zombie.stats.collisionRadius = 0.5f;
    AIBehaviorConfig zombieAI;
    zombieAI.detectionRange = 8.0f;
    zombieAI.attackRange = 1.5f;
    zombieAI.speed = 0.8f;
    zombie.ai = zombieAI;
    config.definitions.push_back(zombie);

    return config;
}

bool UnitConfigLoader::parseRoot(const JsonValue& root, UnitSimulationConfig& outConfig) {
    if (!root.isObject()) {
        return fail("Root element must be an object");
    }

    // Parse into a scratch copy so a failed load leaves outConfig untouched
    UnitSimulationConfig config;

    if (root.hasKey("manager") && !parseManager(root["manager"], config.manager)) {
        return false;
    }

    if (root.hasKey("combat") && !parseCombat(root["combat"], "combat", config.manager.combat)) {
        return false;
    }

    if (root.hasKey("definitions")) {
        const JsonArray* definitions = root["definitions"].tryAsArray();
        if (!definitions) {
            return fail("'definitions' must be an array");
        }
        config.definitions.reserve(definitions->size());
        for (size_t i = 0; i < definitions->size(); ++i) {
            UnitDefinition definition;
            if (!parseDefinition((*definitions)[i], std::format("definitions[{}]", i), definition)) {
                return false;
            }
            config.definitions.push_back(std::move(definition));
        }
    }

    outConfig = std::move(config);
    return true;
}

bool UnitConfigLoader::parseManager(const JsonValue& node, UnitManagerConfig& config) {
    const std::string path = "manager";
    if (!node.isObject()) {
        return fail("'manager' must be an object");
    }

    if (!readBool(node, "enabled", path, config.enabled) ||
        !readCount(node, "maxUnits", path, config.maxUnits) ||
        !readBool(node, "enableCollision", path, config.enableCollision) ||
        !readFloat(node, "knockbackFriction", path, config.knockbackFriction) ||
        !readFloat(node, "velocityThreshold", path, config.velocityThreshold) ||
        !readFloat(node, "defaultMass", path, config.defaultMass) ||
        !readFloat(node, "velocityDecay", path, config.velocityDecay) ||
        !readBool(node, "enableGravity", path, config.enableGravity) ||
        !readFloat(node, "gravityForce", path, config.gravityForce) ||
        !readBool(node, "snapToTerrainOnSpawn", path, config.snapToTerrainOnSpawn)) {
        return false;
    }

    if (node.hasKey("randomSeed")) {
        size_t seed = 0;
        if (!readCount(node, "randomSeed", path, seed, std::numeric_limits<uint32_t>::max())) {
            return false;
        }
        config.randomSeed = static_cast<uint32_t>(seed);
    }

    if (node.hasKey("collision")) {
        const JsonValue& collision = node["collision"];
        const std::string collisionPath = path + ".collision";
        if (!collision.isObject()) {
            return fail(std::format("'{}' must be an object", collisionPath));
        }
        if (!readFloat(collision, "minDistance", collisionPath, config.minDistance) ||
            !readFloat(collision, "pushStrength", collisionPath, config.pushStrength)) {
            return false;
        }
    }

    if (node.hasKey("ai") && !parseAI(node["ai"], path + ".ai", config.ai)) {
        return false;
    }

    return true;
}

bool UnitConfigLoader::parseAI(const JsonValue& node, const std::string& path, AIBehaviorConfig& config) {
    // Either a preset name or an object, optionally based on a preset
    auto applyPreset = [&](const std::string& name) {
        if (name == "default") {
            config = AIBehaviorConfig{};
        } else if (name == "aggressive") {
            config = AIBehaviorConfig::aggressive();
        } else if (name == "passive") {
            config = AIBehaviorConfig::passive();
        } else {
            return fail(std::format("{}: unknown AI preset '{}'", path, name));
        }
        return true;
    };

    if (node.isString()) {
        return applyPreset(node.asString());
    }
    if (!node.isObject()) {
        return fail(std::format("'{}' must be an object or a preset name", path));
    }

    if (node.hasKey("preset")) {
        const auto preset = node["preset"].tryAsString();
        if (!preset) {
            return fail(std::format("{}.preset must be a string", path));
        }
        if (!applyPreset(*preset)) {
            return false;
        }
    }

    return readFloat(node, "detectionRange", path, config.detectionRange) &&
           readFloat(node, "attackRange", path, config.attackRange) &&
           readFloat(node, "speed", path, config.speed) &&
           readFloat(node, "rotationSpeed", path, config.rotationSpeed) &&
           readFloat(node, "pauseDurationMax", path, config.pauseDurationMax) &&
           readFloat(node, "targetUpdateInterval", path, config.targetUpdateInterval) &&
           readFloat(node, "patrolRadius", path, config.patrolRadius);
}

bool UnitConfigLoader::parseCombat(const JsonValue& node, const std::string& path, CombatConfig& config) {
    if (!node.isObject()) {
        return fail(std::format("'{}' must be an object", path));
    }

    if (node.hasKey("preset")) {
        const auto preset = node["preset"].tryAsString();
        if (!preset) {
            return fail(std::format("{}.preset must be a string", path));
        }
        if (*preset == "default") {
            config = CombatConfig{};
        } else if (*preset == "highDamage") {
            config = CombatConfig::highDamage();
        } else if (*preset == "fast") {
            config = CombatConfig::fast();
        } else {
            return fail(std::format("{}: unknown combat preset '{}'", path, *preset));
        }
    }

    if (!readBool(node, "enableDamage", path, config.enableDamage) ||
        !readFloat(node, "staminaRegenRate", path, config.staminaRegenRate)) {
        return false;
    }

    if (node.hasKey("lightAttack") &&
        !parseAttack(node["lightAttack"], path + ".lightAttack", config.lightAttack)) {
        return false;
    }
    if (node.hasKey("heavyAttack") &&
        !parseAttack(node["heavyAttack"], path + ".heavyAttack", config.heavyAttack)) {
        return false;
    }
    return true;
}

bool UnitConfigLoader::parseAttack(const JsonValue& node, const std::string& path, AttackConfig& config) {
    if (!node.isObject()) {
        return fail(std::format("'{}' must be an object", path));
    }
    return readFloat(node, "damage", path, config.damage) &&
           readFloat(node, "knockback", path, config.knockback) &&
           readFloat(node, "range", path, config.range) &&
           readFloat(node, "cooldown", path, config.cooldown) &&
           readFloat(node, "staminaCost", path, config.staminaCost) &&
           readFloat(node, "stunDuration", path, config.stunDuration) &&
           readFloat(node, "actionDelay", path, config.actionDelay) &&
           readFloat(node, "actionDuration", path, config.actionDuration);
}

bool UnitConfigLoader::parsePhysics(const JsonValue& node, const std::string& path, PhysicsOverrides& overrides) {
    if (!node.isObject()) {
        return fail(std::format("'{}' must be an object", path));
    }

    if (!readOptionalFloat(node, "mass", path, overrides.mass) ||
        !readOptionalFloat(node, "friction", path, overrides.friction) ||
        !readOptionalFloat(node, "velocityDecay", path, overrides.velocityDecay) ||
        !readOptionalFloat(node, "gravityForce", path, overrides.gravityForce)) {
        return false;
    }

    if (node.hasKey("enableGravity")) {
        bool gravity = false;
        if (!readBool(node, "enableGravity", path, gravity)) {
            return false;
        }
        overrides.enableGravity = gravity;
    }
    return true;
}

bool UnitConfigLoader::parseDefinition(const JsonValue& node, const std::string& path, UnitDefinition& definition) {
    if (!node.isObject()) {
        return fail(std::format("'{}' must be an object", path));
    }

    const auto id = node["id"].tryAsString();
    if (!id || id->empty()) {
        return fail(std::format("{}.id must be a non-empty string", path));
    }
    definition.id = *id;

    const auto typeName = node["type"].tryAsString();
    if (!typeName) {
        return fail(std::format("{}.type must be a string", path));
    }
    const auto type = UnitTraits::typeFromString(*typeName);
    if (!type) {
        return fail(std::format("{}: unknown unit type '{}'", path, *typeName));
    }
    definition.type = *type;

    if (node.hasKey("stats")) {
        const JsonValue& stats = node["stats"];
        const std::string statsPath = path + ".stats";
        if (!stats.isObject()) {
            return fail(std::format("'{}' must be an object", statsPath));
        }
        if (!readFloat(stats, "speed", statsPath, definition.stats.speed) ||
            !readFloat(stats, "health", statsPath, definition.stats.health) ||
            !readFloat(stats, "attackDamage", statsPath, definition.stats.attackDamage) ||
            !readFloat(stats, "collisionRadius", statsPath, definition.stats.collisionRadius) ||
            !readFloat(stats, "stamina", statsPath, definition.stats.stamina)) {
            return false;
        }
    }

    if (node.hasKey("ai")) {
        AIBehaviorConfig ai;
        if (!parseAI(node["ai"], path + ".ai", ai)) {
            return false;
        }
        definition.ai = ai;
    }

    if (node.hasKey("combat")) {
        CombatConfig combat;
        if (!parseCombat(node["combat"], path + ".combat", combat)) {
            return false;
        }
        definition.combat = combat;
    }

    if (node.hasKey("physics")) {
        PhysicsOverrides physics;
        if (!parsePhysics(node["physics"], path + ".physics", physics)) {
            return false;
        }
        definition.physics = physics;
    }

    return true;
}

bool UnitConfigLoader::readFloat(const JsonValue& object, const char* key, const std::string& path, float& out) {
    if (!object.hasKey(key)) {
        return true;
    }
    const auto value = object[key].tryAsFloat();
    if (!value || !std::isfinite(*value)) {
        return fail(std::format("{}.{} must be a number", path, key));
    }
    out = *value;
    return true;
}

bool UnitConfigLoader::readOptionalFloat(const JsonValue& object, const char* key, const std::string& path,
                                         std::optional<float>& out) {
    if (!object.hasKey(key)) {
        return true;
    }
    float value = 0.0f;
    if (!readFloat(object, key, path, value)) {
        return false;
    }
    out = value;
    return true;
}

bool UnitConfigLoader::readBool(const JsonValue& object, const char* key, const std::string& path, bool& out) {
    if (!object.hasKey(key)) {
        return true;
    }
    const auto value = object[key].tryAsBool();
    if (!value) {
        return fail(std::format("{}.{} must be a boolean", path, key));
    }
    out = *value;
    return true;
}

bool UnitConfigLoader::readCount(const JsonValue& object, const char* key, const std::string& path, size_t& out,
                                 size_t maxValue) {
    if (!object.hasKey(key)) {
        return true;
    }
    const auto value = object[key].tryAsNumber();
    if (!value || *value < 0.0 || std::floor(*value) != *value) {
        return fail(std::format("{}.{} must be a non-negative integer", path, key));
    }
    // maxValue + 1 rounds to a power of two, so this also rejects infinity
    if (!(*value < static_cast<double>(maxValue) + 1.0)) {
        return fail(std::format("{}.{} must not exceed {}", path, key, maxValue));
    }
    out = static_cast<size_t>(*value);
    return true;
}

bool UnitConfigLoader::fail(const std::string& message) {
    m_lastError = message;
    CONFIG_ERROR(message);
    return false;
}

} // namespace Warband
