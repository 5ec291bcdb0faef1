/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE UnitConfigLoaderTests
#include <boost/test/unit_test.hpp>

#include "utils/UnitConfigLoader.hpp"
#include <cstdio>
#include <fstream>

using namespace Warband;

namespace {
constexpr float EPSILON = 0.001f;
}

BOOST_AUTO_TEST_SUITE(DefaultConfigTests)

BOOST_AUTO_TEST_CASE(TestDefaultDefinitions) {
    UnitSimulationConfig config = UnitConfigLoader::makeDefaultConfig();
    BOOST_REQUIRE_EQUAL(config.definitions.size(), 2);

    const UnitDefinition& human = config.definitions[0];
    BOOST_CHECK_EQUAL(human.id, "human-player");
    BOOST_CHECK(human.type == UnitType::Player);
    BOOST_CHECK_CLOSE(human.stats.attackDamage, 25.0f, EPSILON);
    BOOST_CHECK(!human.ai.has_value());

    const UnitDefinition& zombie = config.definitions[1];
    BOOST_CHECK_EQUAL(zombie.id, "zombie-enemy");
    BOOST_CHECK(zombie.type == UnitType::Enemy);
    BOOST_CHECK_CLOSE(zombie.stats.health, 75.0f, EPSILON);
    BOOST_REQUIRE(zombie.ai.has_value());
    BOOST_CHECK_CLOSE(zombie.ai->detectionRange, 8.0f, EPSILON);
    BOOST_CHECK_CLOSE(zombie.ai->speed, 0.8f, EPSILON);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(ParsingTests)

BOOST_AUTO_TEST_CASE(TestEmptyObjectKeepsDefaults) {
    UnitConfigLoader loader;
    UnitSimulationConfig config;
    BOOST_REQUIRE(loader.loadFromString("{}", config));

    UnitManagerConfig defaults;
    BOOST_CHECK_EQUAL(config.manager.maxUnits, defaults.maxUnits);
    BOOST_CHECK_CLOSE(config.manager.minDistance, defaults.minDistance, EPSILON);
    BOOST_CHECK_CLOSE(config.manager.knockbackFriction, defaults.knockbackFriction, EPSILON);
    BOOST_CHECK(config.definitions.empty());
}

BOOST_AUTO_TEST_CASE(TestManagerAndCombatSections) {
    const std::string json = R"({
        "manager": {
            "maxUnits": 32,
            "enableCollision": false,
            "collision": { "minDistance": 2.0, "pushStrength": 0.25 },
            "knockbackFriction": 0.8,
            "enableGravity": true,
            "randomSeed": 7,
            "ai": { "preset": "passive", "speed": 3.0 }
        },
        "combat": {
            "enableDamage": false,
            "staminaRegenRate": 4.0,
            "heavyAttack": { "damage": 40, "cooldown": 3 }
        }
    })";

    UnitConfigLoader loader;
    UnitSimulationConfig config;
    BOOST_REQUIRE_MESSAGE(loader.loadFromString(json, config), loader.getLastError());

    BOOST_CHECK_EQUAL(config.manager.maxUnits, 32u);
    BOOST_CHECK(!config.manager.enableCollision);
    BOOST_CHECK_CLOSE(config.manager.minDistance, 2.0f, EPSILON);
    BOOST_CHECK_CLOSE(config.manager.pushStrength, 0.25f, EPSILON);
    BOOST_CHECK_CLOSE(config.manager.knockbackFriction, 0.8f, EPSILON);
    BOOST_CHECK(config.manager.enableGravity);
    BOOST_CHECK_EQUAL(config.manager.randomSeed, 7u);

    // Preset first, then explicit keys on top
    BOOST_CHECK_CLOSE(config.manager.ai.detectionRange, AIBehaviorConfig::passive().detectionRange, EPSILON);
    BOOST_CHECK_CLOSE(config.manager.ai.speed, 3.0f, EPSILON);

    BOOST_CHECK(!config.manager.combat.enableDamage);
    BOOST_CHECK_CLOSE(config.manager.combat.staminaRegenRate, 4.0f, EPSILON);
    BOOST_CHECK_CLOSE(config.manager.combat.heavyAttack.damage, 40.0f, EPSILON);
    BOOST_CHECK_CLOSE(config.manager.combat.heavyAttack.cooldown, 3.0f, EPSILON);
    // Untouched keys keep the heavy defaults
    BOOST_CHECK_CLOSE(config.manager.combat.heavyAttack.staminaCost, 40.0f, EPSILON);
}

BOOST_AUTO_TEST_CASE(TestDefinitions) {
    const std::string json = R"({
        "definitions": [
            { "id": "grunt", "type": "enemy",
              "stats": { "health": 50, "collisionRadius": 0.4 },
              "ai": "aggressive" },
            { "id": "brute", "type": "npc",
              "combat": { "preset": "highDamage" },
              "physics": { "mass": 3.0, "enableGravity": true } }
        ]
    })";

    UnitConfigLoader loader;
    UnitSimulationConfig config;
    BOOST_REQUIRE_MESSAGE(loader.loadFromString(json, config), loader.getLastError());
    BOOST_REQUIRE_EQUAL(config.definitions.size(), 2);

    const UnitDefinition& grunt = config.definitions[0];
    BOOST_CHECK(grunt.type == UnitType::Enemy);
    BOOST_CHECK_CLOSE(grunt.stats.health, 50.0f, EPSILON);
    BOOST_CHECK_CLOSE(grunt.stats.collisionRadius, 0.4f, EPSILON);
    BOOST_CHECK_CLOSE(grunt.stats.speed, 1.0f, EPSILON);
    BOOST_REQUIRE(grunt.ai.has_value());
    BOOST_CHECK_CLOSE(grunt.ai->detectionRange, AIBehaviorConfig::aggressive().detectionRange, EPSILON);
    BOOST_CHECK(!grunt.combat.has_value());
    BOOST_CHECK(!grunt.physics.has_value());

    const UnitDefinition& brute = config.definitions[1];
    BOOST_CHECK(brute.type == UnitType::NPC);
    BOOST_CHECK(!brute.ai.has_value());
    BOOST_REQUIRE(brute.combat.has_value());
    BOOST_CHECK_CLOSE(brute.combat->lightAttack.damage, CombatConfig::highDamage().lightAttack.damage, EPSILON);
    BOOST_REQUIRE(brute.physics.has_value());
    BOOST_REQUIRE(brute.physics->mass.has_value());
    BOOST_CHECK_CLOSE(*brute.physics->mass, 3.0f, EPSILON);
    BOOST_CHECK(brute.physics->enableGravity.value_or(false));
    BOOST_CHECK(!brute.physics->friction.has_value());
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(ErrorTests)

BOOST_AUTO_TEST_CASE(TestUnknownUnitType) {
    UnitConfigLoader loader;
    UnitSimulationConfig config;
    BOOST_CHECK(!loader.loadFromString(R"({"definitions": [{"id": "x", "type": "dragon"}]})", config));
    BOOST_CHECK(loader.getLastError().find("dragon") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(TestWrongValueType) {
    UnitConfigLoader loader;
    UnitSimulationConfig config;
    BOOST_CHECK(!loader.loadFromString(R"({"manager": {"minDistance": 1, "collision": {"pushStrength": "hard"}}})", config));
    BOOST_CHECK(loader.getLastError().find("pushStrength") != std::string::npos);

    BOOST_CHECK(!loader.loadFromString(R"({"manager": {"maxUnits": -5}})", config));
    BOOST_CHECK(!loader.loadFromString(R"({"definitions": {"id": "x"}})", config));
    BOOST_CHECK(!loader.loadFromString(R"({"definitions": [{"type": "enemy"}]})", config));
}

BOOST_AUTO_TEST_CASE(TestUnknownPreset) {
    UnitConfigLoader loader;
    UnitSimulationConfig config;
    BOOST_CHECK(!loader.loadFromString(R"({"definitions": [{"id": "x", "type": "enemy", "ai": "sleepy"}]})", config));
    BOOST_CHECK(!loader.loadFromString(R"({"combat": {"preset": "ultra"}})", config));
}

BOOST_AUTO_TEST_CASE(TestFailedLoadLeavesConfigUntouched) {
    UnitConfigLoader loader;
    UnitSimulationConfig config = UnitConfigLoader::makeDefaultConfig();
    BOOST_CHECK(!loader.loadFromString(R"({"manager": {"maxUnits": 5}, "definitions": [{"id": ""}]})", config));
    BOOST_CHECK_EQUAL(config.manager.maxUnits, UnitManagerConfig{}.maxUnits);
    BOOST_CHECK_EQUAL(config.definitions.size(), 2);
}

BOOST_AUTO_TEST_CASE(TestOutOfRangeCounts) {
    UnitConfigLoader loader;
    UnitSimulationConfig config = UnitConfigLoader::makeDefaultConfig();
    const UnitManagerConfig defaults;

    BOOST_CHECK(!loader.loadFromString(R"({"manager": {"maxUnits": 1e30}})", config));
    BOOST_CHECK(loader.getLastError().find("manager.maxUnits") != std::string::npos);
    BOOST_CHECK_EQUAL(config.manager.maxUnits, defaults.maxUnits);

    BOOST_CHECK(!loader.loadFromString(R"({"manager": {"randomSeed": 5e9}})", config));
    BOOST_CHECK(loader.getLastError().find("manager.randomSeed") != std::string::npos);
    BOOST_CHECK_EQUAL(config.manager.randomSeed, defaults.randomSeed);

    // Largest seed that fits
    BOOST_REQUIRE_MESSAGE(loader.loadFromString(R"({"manager": {"randomSeed": 4294967295}})", config),
                          loader.getLastError());
    BOOST_CHECK_EQUAL(config.manager.randomSeed, 4294967295u);
}

BOOST_AUTO_TEST_CASE(TestInvalidJson) {
    UnitConfigLoader loader;
    UnitSimulationConfig config;
    BOOST_CHECK(!loader.loadFromString("{ \"manager\": ", config));
    BOOST_CHECK(loader.getLastError().find("Invalid JSON") != std::string::npos);

    BOOST_CHECK(!loader.loadFromString("[1, 2]", config));
    BOOST_CHECK(!loader.loadFromFile("does_not_exist_units.json", config));
}

BOOST_AUTO_TEST_CASE(TestLoadFromFile) {
    const std::string filename = "unit_config_loader_test.json";
    {
        std::ofstream file(filename);
        file << R"({"definitions": [{"id": "scout", "type": "enemy", "stats": {"speed": 2.5}}]})";
    }

    UnitConfigLoader loader;
    UnitSimulationConfig config;
    BOOST_CHECK(loader.loadFromFile(filename, config));
    BOOST_REQUIRE_EQUAL(config.definitions.size(), 1);
    BOOST_CHECK_CLOSE(config.definitions[0].stats.speed, 2.5f, EPSILON);

    std::remove(filename.c_str());
}

BOOST_AUTO_TEST_SUITE_END()
