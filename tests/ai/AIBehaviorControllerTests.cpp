/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE AIBehaviorControllerTests
#include <boost/test/unit_test.hpp>

#include "ai/AIBehaviorController.hpp"
#include "managers/UnitRegistry.hpp"
#include "../mocks/TestUnitDefinitions.hpp"
#include <cmath>
#include <numbers>
#include <vector>

namespace {
constexpr float EPSILON = 0.01f;  // percent tolerance for BOOST_CHECK_CLOSE
constexpr float NEVER = 1.0e6f;
}

// ============================================================================
// Test Fixture
// ============================================================================

class AIFixture {
public:
    AIFixture() : controller(registry, Warband::AIBehaviorConfig{}, 1234u) {
        registry.registerDefinition(TestUnits::player());
        registry.registerDefinition(TestUnits::enemy());
        registry.registerDefinition(TestUnits::dummy());
    }

    Unit* spawn(const std::string& definitionId, float x, float z) {
        UnitCreateParams params;
        params.definitionId = definitionId;
        params.position = Vector3D(x, 0.0f, z);
        Unit* unit = registry.createUnit(params);
        if (unit && unit->definition->ai) {
            controller.initializeBehavior(*unit);
        }
        return unit;
    }

    // Freeze target re-evaluation so a test can drive one state in isolation
    static void holdTarget(Unit& unit) {
        unit.ai->nextTargetUpdateTime = NEVER;
    }

    void step(Unit* unit, const Unit* player, float deltaTime, float elapsed) {
        std::vector<Unit*> units{unit};
        controller.updateBehaviors(units, player, deltaTime, elapsed);
    }

    UnitRegistry registry;
    AIBehaviorController controller;
};

// ============================================================================
// INITIALIZATION TESTS
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(InitializationTests, AIFixture)

BOOST_AUTO_TEST_CASE(TestInitializeUsesDefinitionConfig) {
    Unit* enemy = spawn("enemy", 3.0f, 4.0f);
    BOOST_REQUIRE(enemy && enemy->ai);

    const AIBehaviorData& data = *enemy->ai;
    BOOST_CHECK(data.state == AIBehaviorState::Idle);
    BOOST_CHECK_EQUAL(data.targetUnit, INVALID_UNIT_ID);
    BOOST_CHECK(!data.isAttacking);
    BOOST_CHECK_CLOSE(data.homePosition.getX(), 3.0f, EPSILON);
    BOOST_CHECK_CLOSE(data.homePosition.getZ(), 4.0f, EPSILON);
    BOOST_CHECK_CLOSE(data.config.speed, 4.0f, EPSILON);
}

BOOST_AUTO_TEST_CASE(TestInitializeWithExplicitConfigAndHome) {
    Unit* dummy = spawn("dummy", 0.0f, 0.0f);
    BOOST_REQUIRE(dummy);
    BOOST_CHECK(!dummy->ai.has_value());
    BOOST_CHECK(AIBehaviorController::getBehaviorData(*dummy) == nullptr);

    controller.initializeBehavior(*dummy, Warband::AIBehaviorConfig::passive(), Vector3D(7.0f, 0.0f, 7.0f));
    AIBehaviorData* data = AIBehaviorController::getBehaviorData(*dummy);
    BOOST_REQUIRE(data);
    BOOST_CHECK_CLOSE(data->homePosition.getX(), 7.0f, EPSILON);
    BOOST_CHECK_CLOSE(data->config.detectionRange, Warband::AIBehaviorConfig::passive().detectionRange, EPSILON);
}

BOOST_AUTO_TEST_CASE(TestInitializeFallsBackToDefaultConfig) {
    Unit* dummy = spawn("dummy", 0.0f, 0.0f);
    BOOST_REQUIRE(dummy);
    controller.setDefaultConfig(Warband::AIBehaviorConfig::aggressive());
    controller.initializeBehavior(*dummy);
    BOOST_REQUIRE(dummy->ai);
    BOOST_CHECK_CLOSE(dummy->ai->config.detectionRange, 15.0f, EPSILON);
}

BOOST_AUTO_TEST_CASE(TestSetBehaviorState) {
    Unit* enemy = spawn("enemy", 0.0f, 0.0f);
    Unit* dummy = spawn("dummy", 0.0f, 0.0f);
    BOOST_REQUIRE(enemy && dummy);

    BOOST_CHECK(controller.setBehaviorState(*enemy, AIBehaviorState::Patrol));
    BOOST_CHECK(enemy->ai->state == AIBehaviorState::Patrol);
    BOOST_CHECK(!controller.setBehaviorState(*dummy, AIBehaviorState::Chase));
}

BOOST_AUTO_TEST_CASE(TestAnimationForState) {
    BOOST_CHECK_EQUAL(AIBehaviorController::animationForState(AIBehaviorState::Idle), "idle");
    BOOST_CHECK_EQUAL(AIBehaviorController::animationForState(AIBehaviorState::Patrol), "walk");
    BOOST_CHECK_EQUAL(AIBehaviorController::animationForState(AIBehaviorState::Chase), "run");
    BOOST_CHECK_EQUAL(AIBehaviorController::animationForState(AIBehaviorState::Attack), "attack");
    BOOST_CHECK_EQUAL(AIBehaviorController::animationForState(AIBehaviorState::Return), "walk");
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// TARGET SELECTION TESTS
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(TargetTests, AIFixture)

BOOST_AUTO_TEST_CASE(TestIdleToChaseWhenPlayerDetected) {
    Unit* player = spawn("player", 0.0f, 0.0f);
    Unit* enemy = spawn("enemy", 5.0f, 0.0f);
    BOOST_REQUIRE(player && enemy);

    step(enemy, player, 0.1f, 0.1f);
    BOOST_CHECK(enemy->ai->state == AIBehaviorState::Chase);
    BOOST_CHECK_EQUAL(enemy->ai->targetUnit, player->id);
    // speed 4 * dt 0.1 toward the player
    BOOST_CHECK_CLOSE(enemy->position.getX(), 4.6f, EPSILON);
}

BOOST_AUTO_TEST_CASE(TestNoPlayerOnlyReschedules) {
    Unit* enemy = spawn("enemy", 5.0f, 0.0f);
    BOOST_REQUIRE(enemy);
    enemy->ai->config.targetUpdateInterval = 2.0f;

    step(enemy, nullptr, 0.1f, 1.0f);
    BOOST_CHECK(enemy->ai->state == AIBehaviorState::Idle);
    BOOST_CHECK(enemy->ai->nextTargetUpdateTime >= 1.0f);
    BOOST_CHECK(enemy->ai->nextTargetUpdateTime <= 3.0f);
    BOOST_CHECK_CLOSE(enemy->position.getX(), 5.0f, EPSILON);
}

BOOST_AUTO_TEST_CASE(TestIdleStartsPatrolWhenPlayerOutOfRange) {
    Unit* player = spawn("player", 100.0f, 100.0f);
    Unit* enemy = spawn("enemy", 5.0f, 5.0f);
    BOOST_REQUIRE(player && enemy);

    controller.updateTarget(*enemy, player, 0.0f);
    const AIBehaviorData& data = *enemy->ai;
    BOOST_CHECK(data.state == AIBehaviorState::Patrol);
    BOOST_CHECK_EQUAL(data.targetUnit, INVALID_UNIT_ID);
    BOOST_CHECK(Vector3D::distance(data.targetPosition, data.homePosition) <= data.config.patrolRadius + 0.001f);
    BOOST_CHECK_SMALL(data.targetPosition.getY() - data.homePosition.getY(), 0.0001f);
}

BOOST_AUTO_TEST_CASE(TestChaseReturnsHomeWhenPlayerEscapes) {
    Unit* player = spawn("player", 50.0f, 0.0f);
    Unit* enemy = spawn("enemy", 0.0f, 0.0f);
    BOOST_REQUIRE(player && enemy);

    enemy->ai->state = AIBehaviorState::Chase;
    enemy->ai->targetUnit = player->id;
    enemy->ai->isAttacking = true;

    controller.updateTarget(*enemy, player, 0.0f);
    BOOST_CHECK(enemy->ai->state == AIBehaviorState::Return);
    BOOST_CHECK_EQUAL(enemy->ai->targetUnit, INVALID_UNIT_ID);
    BOOST_CHECK(!enemy->ai->isAttacking);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// STATE MACHINE TESTS
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(StateMachineTests, AIFixture)

BOOST_AUTO_TEST_CASE(TestChaseEntersAttackInRange) {
    Unit* player = spawn("player", 0.0f, 0.0f);
    Unit* enemy = spawn("enemy", 1.8f, 0.0f);
    BOOST_REQUIRE(player && enemy);

    step(enemy, player, 0.1f, 0.1f);
    BOOST_CHECK(enemy->ai->state == AIBehaviorState::Attack);
    BOOST_CHECK(enemy->ai->isAttacking);
    BOOST_CHECK_CLOSE(enemy->position.getX(), 1.4f, EPSILON);
    BOOST_CHECK(enemy->ai->resumeTime >= 0.1f);
    BOOST_CHECK(enemy->ai->resumeTime <= 0.1f + AIBehaviorController::ATTACK_PAUSE_MAX);
}

BOOST_AUTO_TEST_CASE(TestAttackHysteresis) {
    Unit* player = spawn("player", 0.0f, 0.0f);
    Unit* enemy = spawn("enemy", 2.0f, 0.0f);
    BOOST_REQUIRE(player && enemy);

    holdTarget(*enemy);
    enemy->ai->state = AIBehaviorState::Attack;
    enemy->ai->targetUnit = player->id;
    enemy->ai->isAttacking = true;

    // 2.0 is beyond attackRange 1.5 but inside the 1.5x exit band
    step(enemy, player, 0.1f, 1.0f);
    BOOST_CHECK(enemy->ai->state == AIBehaviorState::Attack);
    BOOST_CHECK_CLOSE(enemy->position.getX(), 2.0f, EPSILON);

    enemy->position.setX(2.3f);
    step(enemy, player, 0.1f, 2.0f);
    BOOST_CHECK(enemy->ai->state == AIBehaviorState::Chase);
    BOOST_CHECK(!enemy->ai->isAttacking);
}

BOOST_AUTO_TEST_CASE(TestAttackHoldsThroughTargetReselection) {
    Unit* player = spawn("player", 0.0f, 0.0f);
    Unit* enemy = spawn("enemy", 2.0f, 0.0f);
    BOOST_REQUIRE(player && enemy);

    // Reselection is due every frame with a zero update interval
    enemy->ai->state = AIBehaviorState::Attack;
    enemy->ai->targetUnit = player->id;
    enemy->ai->isAttacking = true;

    step(enemy, player, 0.1f, 1.0f);
    BOOST_CHECK(enemy->ai->state == AIBehaviorState::Attack);
    BOOST_CHECK(enemy->ai->isAttacking);
    BOOST_CHECK_EQUAL(enemy->ai->targetUnit, player->id);
    BOOST_CHECK_CLOSE(enemy->position.getX(), 2.0f, EPSILON);

    step(enemy, player, 0.1f, 1.1f);
    BOOST_CHECK(enemy->ai->state == AIBehaviorState::Attack);

    enemy->position.setX(2.3f);
    step(enemy, player, 0.1f, 1.2f);
    BOOST_CHECK(enemy->ai->state == AIBehaviorState::Chase);
    BOOST_CHECK(!enemy->ai->isAttacking);
}

BOOST_AUTO_TEST_CASE(TestLostTargetReturnsHome) {
    Unit* player = spawn("player", 0.0f, 0.0f);
    Unit* enemy = spawn("enemy", 3.0f, 0.0f);
    BOOST_REQUIRE(player && enemy);
    const UnitID playerId = player->id;

    holdTarget(*enemy);
    enemy->ai->state = AIBehaviorState::Chase;
    enemy->ai->targetUnit = playerId;
    registry.removeUnit(playerId);

    step(enemy, nullptr, 0.1f, 1.0f);
    BOOST_CHECK(enemy->ai->state == AIBehaviorState::Return);
    BOOST_CHECK_EQUAL(enemy->ai->targetUnit, INVALID_UNIT_ID);
    // No move on the frame the target is lost
    BOOST_CHECK_CLOSE(enemy->position.getX(), 3.0f, EPSILON);
}

BOOST_AUTO_TEST_CASE(TestReturnArrivesHome) {
    Unit* enemy = spawn("enemy", 0.0f, 0.0f);
    BOOST_REQUIRE(enemy);

    holdTarget(*enemy);
    enemy->ai->state = AIBehaviorState::Return;
    enemy->position = Vector3D(0.0f, 0.0f, 2.3f);

    step(enemy, nullptr, 0.1f, 1.0f);
    BOOST_CHECK(enemy->ai->state == AIBehaviorState::Idle);
    BOOST_CHECK_CLOSE(enemy->position.getZ(), 1.9f, EPSILON);
}

BOOST_AUTO_TEST_CASE(TestPatrolArrivesAndIdles) {
    Unit* enemy = spawn("enemy", 0.0f, 0.0f);
    BOOST_REQUIRE(enemy);

    holdTarget(*enemy);
    enemy->ai->state = AIBehaviorState::Patrol;
    enemy->ai->targetPosition = Vector3D(3.0f, 0.0f, 0.0f);

    step(enemy, nullptr, 0.1f, 1.0f);
    BOOST_CHECK(enemy->ai->state == AIBehaviorState::Patrol);
    BOOST_CHECK_CLOSE(enemy->position.getX(), 0.4f, EPSILON);

    enemy->position.setX(1.2f);
    step(enemy, nullptr, 0.1f, 2.0f);
    BOOST_CHECK(enemy->ai->state == AIBehaviorState::Idle);
}

BOOST_AUTO_TEST_CASE(TestPauseBlocksMovement) {
    Unit* enemy = spawn("enemy", 0.0f, 0.0f);
    BOOST_REQUIRE(enemy);

    holdTarget(*enemy);
    enemy->ai->state = AIBehaviorState::Patrol;
    enemy->ai->targetPosition = Vector3D(5.0f, 0.0f, 0.0f);
    enemy->ai->resumeTime = 3.0f;

    step(enemy, nullptr, 0.1f, 1.0f);
    BOOST_CHECK_SMALL(enemy->position.getX(), 0.0001f);

    step(enemy, nullptr, 0.1f, 3.0f);
    BOOST_CHECK_CLOSE(enemy->position.getX(), 0.4f, EPSILON);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// MOVEMENT TESTS
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(MovementTests, AIFixture)

BOOST_AUTO_TEST_CASE(TestFacingTowardTarget) {
    Unit* player = spawn("player", 0.0f, 0.0f);
    Unit* enemy = spawn("enemy", 0.0f, -5.0f);
    BOOST_REQUIRE(player && enemy);

    // Heading +Z; full turn since dt * rotationSpeed >= 1
    step(enemy, player, 0.1f, 0.1f);
    BOOST_CHECK_CLOSE(enemy->rotation, -std::numbers::pi_v<float> * 0.5f, EPSILON);
}

BOOST_AUTO_TEST_CASE(TestPartialTurn) {
    Unit* player = spawn("player", 0.0f, 0.0f);
    Unit* enemy = spawn("enemy", 0.0f, -5.0f);
    BOOST_REQUIRE(player && enemy);

    // t = 0.05 * 10 = 0.5 of the way from 0 to -pi/2
    step(enemy, player, 0.05f, 0.05f);
    BOOST_CHECK_CLOSE(enemy->rotation, -std::numbers::pi_v<float> * 0.25f, EPSILON);
}

BOOST_AUTO_TEST_CASE(TestMovementStaysOnGroundPlane) {
    Unit* player = spawn("player", 0.0f, 0.0f);
    Unit* enemy = spawn("enemy", 4.0f, 0.0f);
    BOOST_REQUIRE(player && enemy);
    player->position.setY(3.0f);

    step(enemy, player, 0.1f, 0.1f);
    BOOST_CHECK_SMALL(enemy->position.getY(), 0.0001f);
    BOOST_CHECK_CLOSE(enemy->position.getX(), 3.6f, EPSILON);
}

BOOST_AUTO_TEST_CASE(TestDecisionsUsePreUpdatePositions) {
    Unit* player = spawn("player", 0.0f, 0.0f);
    Unit* leader = spawn("enemy", 5.0f, 0.0f);
    Unit* follower = spawn("enemy", 5.0f, 3.0f);
    BOOST_REQUIRE(player && leader && follower);

    // The follower chases the leader, which moves first in the batch
    holdTarget(*follower);
    follower->ai->state = AIBehaviorState::Chase;
    follower->ai->targetUnit = leader->id;

    std::vector<Unit*> units{leader, follower};
    controller.updateBehaviors(units, player, 0.1f, 0.1f);

    BOOST_CHECK_CLOSE(leader->position.getX(), 4.6f, EPSILON);
    // Heading was taken from the leader's old position straight down -Z
    BOOST_CHECK_CLOSE(follower->position.getX(), 5.0f, EPSILON);
    BOOST_CHECK_CLOSE(follower->position.getZ(), 2.6f, EPSILON);
}

BOOST_AUTO_TEST_CASE(TestUnitsWithoutBehaviorAreSkipped) {
    Unit* dummy = spawn("dummy", 1.0f, 0.0f);
    Unit* player = spawn("player", 0.0f, 0.0f);
    BOOST_REQUIRE(dummy && player);

    std::vector<Unit*> units{dummy, nullptr};
    controller.updateBehaviors(units, player, 0.1f, 0.1f);
    BOOST_CHECK_CLOSE(dummy->position.getX(), 1.0f, EPSILON);
}

BOOST_AUTO_TEST_SUITE_END()
