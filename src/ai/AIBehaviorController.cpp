/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/AIBehaviorController.hpp"
#include "core/Logger.hpp"
#include "managers/UnitRegistry.hpp"
#include <algorithm>
#include <cmath>
#include <format>
#include <numbers>

namespace {

constexpr float PI = std::numbers::pi_v<float>;
constexpr float TWO_PI = 2.0f * PI;

// Wrap to (-PI, PI]
float wrapAngle(float angle) {
    angle = std::fmod(angle + PI, TWO_PI);
    if (angle < 0.0f) {
        angle += TWO_PI;
    }
    return angle - PI;
}

// Models face +X at yaw 0, so a heading along +Z needs a quarter turn back
float yawForDirection(const Vector3D& direction) {
    return std::atan2(direction.getX(), direction.getZ()) - PI * 0.5f;
}

} // anonymous namespace

AIBehaviorController::AIBehaviorController(UnitRegistry& registry,
                                           const Warband::AIBehaviorConfig& defaultConfig,
                                           uint32_t seed)
    : m_registry(registry), m_defaultConfig(defaultConfig), m_rng(seed) {
    m_stagedMoves.reserve(64);
}

void AIBehaviorController::initializeBehavior(Unit& unit, std::optional<Vector3D> homePosition) {
    const Warband::AIBehaviorConfig& config =
        (unit.definition && unit.definition->ai) ? *unit.definition->ai : m_defaultConfig;
    initializeBehavior(unit, config, homePosition);
}

void AIBehaviorController::initializeBehavior(Unit& unit, const Warband::AIBehaviorConfig& config,
                                              std::optional<Vector3D> homePosition) {
    const Vector3D home = homePosition.value_or(unit.position);

    AIBehaviorData data;
    data.state = AIBehaviorState::Idle;
    data.targetPosition = home;
    data.homePosition = home;
    data.config = config;
    unit.ai = data;

    AI_DEBUG(std::format("Unit {} behavior initialized (home {:.2f}, {:.2f}, {:.2f})",
                         unit.id, home.getX(), home.getY(), home.getZ()));
}

void AIBehaviorController::updateTarget(Unit& unit, const Unit* player, float elapsedTime) {
    if (!unit.ai) {
        return;
    }
    AIBehaviorData& data = *unit.ai;
    data.nextTargetUpdateTime = elapsedTime + random01() * data.config.targetUpdateInterval;

    if (!player) {
        return;
    }

    const float distanceToPlayer = Vector3D::distance(unit.position, player->position);
    if (distanceToPlayer <= data.config.detectionRange) {
        // Still inside the exit band: keep attacking
        if (data.state == AIBehaviorState::Attack && data.targetUnit == player->id &&
            distanceToPlayer <= data.config.attackRange * ATTACK_EXIT_MULTIPLIER) {
            return;
        }
        data.targetUnit = player->id;
        data.state = AIBehaviorState::Chase;
        data.isAttacking = false;
        return;
    }

    data.targetUnit = INVALID_UNIT_ID;
    if (data.state == AIBehaviorState::Chase || data.state == AIBehaviorState::Attack) {
        beginReturn(data);
    } else if (data.state == AIBehaviorState::Idle) {
        // Random patrol point around home on the ground plane
        const float angle = random01() * TWO_PI;
        const float distance = random01() * data.config.patrolRadius;
        data.targetPosition = data.homePosition;
        data.targetPosition.setX(data.homePosition.getX() + std::cos(angle) * distance);
        data.targetPosition.setZ(data.homePosition.getZ() + std::sin(angle) * distance);
        data.state = AIBehaviorState::Patrol;
    }
}

void AIBehaviorController::updateBehaviors(const std::vector<Unit*>& units, const Unit* player,
                                           float deltaTime, float elapsedTime) {
    m_stagedMoves.clear();

    for (Unit* unit : units) {
        if (!unit || !unit->ai) {
            continue;
        }
        AIBehaviorData& data = *unit->ai;
        const Warband::AIBehaviorConfig& config = data.config;

        if (elapsedTime >= data.nextTargetUpdateTime) {
            updateTarget(*unit, player, elapsedTime);
        }

        // Thinking pause
        if (elapsedTime < data.resumeTime) {
            continue;
        }

        switch (data.state) {
        case AIBehaviorState::Idle:
            break;

        case AIBehaviorState::Patrol: {
            StagedMove move = stepToward(*unit, data.targetPosition, config, deltaTime);
            m_stagedMoves.push_back(move);
            if (Vector3D::distance(move.position, data.targetPosition) < PATROL_ARRIVAL_DISTANCE) {
                data.state = AIBehaviorState::Idle;
                data.resumeTime = elapsedTime + random01() * config.pauseDurationMax;
            }
            break;
        }

        case AIBehaviorState::Chase: {
            const Unit* target = resolveTarget(data);
            if (!target) {
                beginReturn(data);
                break;
            }
            StagedMove move = stepToward(*unit, target->position, config, deltaTime);
            m_stagedMoves.push_back(move);
            if (Vector3D::distance(move.position, target->position) <= config.attackRange) {
                data.state = AIBehaviorState::Attack;
                data.isAttacking = true;
                data.resumeTime = elapsedTime + random01() * ATTACK_PAUSE_MAX;
            }
            break;
        }

        case AIBehaviorState::Attack: {
            const Unit* target = resolveTarget(data);
            if (!target) {
                beginReturn(data);
                break;
            }
            const float distanceToTarget = Vector3D::distance(unit->position, target->position);
            if (distanceToTarget > config.attackRange * ATTACK_EXIT_MULTIPLIER) {
                data.state = AIBehaviorState::Chase;
                data.isAttacking = false;
            }
            break;
        }

        case AIBehaviorState::Return: {
            StagedMove move = stepToward(*unit, data.homePosition, config, deltaTime);
            m_stagedMoves.push_back(move);
            if (Vector3D::distance(move.position, data.homePosition) < HOME_ARRIVAL_DISTANCE) {
                data.state = AIBehaviorState::Idle;
                data.resumeTime = elapsedTime + random01() * config.pauseDurationMax;
            }
            break;
        }
        }
    }

    // Every unit has decided against pre-update positions; commit the moves
    for (const StagedMove& move : m_stagedMoves) {
        move.unit->position = move.position;
        move.unit->rotation = move.rotation;
    }
}

bool AIBehaviorController::setBehaviorState(Unit& unit, AIBehaviorState state) {
    if (!unit.ai) {
        AI_WARN(std::format("setBehaviorState: unit {} has no behavior data", unit.id));
        return false;
    }
    AI_DEBUG(std::format("Unit {} behavior {} -> {}", unit.id,
                         behaviorStateToString(unit.ai->state), behaviorStateToString(state)));
    unit.ai->state = state;
    return true;
}

AIBehaviorData* AIBehaviorController::getBehaviorData(Unit& unit) {
    return unit.ai ? &*unit.ai : nullptr;
}

const AIBehaviorData* AIBehaviorController::getBehaviorData(const Unit& unit) {
    return unit.ai ? &*unit.ai : nullptr;
}

std::string_view AIBehaviorController::animationForState(AIBehaviorState state) {
    switch (state) {
    case AIBehaviorState::Idle:   return "idle";
    case AIBehaviorState::Patrol: return "walk";
    case AIBehaviorState::Chase:  return "run";
    case AIBehaviorState::Attack: return "attack";
    case AIBehaviorState::Return: return "walk";
    }
    return "idle";
}

const Unit* AIBehaviorController::resolveTarget(const AIBehaviorData& data) const {
    if (data.targetUnit == INVALID_UNIT_ID) {
        return nullptr;
    }
    return m_registry.getUnit(data.targetUnit);
}

void AIBehaviorController::beginReturn(AIBehaviorData& data) {
    data.state = AIBehaviorState::Return;
    data.targetUnit = INVALID_UNIT_ID;
    data.isAttacking = false;
    data.targetPosition = data.homePosition;
}

AIBehaviorController::StagedMove AIBehaviorController::stepToward(Unit& unit, const Vector3D& target,
                                                                  const Warband::AIBehaviorConfig& config,
                                                                  float deltaTime) const {
    StagedMove move{&unit, unit.position, unit.rotation};

    const Vector3D direction = (target - unit.position).horizontal().normalized();
    if (direction.isZero()) {
        return move;
    }

    // Shortest-arc turn toward the heading
    const float t = std::min(1.0f, deltaTime * config.rotationSpeed);
    const float delta = wrapAngle(yawForDirection(direction) - unit.rotation);
    move.rotation = wrapAngle(unit.rotation + delta * t);

    move.position.addScaled(direction, config.speed * deltaTime);
    return move;
}
