/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/UnitManager.hpp"
#include "core/Logger.hpp"
#include "entities/AnimationSink.hpp"
#include "world/TerrainQuery.hpp"
#include <algorithm>
#include <format>
#include <random>

namespace {
uint32_t resolveSeed(uint32_t configured) {
    return configured != 0 ? configured : std::random_device{}();
}
} // anonymous namespace

UnitManager::UnitManager(const Warband::UnitManagerConfig& config,
                         std::shared_ptr<Warband::TaskClock> clock)
    : m_config(config),
      m_registry(config.maxUnits),
      m_scheduler(std::move(clock)),
      m_ai(m_registry, config.ai, resolveSeed(config.randomSeed)),
      m_combat(*this, m_scheduler, config.combat) {
    m_aiUnits.reserve(64);
    m_allUnits.reserve(64);
    UNIT_INFO(std::format("UnitManager initialized (maxUnits {}, collision {})",
                          m_config.maxUnits, m_config.enableCollision ? "on" : "off"));
}

bool UnitManager::registerDefinition(const UnitDefinition& definition) {
    return m_registry.registerDefinition(definition);
}

Unit* UnitManager::createUnit(const UnitCreateParams& params) {
    Unit* unit = m_registry.createUnit(params);
    if (!unit) {
        return nullptr;
    }

    if (mp_terrain && m_config.snapToTerrainOnSpawn) {
        unit->position.setY(mp_terrain->getHeightAt(unit->position.getX(), unit->position.getZ()));
    }

    PhysicsState& physics = ensurePhysics(*unit);
    physics.oldPosition = unit->position;

    m_combat.initializeCombat(*unit, unit->definition->stats.stamina);

    // AI only for non-player units whose definition carries an AI config
    if (!unit->isPlayer() && unit->definition->ai) {
        m_ai.initializeBehavior(*unit, *unit->definition->ai, unit->position);
    }

    playAnimation(*unit, CombatController::IDLE_ANIMATION);

    UNIT_INFO(std::format("Spawned unit {} ('{}') at ({:.2f}, {:.2f}, {:.2f})",
                          unit->id, params.definitionId,
                          unit->position.getX(), unit->position.getY(), unit->position.getZ()));
    return unit;
}

Unit* UnitManager::createUnit(const std::string& definitionId, const Vector3D& position, float rotation) {
    UnitCreateParams params;
    params.definitionId = definitionId;
    params.position = position;
    params.rotation = rotation;
    return createUnit(params);
}

bool UnitManager::removeUnit(UnitID id) {
    Unit* unit = m_registry.getUnit(id);
    if (!unit) {
        UNIT_WARN(std::format("removeUnit: unknown unit {}", id));
        return false;
    }

    [[maybe_unused]] const size_t cancelled = m_scheduler.cancelForKey(id);
    if (mp_animationSink) {
        mp_animationSink->stopAnimations(*unit);
    }

    m_registry.removeUnit(id);
    UNIT_INFO(std::format("Removed unit {} ({} pending task(s) cancelled)", id, cancelled));
    return true;
}

std::vector<Unit*> UnitManager::getUnitsInRange(const Vector3D& position, float range,
                                                const Unit* exclude) const {
    return m_registry.getUnitsInRange(position, range, exclude);
}

void UnitManager::update(float deltaTime, float elapsedTime) {
    if (!m_config.enabled) {
        return;
    }

    processDeferredTasks();

    const Unit* player = m_registry.getPlayer();

    m_aiUnits.clear();
    for (const auto& unit : m_registry.units()) {
        if (!unit->isPlayer() && unit->ai && !unit->stunned) {
            m_aiUnits.push_back(unit.get());
        }
    }

    m_ai.updateBehaviors(m_aiUnits, player, deltaTime, elapsedTime);

    // Combat animations own the unit until the swing ends
    for (Unit* unit : m_aiUnits) {
        if (unit->combat && unit->combat->isAttacking) {
            continue;
        }
        const std::string_view animation = AIBehaviorController::animationForState(unit->ai->state);
        if (unit->currentAnimation != animation) {
            playAnimation(*unit, animation);
        }
    }

    for (const auto& unit : m_registry.units()) {
        integratePhysics(*unit, deltaTime);
    }

    for (const auto& unit : m_registry.units()) {
        if (unit->physics) {
            unit->physics->oldPosition = unit->position;
        }
    }

    if (m_config.enableCollision) {
        resolveCollisions();
    }
}

size_t UnitManager::processDeferredTasks() {
    return m_scheduler.runDueTasks();
}

void UnitManager::dispose() {
    m_scheduler.clear();
    if (mp_animationSink) {
        for (const auto& unit : m_registry.units()) {
            mp_animationSink->stopAnimations(*unit);
        }
    }
    [[maybe_unused]] const size_t unitCount = m_registry.getUnitCount();
    m_registry.clear();
    m_registry.clearDefinitions();
    m_aiUnits.clear();
    m_allUnits.clear();
    UNIT_INFO(std::format("UnitManager disposed ({} unit(s) released)", unitCount));
}

void UnitManager::applyKnockback(Unit& unit, const Vector3D& direction, float force) {
    PhysicsState& physics = ensurePhysics(unit);
    const Vector3D normal = direction.normalized();
    if (normal.isZero()) {
        PHYSICS_DEBUG(std::format("Ignoring knockback with zero direction on unit {}", unit.id));
        return;
    }
    physics.knockbackVelocity.addScaled(normal, force / resolveMass(unit));
}

void UnitManager::setUnitVelocity(Unit& unit, const Vector3D& velocity) {
    ensurePhysics(unit).velocity = velocity;
}

void UnitManager::addUnitVelocity(Unit& unit, const Vector3D& velocity) {
    ensurePhysics(unit).velocity += velocity;
}

void UnitManager::stopUnitMovement(Unit& unit) {
    PhysicsState& physics = ensurePhysics(unit);
    physics.velocity = Vector3D();
    physics.knockbackVelocity = Vector3D();
}

bool UnitManager::checkUnitCollision(const Unit& unit1, const Unit& unit2) {
    const float combined = unit1.collisionRadius + unit2.collisionRadius;
    return Vector3D::distanceSquared(unit1.position, unit2.position) < combined * combined;
}

void UnitManager::updateCombat(float deltaTime, float now) {
    m_allUnits.clear();
    for (const auto& unit : m_registry.units()) {
        m_allUnits.push_back(unit.get());
    }
    m_combat.updateCombat(m_allUnits, deltaTime, now);
}

void UnitManager::playAnimation(Unit& unit, std::string_view name) {
    playAnimation(unit, name, AnimationSink::DEFAULT_FADE_DURATION);
}

void UnitManager::playAnimation(Unit& unit, std::string_view name, float fadeDuration) {
    unit.currentAnimation.assign(name);
    if (mp_animationSink) {
        mp_animationSink->playAnimation(unit, name, fadeDuration);
    }
}

void UnitManager::stopAnimations(Unit& unit) {
    unit.currentAnimation.clear();
    if (mp_animationSink) {
        mp_animationSink->stopAnimations(unit);
    }
}

bool UnitManager::isAnimationPlaying(const Unit& unit, std::string_view name) const {
    return mp_animationSink && mp_animationSink->isAnimationPlaying(unit, name);
}

void UnitManager::queryUnitsInRange(const Vector3D& position, float range, const Unit* exclude,
                                    std::vector<Unit*>& outUnits) {
    m_registry.getUnitsInRange(position, range, exclude, outUnits);
}

PhysicsState& UnitManager::ensurePhysics(Unit& unit) {
    if (!unit.physics) {
        PhysicsState physics;
        physics.oldPosition = unit.position;
        if (unit.definition && unit.definition->physics) {
            physics.overrides = *unit.definition->physics;
        }
        unit.physics = physics;
    }
    return *unit.physics;
}

float UnitManager::resolveMass(const Unit& unit) const {
    float mass = m_config.defaultMass;
    if (unit.physics && unit.physics->overrides.mass) {
        mass = *unit.physics->overrides.mass;
    } else if (unit.definition && unit.definition->physics && unit.definition->physics->mass) {
        mass = *unit.definition->physics->mass;
    }
    // mass <= 0 is treated as unit mass
    return mass > 0.0f ? mass : 1.0f;
}

void UnitManager::integratePhysics(Unit& unit, float deltaTime) {
    if (!unit.physics) {
        return;
    }
    PhysicsState& physics = *unit.physics;
    const PhysicsOverrides& overrides = physics.overrides;
    const float threshold = m_config.velocityThreshold;

    // Knockback: displace, then decay once per update
    if (!physics.knockbackVelocity.isZero()) {
        unit.position.addScaled(physics.knockbackVelocity, deltaTime);
        physics.knockbackVelocity *= overrides.friction.value_or(m_config.knockbackFriction);
        if (physics.knockbackVelocity.lengthSquared() < threshold) {
            physics.knockbackVelocity = Vector3D();
        }
    }

    const bool gravity = overrides.enableGravity.value_or(m_config.enableGravity);
    if (gravity) {
        const float g = overrides.gravityForce.value_or(m_config.gravityForce);
        physics.velocity.setY(physics.velocity.getY() - g * deltaTime);
    }

    if (!physics.velocity.isZero()) {
        unit.position.addScaled(physics.velocity, deltaTime);

        const float decay = overrides.velocityDecay.value_or(m_config.velocityDecay);
        if (decay > 0.0f) {
            physics.velocity *= std::max(0.0f, 1.0f - decay * deltaTime);
        }
        if (physics.velocity.lengthSquared() < threshold) {
            physics.velocity = Vector3D();
        }
    }

    // Land on the terrain
    if (gravity && mp_terrain) {
        const float ground = mp_terrain->getHeightAt(unit.position.getX(), unit.position.getZ());
        if (unit.position.getY() <= ground) {
            unit.position.setY(ground);
            if (physics.velocity.getY() < 0.0f) {
                physics.velocity.setY(0.0f);
            }
        }
    }
}

void UnitManager::resolveCollisions() {
    const auto& units = m_registry.units();
    const size_t count = units.size();

    for (size_t i = 0; i < count; ++i) {
        Unit& unit1 = *units[i];
        for (size_t j = i + 1; j < count; ++j) {
            Unit& unit2 = *units[j];

            const Vector3D delta = unit1.position - unit2.position;
            const float distance = delta.length();
            const float required = std::max(unit1.collisionRadius + unit2.collisionRadius,
                                            m_config.minDistance);

            // Coincident units have no separation axis; leave them for a later frame
            if (distance <= 0.0f || distance >= required) {
                continue;
            }

            const Vector3D normal = delta / distance;
            const float overlap = required - distance;
            const float mass1 = resolveMass(unit1);
            const float mass2 = resolveMass(unit2);
            const float totalMass = mass1 + mass2;

            // Equal masses each move overlap * pushStrength; heavier units move less
            const float push1 = 2.0f * mass2 / totalMass * overlap * m_config.pushStrength;
            const float push2 = 2.0f * mass1 / totalMass * overlap * m_config.pushStrength;

            unit1.position.addScaled(normal, push1);
            unit2.position.addScaled(normal, -push2);
        }
    }
}
