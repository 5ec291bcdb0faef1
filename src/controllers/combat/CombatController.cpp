/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "controllers/combat/CombatController.hpp"
#include "controllers/combat/CombatHost.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <format>

using Warband::AttackConfig;
using Warband::AttackKind;
using Warband::CombatConfig;

CombatController::CombatController(CombatHost& host, Warband::DeferredTaskScheduler& scheduler,
                                   const CombatConfig& config)
    : m_host(host), m_scheduler(scheduler), m_config(config)
{
    m_targetScratch.reserve(16);
    m_targetIdScratch.reserve(16);
}

AttackResult CombatController::performLightAttack(Unit& attacker, float now)
{
    return performAttack(attacker, AttackKind::Light, now);
}

AttackResult CombatController::performHeavyAttack(Unit& attacker, float now)
{
    return performAttack(attacker, AttackKind::Heavy, now);
}

AttackResult CombatController::performAttack(Unit& attacker, AttackKind kind, float now)
{
    const AttackFailureReason reason = checkAttack(attacker, kind, now);
    if (reason != AttackFailureReason::None) {
        AttackResult result;
        result.failureReason = reason;
        switch (reason) {
        case AttackFailureReason::NoCombatState:
            result.message = "Unit has no combat state";
            break;
        case AttackFailureReason::AlreadyAttacking:
            result.message = "Unit is already attacking";
            break;
        case AttackFailureReason::Stunned:
            result.message = "Unit is stunned";
            break;
        case AttackFailureReason::InsufficientStamina:
            result.message = std::format("Not enough stamina. Need {:.1f}, have {:.1f}",
                                         getAttackConfig(attacker, kind).staminaCost, attacker.combat->stamina);
            break;
        case AttackFailureReason::OnCooldown: {
            const float readyAt = *attacker.combat->lastAttackTime(kind) + getAttackConfig(attacker, kind).cooldown;
            result.message = std::format("Attack on cooldown: {:.2f}s remaining", readyAt - now);
            break;
        }
        case AttackFailureReason::None:
            break;
        }
        COMBAT_DEBUG(std::format("Unit {} {} attack refused: {}", attacker.id, Warband::toString(kind), result.message));
        return result;
    }

    // Copy: the task may outlive a config change
    const AttackConfig attack = getAttackConfig(attacker, kind);
    CombatData& combat = *attacker.combat;

    m_host.playAnimation(attacker, kind == AttackKind::Light ? LIGHT_ATTACK_ANIMATION : HEAVY_ATTACK_ANIMATION);

    [[maybe_unused]] const float oldStamina = combat.stamina;
    combat.isAttacking = true;
    combat.stamina = std::max(0.0f, combat.stamina - attack.staminaCost);
    combat.lastAttackTime(kind) = now;

    COMBAT_DEBUG(std::format("Unit {} {} attack! Stamina: {:.1f} -> {:.1f}",
                             attacker.id, Warband::toString(kind), oldStamina, combat.stamina));

    const UnitID attackerId = attacker.id;
    m_scheduler.schedule(attack.actionDelay, {attackerId},
                         [this, attackerId, kind, attack]() { resolveHit(attackerId, kind, attack); });

    // The swing never ends before its hit lands
    const float duration = std::max(attack.actionDuration, attack.actionDelay);
    m_scheduler.schedule(duration, {attackerId}, [this, attackerId]() { endAttack(attackerId); });

    return AttackResult{true, AttackFailureReason::None, {}};
}

bool CombatController::canAttack(const Unit& unit, AttackKind kind, float now) const
{
    return checkAttack(unit, kind, now) == AttackFailureReason::None;
}

AttackFailureReason CombatController::checkAttack(const Unit& unit, AttackKind kind, float now) const
{
    if (!unit.combat) {
        return AttackFailureReason::NoCombatState;
    }
    const CombatData& combat = *unit.combat;
    if (combat.isAttacking) {
        return AttackFailureReason::AlreadyAttacking;
    }
    if (unit.stunned) {
        return AttackFailureReason::Stunned;
    }

    const AttackConfig& attack = getAttackConfig(unit, kind);
    if (combat.stamina < attack.staminaCost) {
        return AttackFailureReason::InsufficientStamina;
    }

    const auto& lastTime = combat.lastAttackTime(kind);
    if (lastTime && now < *lastTime + attack.cooldown) {
        return AttackFailureReason::OnCooldown;
    }
    return AttackFailureReason::None;
}

void CombatController::updateCombat(const std::vector<Unit*>& units, float deltaTime,
                                    [[maybe_unused]] float now)
{
    for (Unit* unit : units) {
        if (!unit || !unit->combat) {
            continue;
        }
        CombatData& combat = *unit->combat;
        if (combat.isAttacking || combat.stamina >= combat.maxStamina) {
            continue;
        }
        const float regenRate = resolveConfig(*unit).staminaRegenRate;
        combat.stamina = std::min(combat.maxStamina, combat.stamina + regenRate * deltaTime);
    }
}

bool CombatController::applyDamage(Unit& target, float damage)
{
    if (!m_config.enableDamage) {
        return false;
    }

    target.health = std::clamp(target.health - damage, 0.0f, target.maxHealth);
    return target.health <= 0.0f;
}

void CombatController::initializeCombat(Unit& unit, float stamina)
{
    CombatData combat;
    combat.stamina = std::max(0.0f, stamina);
    combat.maxStamina = combat.stamina;
    unit.combat = combat;
}

bool CombatController::setStamina(Unit& unit, float value)
{
    if (!unit.combat) {
        COMBAT_DEBUG(std::format("setStamina: unit {} had no combat state, initializing", unit.id));
        initializeCombat(unit, value);
        return true;
    }
    CombatData& combat = *unit.combat;
    combat.stamina = std::max(0.0f, value);
    if (combat.stamina > combat.maxStamina) {
        combat.maxStamina = combat.stamina;
    }
    return true;
}

std::vector<Unit*> CombatController::getUnitsInAttackRange(const Unit& attacker, AttackKind kind)
{
    std::vector<Unit*> result;
    m_host.queryUnitsInRange(attacker.position, getAttackConfig(attacker, kind).range, &attacker, result);
    return result;
}

const AttackConfig& CombatController::getAttackConfig(const Unit& unit, AttackKind kind) const
{
    return resolveConfig(unit).get(kind);
}

const CombatConfig& CombatController::resolveConfig(const Unit& unit) const
{
    if (unit.definition && unit.definition->combat) {
        return *unit.definition->combat;
    }
    return m_config;
}

void CombatController::resolveHit(UnitID attackerId, AttackKind kind, const AttackConfig& attack)
{
    Unit* attacker = m_host.findUnit(attackerId);
    if (!attacker) {
        return;
    }

    // Targets are whoever stands in range when the hit lands
    m_host.queryUnitsInRange(attacker->position, attack.range, attacker, m_targetScratch);
    m_targetIdScratch.clear();
    for (const Unit* target : m_targetScratch) {
        m_targetIdScratch.push_back(target->id);
    }

    // Fallback knockback direction when a target stands exactly on the attacker
    const Vector3D facing(std::cos(attacker->rotation), 0.0f, -std::sin(attacker->rotation));

    for (UnitID targetId : m_targetIdScratch) {
        // Re-resolve: a hit listener may have removed units
        Unit* target = m_host.findUnit(targetId);
        attacker = m_host.findUnit(attackerId);
        if (!target || !attacker) {
            continue;
        }
        if (!target->isAlive()) {
            continue;
        }

        Vector3D direction = (target->position - attacker->position).horizontal().normalized();
        if (direction.isZero()) {
            direction = facing;
        }

        if (attack.knockback > 0.0f) {
            m_host.applyKnockback(*target, direction, attack.knockback);
        }

        HitEvent hit;
        hit.attackerId = attackerId;
        hit.targetId = targetId;
        hit.kind = kind;

        if (m_config.enableDamage) {
            const float oldHealth = target->health;
            hit.killed = applyDamage(*target, attack.damage);
            hit.damage = oldHealth - target->health;
            COMBAT_DEBUG(std::format("Unit {} hit unit {} for {:.1f} damage! HP: {:.1f} -> {:.1f}",
                                     attackerId, targetId, attack.damage, oldHealth, target->health));
            if (hit.killed) {
                COMBAT_INFO(std::format("Unit {} killed by unit {}", targetId, attackerId));
            }
        }
        hit.remainingHealth = target->health;

        if (attack.stunDuration > 0.0f) {
            applyStun(*target, attack.stunDuration);
        }

        if (m_hitListener) {
            m_hitListener(hit);
        }
    }
}

void CombatController::endAttack(UnitID attackerId)
{
    Unit* attacker = m_host.findUnit(attackerId);
    if (!attacker || !attacker->combat) {
        return;
    }
    attacker->combat->isAttacking = false;

    // A stunned or dead unit keeps its hit/death pose
    if (!attacker->stunned && attacker->isAlive()) {
        m_host.playAnimation(*attacker, IDLE_ANIMATION);
    }
}

void CombatController::applyStun(Unit& target, float duration)
{
    target.stunned = true;
    const uint32_t generation = ++target.stunGeneration;
    m_host.playAnimation(target, HIT_ANIMATION);

    const UnitID targetId = target.id;
    m_scheduler.schedule(duration, {targetId}, [this, targetId, generation]() {
        Unit* unit = m_host.findUnit(targetId);
        // A newer stun owns the flag now
        if (!unit || unit->stunGeneration != generation) {
            return;
        }
        unit->stunned = false;
        if (unit->isAlive()) {
            m_host.playAnimation(*unit, IDLE_ANIMATION);
        }
    });
}
