/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef COMBAT_CONTROLLER_HPP
#define COMBAT_CONTROLLER_HPP

/**
 * @file CombatController.hpp
 * @brief Melee combat for units: eligibility, stamina, deferred hits
 *
 * CombatController handles:
 * - Attack eligibility (already attacking, stunned, stamina, cooldown)
 * - Stamina consumption and regeneration
 * - Deferred hit resolution: targets are gathered when the hit lands, not
 *   when the swing starts
 * - Knockback, damage and stun application
 *
 * World access goes through CombatHost; timed effects go through the
 * DeferredTaskScheduler keyed by unit id, so removing a unit cancels them.
 *
 * Ownership: UnitManager owns the controller instance.
 */

#include "controllers/combat/CombatConfig.hpp"
#include "core/DeferredTaskScheduler.hpp"
#include "entities/Unit.hpp"
#include <cstdint>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

class CombatHost;

enum class AttackFailureReason : uint8_t {
    None = 0,
    NoCombatState,
    AlreadyAttacking,
    Stunned,
    InsufficientStamina,
    OnCooldown
};

inline std::ostream& operator<<(std::ostream& os, AttackFailureReason reason) {
    switch (reason) {
        case AttackFailureReason::None:                return os << "None";
        case AttackFailureReason::NoCombatState:       return os << "NoCombatState";
        case AttackFailureReason::AlreadyAttacking:    return os << "AlreadyAttacking";
        case AttackFailureReason::Stunned:             return os << "Stunned";
        case AttackFailureReason::InsufficientStamina: return os << "InsufficientStamina";
        case AttackFailureReason::OnCooldown:          return os << "OnCooldown";
    }
    return os << "Unknown";
}

/**
 * @brief Outcome of performLightAttack()/performHeavyAttack()
 */
struct AttackResult {
    bool success{false};
    AttackFailureReason failureReason{AttackFailureReason::None};
    std::string message;
};

/**
 * @brief One target hit by a resolved attack
 */
struct HitEvent {
    UnitID attackerId{INVALID_UNIT_ID};
    UnitID targetId{INVALID_UNIT_ID};
    Warband::AttackKind kind{Warband::AttackKind::Light};
    float damage{0.0f};           // damage actually dealt (0 when damage is disabled)
    float remainingHealth{0.0f};
    bool killed{false};
};

class CombatController
{
public:
    using HitListener = std::function<void(const HitEvent&)>;

    static constexpr std::string_view LIGHT_ATTACK_ANIMATION{"lightAttack"};
    static constexpr std::string_view HEAVY_ATTACK_ANIMATION{"heavyAttack"};
    static constexpr std::string_view HIT_ANIMATION{"hitToBody"};
    static constexpr std::string_view IDLE_ANIMATION{"idle"};
    static constexpr float DEFAULT_STAMINA{100.0f};

    CombatController(CombatHost& host, Warband::DeferredTaskScheduler& scheduler,
                     const Warband::CombatConfig& config = {});

    CombatController(const CombatController&) = delete;
    CombatController& operator=(const CombatController&) = delete;

    // --- Combat operations ---

    AttackResult performLightAttack(Unit& attacker, float now);
    AttackResult performHeavyAttack(Unit& attacker, float now);

    /**
     * @brief Start an attack if the unit is eligible
     * @param attacker Attacking unit
     * @param kind Light or heavy
     * @param now Simulation time in seconds (cooldown bookkeeping)
     * @return success, or the first failed eligibility check; never throws
     *
     * On success plays the attack animation, spends stamina, records the
     * attack time and schedules hit resolution after actionDelay and the end
     * of the attack after actionDuration.
     */
    AttackResult performAttack(Unit& attacker, Warband::AttackKind kind, float now);

    /**
     * @brief True iff not attacking, not stunned, stamina >= cost and off cooldown
     */
    [[nodiscard]] bool canAttack(const Unit& unit, Warband::AttackKind kind, float now) const;

    /// First failed eligibility check (None if the unit may attack)
    [[nodiscard]] AttackFailureReason checkAttack(const Unit& unit, Warband::AttackKind kind, float now) const;

    /**
     * @brief Regenerate stamina of units that are not attacking
     * @param units Units to update (units without combat state are skipped)
     * @param deltaTime Frame time in seconds
     * @param now Simulation time in seconds
     */
    void updateCombat(const std::vector<Unit*>& units, float deltaTime, float now);

    /**
     * @brief Subtract damage, clamped to [0, maxHealth]
     * @return true if the target is dead afterwards; false and no change when
     *         damage is disabled
     */
    bool applyDamage(Unit& target, float damage);

    void initializeCombat(Unit& unit, float stamina = DEFAULT_STAMINA);

    /**
     * @brief Set stamina (clamped >= 0, maxStamina grows to fit)
     *
     * A unit without combat state gets it initialized with this stamina.
     * @return true once the stamina is applied
     */
    bool setStamina(Unit& unit, float value);

    [[nodiscard]] std::vector<Unit*> getUnitsInAttackRange(const Unit& attacker, Warband::AttackKind kind);

    /// Attack parameters for a unit: its definition's combat config, else the controller's
    [[nodiscard]] const Warband::AttackConfig& getAttackConfig(const Unit& unit, Warband::AttackKind kind) const;

    // --- Configuration ---

    [[nodiscard]] const Warband::CombatConfig& getConfig() const { return m_config; }
    void setConfig(const Warband::CombatConfig& config) { m_config = config; }
    void setHitListener(HitListener listener) { m_hitListener = std::move(listener); }

private:
    const Warband::CombatConfig& resolveConfig(const Unit& unit) const;

    /// Deferred: gather targets in range now and apply knockback/damage/stun
    void resolveHit(UnitID attackerId, Warband::AttackKind kind, const Warband::AttackConfig& attack);

    /// Deferred: leave the attacking state
    void endAttack(UnitID attackerId);

    void applyStun(Unit& target, float duration);

    CombatHost& m_host;
    Warband::DeferredTaskScheduler& m_scheduler;
    Warband::CombatConfig m_config;
    HitListener m_hitListener;

    // Reused by resolveHit()
    std::vector<Unit*> m_targetScratch;
    std::vector<UnitID> m_targetIdScratch;
};

#endif // COMBAT_CONTROLLER_HPP
