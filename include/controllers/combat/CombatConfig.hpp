/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef COMBAT_CONFIG_HPP
#define COMBAT_CONFIG_HPP

#include <cstdint>
#include <ostream>

namespace Warband {

enum class AttackKind : uint8_t {
    Light = 0,
    Heavy = 1
};

inline const char* toString(AttackKind kind) {
    return kind == AttackKind::Light ? "light" : "heavy";
}

inline std::ostream& operator<<(std::ostream& os, AttackKind kind) {
    return os << toString(kind);
}

/**
 * @brief Parameters of one melee attack kind
 *
 * Times are seconds. actionDelay is the wind-up before the hit lands,
 * actionDuration the full swing after which the attacker may act again.
 */
struct AttackConfig {
    float damage = 10.0f;          // Health removed per target hit
    float knockback = 5.0f;        // Impulse applied away from the attacker (0 = none)
    float range = 2.5f;            // Targets within this distance are hit
    float cooldown = 1.0f;         // Seconds between two attacks of this kind
    float staminaCost = 20.0f;     // Stamina spent when the attack starts
    float stunDuration = 1.0f;     // Seconds the target stays stunned (0 = no stun)
    float actionDelay = 0.3f;      // Seconds from attack start to hit resolution
    float actionDuration = 1.0f;   // Seconds from attack start to attack end
};

/**
 * @brief Combat tuning for both attack kinds
 *
 * Preset configurations can be created via static factory methods.
 */
struct CombatConfig {
    AttackConfig lightAttack{};
    AttackConfig heavyAttack{25.0f, 10.0f, 3.0f, 2.0f, 40.0f, 2.0f, 0.5f, 1.5f};
    bool enableDamage = true;
    float staminaRegenRate = 10.0f;  // per second, only while not attacking

    const AttackConfig& get(AttackKind kind) const {
        return kind == AttackKind::Light ? lightAttack : heavyAttack;
    }

    AttackConfig& get(AttackKind kind) {
        return kind == AttackKind::Light ? lightAttack : heavyAttack;
    }

    /**
     * @brief Hard-hitting preset with longer knockback and stun
     */
    static CombatConfig highDamage() {
        CombatConfig config;
        config.lightAttack = {20.0f, 8.0f, 3.0f, 0.8f, 15.0f, 0.8f, 0.25f, 1.0f};
        config.heavyAttack = {50.0f, 15.0f, 3.5f, 1.5f, 30.0f, 1.5f, 0.4f, 1.5f};
        return config;
    }

    /**
     * @brief Quick preset: short cooldowns, cheap attacks, light hits
     */
    static CombatConfig fast() {
        CombatConfig config;
        config.lightAttack = {8.0f, 3.0f, 2.0f, 0.5f, 10.0f, 0.5f, 0.15f, 1.0f};
        config.heavyAttack = {18.0f, 6.0f, 2.5f, 1.0f, 25.0f, 1.0f, 0.3f, 1.5f};
        return config;
    }
};

} // namespace Warband

#endif // COMBAT_CONFIG_HPP
