/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef UNIT_HPP
#define UNIT_HPP

#include "ai/BehaviorConfig.hpp"
#include "controllers/combat/CombatConfig.hpp"
#include "utils/Vector3D.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <unordered_map>

/// Unique identifier of a live unit. 0 is never handed out.
using UnitID = uint64_t;
constexpr UnitID INVALID_UNIT_ID = 0;

/**
 * @brief Unit category, drives AI eligibility and player lookup
 */
enum class UnitType : uint8_t {
    Player = 0,
    Enemy = 1,
    NPC = 2
};

namespace UnitTraits {

/// Returns string name for UnitType (matches the data file spelling)
constexpr const char* typeToString(UnitType type) noexcept {
    switch (type) {
        case UnitType::Player: return "player";
        case UnitType::Enemy:  return "enemy";
        case UnitType::NPC:    return "npc";
        default:               return "unknown";
    }
}

/// Parses "player" / "enemy" / "npc"
inline std::optional<UnitType> typeFromString(std::string_view name) noexcept {
    if (name == "player") return UnitType::Player;
    if (name == "enemy")  return UnitType::Enemy;
    if (name == "npc")    return UnitType::NPC;
    return std::nullopt;
}

} // namespace UnitTraits

inline std::ostream& operator<<(std::ostream& os, UnitType type) {
    return os << UnitTraits::typeToString(type);
}

/**
 * @brief Base stats copied into every unit created from a definition
 */
struct UnitStats {
    float speed{1.0f};
    float health{100.0f};
    float attackDamage{0.0f};
    float collisionRadius{0.5f};
    float stamina{100.0f};
};

/**
 * @brief Per-definition or per-unit physics overrides
 *
 * Unset fields fall back to UnitManagerConfig.
 */
struct PhysicsOverrides {
    std::optional<float> mass;
    std::optional<float> friction;        // knockback decay factor per update
    std::optional<float> velocityDecay;   // fraction of velocity lost per second
    std::optional<bool> enableGravity;
    std::optional<float> gravityForce;
};

/**
 * @brief Immutable unit template, shared read-only by every unit spawned from it
 */
struct UnitDefinition {
    std::string id;
    UnitType type{UnitType::Enemy};
    UnitStats stats{};
    std::optional<Warband::AIBehaviorConfig> ai;
    std::optional<Warband::CombatConfig> combat;
    std::optional<PhysicsOverrides> physics;
};

/**
 * @brief Optional stat replacements applied at spawn time
 */
struct StatsOverride {
    std::optional<float> speed;
    std::optional<float> health;
    std::optional<float> attackDamage;
    std::optional<float> collisionRadius;
};

/**
 * @brief Physics channels of a unit (created lazily on first use)
 */
struct PhysicsState {
    Vector3D velocity{};
    Vector3D knockbackVelocity{};
    Vector3D oldPosition{};
    PhysicsOverrides overrides{};
};

/**
 * @brief Behavior state machine states
 */
enum class AIBehaviorState : uint8_t {
    Idle = 0,
    Patrol = 1,
    Chase = 2,
    Attack = 3,
    Return = 4
};

constexpr const char* behaviorStateToString(AIBehaviorState state) noexcept {
    switch (state) {
        case AIBehaviorState::Idle:   return "idle";
        case AIBehaviorState::Patrol: return "patrol";
        case AIBehaviorState::Chase:  return "chase";
        case AIBehaviorState::Attack: return "attack";
        case AIBehaviorState::Return: return "return";
        default:                      return "unknown";
    }
}

inline std::ostream& operator<<(std::ostream& os, AIBehaviorState state) {
    return os << behaviorStateToString(state);
}

/**
 * @brief Per-unit behavior bookkeeping (non-player units only)
 */
struct AIBehaviorData {
    AIBehaviorState state{AIBehaviorState::Idle};
    Vector3D targetPosition{};
    UnitID targetUnit{INVALID_UNIT_ID};  // lookup only, may refer to a removed unit
    float resumeTime{0.0f};
    float nextTargetUpdateTime{0.0f};
    Vector3D homePosition{};
    bool isAttacking{false};
    Warband::AIBehaviorConfig config{};
};

/**
 * @brief Per-unit combat bookkeeping
 */
struct CombatData {
    std::optional<float> lastLightAttackTime;  // unset = never attacked
    std::optional<float> lastHeavyAttackTime;
    bool isAttacking{false};
    float stamina{100.0f};
    float maxStamina{100.0f};

    std::optional<float>& lastAttackTime(Warband::AttackKind kind) {
        return kind == Warband::AttackKind::Light ? lastLightAttackTime : lastHeavyAttackTime;
    }

    const std::optional<float>& lastAttackTime(Warband::AttackKind kind) const {
        return kind == Warband::AttackKind::Light ? lastLightAttackTime : lastHeavyAttackTime;
    }
};

/**
 * @brief Runtime unit instance, owned by UnitRegistry
 *
 * Subsystem state is optional: a unit carries AI data only when it is a
 * non-player unit with an AI config. UnitManager gives every unit it spawns
 * physics and combat state; a bare registry unit gets physics state from the
 * first physics mutator.
 */
struct Unit {
    // Identity
    UnitID id{INVALID_UNIT_ID};
    std::shared_ptr<const UnitDefinition> definition;

    // Transform (rotation is yaw about +Y in radians)
    Vector3D position{};
    float rotation{0.0f};

    // Mutable stats
    float health{100.0f};
    float maxHealth{100.0f};
    float speed{1.0f};
    float attackDamage{0.0f};
    float collisionRadius{0.5f};

    std::optional<PhysicsState> physics;
    std::optional<AIBehaviorData> ai;
    std::optional<CombatData> combat;

    // Status
    bool stunned{false};
    uint32_t stunGeneration{0};  // bumped on every new stun

    std::string currentAnimation;
    std::unordered_map<std::string, std::string> userData;

    [[nodiscard]] UnitType getType() const {
        return definition ? definition->type : UnitType::Enemy;
    }
    [[nodiscard]] bool isPlayer() const { return getType() == UnitType::Player; }
    [[nodiscard]] bool isAlive() const { return health > 0.0f; }
    [[nodiscard]] const std::string& getDefinitionId() const {
        static const std::string empty;
        return definition ? definition->id : empty;
    }
};

#endif // UNIT_HPP
