/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef AI_BEHAVIOR_CONTROLLER_HPP
#define AI_BEHAVIOR_CONTROLLER_HPP

/**
 * @file AIBehaviorController.hpp
 * @brief Per-unit behavior state machine (idle/patrol/chase/attack/return)
 *
 * Every eligible unit periodically re-evaluates its target against the
 * player, then acts on its current state. Decisions for all units are made
 * against the positions they had at the start of the update; the resulting
 * moves are staged and applied once every unit has decided.
 *
 * Each controller owns its RNG and scratch buffers so independent
 * simulations (and tests) never share state.
 */

#include "ai/BehaviorConfig.hpp"
#include "entities/Unit.hpp"
#include <cstdint>
#include <optional>
#include <random>
#include <string_view>
#include <vector>

class UnitRegistry;

class AIBehaviorController
{
public:
    // Transition thresholds (world units)
    static constexpr float PATROL_ARRIVAL_DISTANCE{1.5f};
    static constexpr float HOME_ARRIVAL_DISTANCE{2.0f};
    static constexpr float ATTACK_EXIT_MULTIPLIER{1.5f};   // hysteresis band
    static constexpr float ATTACK_PAUSE_MAX{3.0f};         // seconds

    /**
     * @param registry Used to resolve target unit ids (a removed target reads as lost)
     * @param defaultConfig Config for units whose definition carries no AI config
     * @param seed RNG seed for pauses, reselection jitter and patrol points
     */
    explicit AIBehaviorController(UnitRegistry& registry,
                                  const Warband::AIBehaviorConfig& defaultConfig = {},
                                  uint32_t seed = std::random_device{}());

    AIBehaviorController(const AIBehaviorController&) = delete;
    AIBehaviorController& operator=(const AIBehaviorController&) = delete;

    /**
     * @brief Attach behavior data to a unit, starting idle
     * @param unit Unit to initialize (existing data is replaced)
     * @param homePosition Anchor for patrol/return; defaults to the unit position
     *
     * The config comes from the unit's definition when it has one, otherwise
     * the controller default is used.
     */
    void initializeBehavior(Unit& unit, std::optional<Vector3D> homePosition = std::nullopt);

    void initializeBehavior(Unit& unit, const Warband::AIBehaviorConfig& config,
                            std::optional<Vector3D> homePosition = std::nullopt);

    /**
     * @brief Advance every unit's state machine by one frame
     * @param units Units to update; units without behavior data are skipped
     * @param player Player unit, or nullptr if there is none
     * @param deltaTime Frame time in seconds
     * @param elapsedTime Simulation time in seconds
     */
    void updateBehaviors(const std::vector<Unit*>& units, const Unit* player,
                         float deltaTime, float elapsedTime);

    /**
     * @brief Re-evaluate a unit's target against the player now
     *
     * Reschedules the next reselection. With no player only the schedule is
     * updated and the per-state logic handles a lost target.
     */
    void updateTarget(Unit& unit, const Unit* player, float elapsedTime);

    /// Force a state, false if the unit has no behavior data
    bool setBehaviorState(Unit& unit, AIBehaviorState state);

    [[nodiscard]] static AIBehaviorData* getBehaviorData(Unit& unit);
    [[nodiscard]] static const AIBehaviorData* getBehaviorData(const Unit& unit);

    /// Animation clip name that represents a behavior state
    [[nodiscard]] static std::string_view animationForState(AIBehaviorState state);

    [[nodiscard]] const Warband::AIBehaviorConfig& getDefaultConfig() const { return m_defaultConfig; }
    void setDefaultConfig(const Warband::AIBehaviorConfig& config) { m_defaultConfig = config; }
    void setSeed(uint32_t seed) { m_rng.seed(seed); }

private:
    struct StagedMove {
        Unit* unit;
        Vector3D position;
        float rotation;
    };

    float random01() { return m_random01(m_rng); }

    const Unit* resolveTarget(const AIBehaviorData& data) const;
    void beginReturn(AIBehaviorData& data);

    /**
     * @brief Compute one movement step toward target without touching the unit
     * @return Staged position/rotation after the step
     */
    StagedMove stepToward(Unit& unit, const Vector3D& target, const Warband::AIBehaviorConfig& config,
                          float deltaTime) const;

    UnitRegistry& m_registry;
    Warband::AIBehaviorConfig m_defaultConfig;
    std::mt19937 m_rng;
    std::uniform_real_distribution<float> m_random01{0.0f, 1.0f};

    // Reused every update
    std::vector<StagedMove> m_stagedMoves;
};

#endif // AI_BEHAVIOR_CONTROLLER_HPP
