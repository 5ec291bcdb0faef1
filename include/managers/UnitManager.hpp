/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef UNIT_MANAGER_HPP
#define UNIT_MANAGER_HPP

/**
 * @file UnitManager.hpp
 * @brief Orchestrates the unit simulation each frame
 *
 * UnitManager owns the UnitRegistry, the DeferredTaskScheduler and both
 * controllers, and is the single entry point for gameplay code.
 *
 * update(deltaTime, elapsedTime) runs, in order:
 *  1. deferred tasks that are due on the scheduler clock
 *  2. player lookup
 *  3. AI-eligible unit selection (non-player, has AI state, not stunned)
 *  4. AIBehaviorController::updateBehaviors()
 *  5. behavior state -> animation name through the AnimationSink
 *  6. physics integration (knockback, velocity, gravity)
 *  7. old position snapshot
 *  8. pairwise collision separation (single pass, insertion order)
 *
 * Not a singleton: every instance is an independent simulation.
 */

#include "ai/AIBehaviorController.hpp"
#include "controllers/combat/CombatController.hpp"
#include "controllers/combat/CombatHost.hpp"
#include "core/DeferredTaskScheduler.hpp"
#include "managers/UnitManagerConfig.hpp"
#include "managers/UnitRegistry.hpp"
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

class AnimationSink;
class TerrainQuery;

class UnitManager : public CombatHost
{
public:
    /**
     * @param config Simulation tuning
     * @param clock Scheduler time source; nullptr selects the SDL wall clock
     */
    explicit UnitManager(const Warband::UnitManagerConfig& config = {},
                         std::shared_ptr<Warband::TaskClock> clock = nullptr);
    ~UnitManager() override = default;

    UnitManager(const UnitManager&) = delete;
    UnitManager& operator=(const UnitManager&) = delete;

    // --- Definitions and lifecycle ---

    bool registerDefinition(const UnitDefinition& definition);

    /**
     * @brief Spawn a unit and initialize its physics, combat and AI state
     * @return nullptr on failure, see getLastCreateError()
     */
    Unit* createUnit(const UnitCreateParams& params);
    Unit* createUnit(const std::string& definitionId, const Vector3D& position, float rotation = 0.0f);
    [[nodiscard]] UnitCreateError getLastCreateError() const { return m_registry.getLastCreateError(); }

    /**
     * @brief Remove a unit and cancel every deferred task keyed by its id
     * @return false if the id is unknown
     */
    bool removeUnit(UnitID id);

    [[nodiscard]] Unit* getUnit(UnitID id) { return m_registry.getUnit(id); }
    [[nodiscard]] Unit* getPlayer() { return m_registry.getPlayer(); }
    [[nodiscard]] std::vector<Unit*> getAllUnits() const { return m_registry.getAllUnits(); }
    [[nodiscard]] std::vector<Unit*> getUnitsByType(UnitType type) const { return m_registry.getUnitsByType(type); }
    [[nodiscard]] std::vector<Unit*> getUnitsInRange(const Vector3D& position, float range,
                                                     const Unit* exclude = nullptr) const;
    [[nodiscard]] size_t getUnitCount() const { return m_registry.getUnitCount(); }

    /**
     * @brief Advance the simulation one frame
     * @param deltaTime Frame time in seconds
     * @param elapsedTime Simulation time in seconds
     */
    void update(float deltaTime, float elapsedTime);

    /// Run deferred tasks that are due now; returns how many ran
    size_t processDeferredTasks();

    /// Cancel all deferred tasks, stop animations, drop all units and definitions
    void dispose();

    // --- Physics ---

    /// knockbackVelocity += normalize(direction) * force / mass
    void applyKnockback(Unit& unit, const Vector3D& direction, float force) override;
    void setUnitVelocity(Unit& unit, const Vector3D& velocity);
    void addUnitVelocity(Unit& unit, const Vector3D& velocity);
    void stopUnitMovement(Unit& unit);

    /// distance < sum of collision radii
    [[nodiscard]] static bool checkUnitCollision(const Unit& unit1, const Unit& unit2);

    // --- Combat ---

    AttackResult performLightAttack(Unit& attacker, float now) { return m_combat.performLightAttack(attacker, now); }
    AttackResult performHeavyAttack(Unit& attacker, float now) { return m_combat.performHeavyAttack(attacker, now); }
    [[nodiscard]] bool canAttack(const Unit& unit, Warband::AttackKind kind, float now) const {
        return m_combat.canAttack(unit, kind, now);
    }
    bool setStamina(Unit& unit, float value) { return m_combat.setStamina(unit, value); }
    void updateCombat(const std::vector<Unit*>& units, float deltaTime, float now) {
        m_combat.updateCombat(units, deltaTime, now);
    }
    /// Stamina regeneration for every unit
    void updateCombat(float deltaTime, float now);

    // --- Behavior ---

    void initializeBehavior(Unit& unit, std::optional<Vector3D> homePosition = std::nullopt) {
        m_ai.initializeBehavior(unit, homePosition);
    }
    bool setBehaviorState(Unit& unit, AIBehaviorState state) { return m_ai.setBehaviorState(unit, state); }
    [[nodiscard]] AIBehaviorData* getBehaviorData(Unit& unit) { return AIBehaviorController::getBehaviorData(unit); }

    // --- Animation ---

    /// Non-owning; the sink must outlive its use by this manager (nullptr detaches)
    void setAnimationSink(AnimationSink* sink) { mp_animationSink = sink; }
    [[nodiscard]] AnimationSink* getAnimationSink() const { return mp_animationSink; }

    void playAnimation(Unit& unit, std::string_view name) override;
    void playAnimation(Unit& unit, std::string_view name, float fadeDuration);
    void stopAnimations(Unit& unit);
    [[nodiscard]] bool isAnimationPlaying(const Unit& unit, std::string_view name) const;

    // --- World ---

    /// Non-owning; nullptr detaches
    void setTerrainQuery(const TerrainQuery* terrain) { mp_terrain = terrain; }

    // --- CombatHost ---

    void queryUnitsInRange(const Vector3D& position, float range, const Unit* exclude,
                           std::vector<Unit*>& outUnits) override;
    Unit* findUnit(UnitID id) override { return m_registry.getUnit(id); }

    // --- Owned systems ---

    [[nodiscard]] UnitRegistry& getRegistry() { return m_registry; }
    [[nodiscard]] Warband::DeferredTaskScheduler& getScheduler() { return m_scheduler; }
    [[nodiscard]] AIBehaviorController& getAIController() { return m_ai; }
    [[nodiscard]] CombatController& getCombatController() { return m_combat; }
    [[nodiscard]] const Warband::UnitManagerConfig& getConfig() const { return m_config; }

    void setEnabled(bool enabled) { m_config.enabled = enabled; }
    void setCollisionEnabled(bool enabled) { m_config.enableCollision = enabled; }

private:
    PhysicsState& ensurePhysics(Unit& unit);
    [[nodiscard]] float resolveMass(const Unit& unit) const;

    void integratePhysics(Unit& unit, float deltaTime);
    void resolveCollisions();

    Warband::UnitManagerConfig m_config;
    UnitRegistry m_registry;
    Warband::DeferredTaskScheduler m_scheduler;
    AIBehaviorController m_ai;
    CombatController m_combat;

    AnimationSink* mp_animationSink{nullptr};
    const TerrainQuery* mp_terrain{nullptr};

    // Reused every update
    std::vector<Unit*> m_aiUnits;
    std::vector<Unit*> m_allUnits;
};

#endif // UNIT_MANAGER_HPP
