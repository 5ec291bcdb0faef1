/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef COMBAT_HOST_HPP
#define COMBAT_HOST_HPP

/**
 * @file CombatHost.hpp
 * @brief World services the combat controller needs from its owner
 *
 * UnitManager implements this; tests substitute a recording mock.
 */

#include "entities/Unit.hpp"
#include <string_view>
#include <vector>

class CombatHost
{
public:
    virtual ~CombatHost() = default;

    /**
     * @brief Collect units within range of a position
     * @param position Query center
     * @param range Inclusive distance limit
     * @param exclude Unit to leave out (usually the attacker), may be null
     * @param outUnits Cleared and filled with the matches
     */
    virtual void queryUnitsInRange(const Vector3D& position, float range,
                                   const Unit* exclude, std::vector<Unit*>& outUnits) = 0;

    virtual void applyKnockback(Unit& unit, const Vector3D& direction, float force) = 0;

    virtual void playAnimation(Unit& unit, std::string_view name) = 0;

    /**
     * @brief Resolve a unit id, nullptr once the unit has been removed
     */
    virtual Unit* findUnit(UnitID id) = 0;
};

#endif // COMBAT_HOST_HPP
