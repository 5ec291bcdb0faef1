/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/UnitRegistry.hpp"
#include "core/Logger.hpp"
#include <format>

UnitRegistry::UnitRegistry(size_t maxUnits) : m_maxUnits(maxUnits) {
    m_units.reserve(64);
}

bool UnitRegistry::registerDefinition(const UnitDefinition& definition) {
    if (definition.id.empty()) {
        UNIT_ERROR("Cannot register unit definition with empty id");
        return false;
    }
    if (definition.stats.health <= 0.0f || definition.stats.collisionRadius <= 0.0f) {
        UNIT_ERROR(std::format("Unit definition '{}' rejected: health ({}) and collisionRadius ({}) must be positive",
                               definition.id, definition.stats.health, definition.stats.collisionRadius));
        return false;
    }
    if (m_definitions.contains(definition.id)) {
        UNIT_ERROR(std::format("Unit definition '{}' is already registered - keeping the original", definition.id));
        return false;
    }

    m_definitions.emplace(definition.id, std::make_shared<const UnitDefinition>(definition));
    UNIT_DEBUG(std::format("Registered unit definition '{}' ({})",
                           definition.id, UnitTraits::typeToString(definition.type)));
    return true;
}

std::shared_ptr<const UnitDefinition> UnitRegistry::getDefinition(const std::string& id) const {
    auto it = m_definitions.find(id);
    return it != m_definitions.end() ? it->second : nullptr;
}

Unit* UnitRegistry::createUnit(const UnitCreateParams& params) {
    auto definition = getDefinition(params.definitionId);
    if (!definition) {
        m_lastCreateError = UnitCreateError::UnknownDefinition;
        UNIT_ERROR(std::format("Unknown unit definition '{}'", params.definitionId));
        return nullptr;
    }

    if (m_units.size() >= m_maxUnits) {
        m_lastCreateError = UnitCreateError::CapacityExceeded;
        UNIT_WARN(std::format("Unit capacity reached ({}) - cannot spawn '{}'", m_maxUnits, params.definitionId));
        return nullptr;
    }

    const StatsOverride& overrides = params.statsOverride;
    const float health = overrides.health.value_or(definition->stats.health);
    const float radius = overrides.collisionRadius.value_or(definition->stats.collisionRadius);
    if (health <= 0.0f || radius <= 0.0f) {
        m_lastCreateError = UnitCreateError::InvalidStats;
        UNIT_ERROR(std::format("Invalid stats for '{}': health {}, collisionRadius {}",
                               params.definitionId, health, radius));
        return nullptr;
    }

    auto unit = std::make_unique<Unit>();
    unit->id = m_nextId++;
    unit->definition = definition;
    unit->position = params.position;
    unit->rotation = params.rotation;
    unit->health = health;
    unit->maxHealth = health;
    unit->speed = overrides.speed.value_or(definition->stats.speed);
    unit->attackDamage = overrides.attackDamage.value_or(definition->stats.attackDamage);
    unit->collisionRadius = radius;
    unit->userData = params.userData;

    Unit* raw = unit.get();
    m_idToIndex.emplace(raw->id, m_units.size());
    m_units.push_back(std::move(unit));
    m_lastCreateError = UnitCreateError::None;

    UNIT_DEBUG(std::format("Created unit {} from '{}'", raw->id, params.definitionId));
    return raw;
}

bool UnitRegistry::removeUnit(UnitID id) {
    auto it = m_idToIndex.find(id);
    if (it == m_idToIndex.end()) {
        return false;
    }

    const size_t index = it->second;
    m_idToIndex.erase(it);
    m_units.erase(m_units.begin() + static_cast<std::ptrdiff_t>(index));
    rebuildIndexFrom(index);

    UNIT_DEBUG(std::format("Removed unit {}", id));
    return true;
}

Unit* UnitRegistry::getUnit(UnitID id) {
    auto it = m_idToIndex.find(id);
    return it != m_idToIndex.end() ? m_units[it->second].get() : nullptr;
}

const Unit* UnitRegistry::getUnit(UnitID id) const {
    auto it = m_idToIndex.find(id);
    return it != m_idToIndex.end() ? m_units[it->second].get() : nullptr;
}

Unit* UnitRegistry::getPlayer() {
    for (const auto& unit : m_units) {
        if (unit->isPlayer()) {
            return unit.get();
        }
    }
    return nullptr;
}

std::vector<Unit*> UnitRegistry::getAllUnits() const {
    std::vector<Unit*> result;
    result.reserve(m_units.size());
    for (const auto& unit : m_units) {
        result.push_back(unit.get());
    }
    return result;
}

std::vector<Unit*> UnitRegistry::getUnitsByType(UnitType type) const {
    std::vector<Unit*> result;
    for (const auto& unit : m_units) {
        if (unit->getType() == type) {
            result.push_back(unit.get());
        }
    }
    return result;
}

void UnitRegistry::getUnitsInRange(const Vector3D& position, float range, const Unit* exclude,
                                   std::vector<Unit*>& outUnits) const {
    outUnits.clear();
    const float rangeSq = range * range;
    for (const auto& unit : m_units) {
        if (unit.get() == exclude) {
            continue;
        }
        if (Vector3D::distanceSquared(unit->position, position) <= rangeSq) {
            outUnits.push_back(unit.get());
        }
    }
}

std::vector<Unit*> UnitRegistry::getUnitsInRange(const Vector3D& position, float range,
                                                 const Unit* exclude) const {
    std::vector<Unit*> result;
    getUnitsInRange(position, range, exclude, result);
    return result;
}

void UnitRegistry::clear() {
    m_units.clear();
    m_idToIndex.clear();
    m_lastCreateError = UnitCreateError::None;
}

void UnitRegistry::rebuildIndexFrom(size_t start) {
    for (size_t i = start; i < m_units.size(); ++i) {
        m_idToIndex[m_units[i]->id] = i;
    }
}
