/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef UNIT_REGISTRY_HPP
#define UNIT_REGISTRY_HPP

/**
 * @file UnitRegistry.hpp
 * @brief Owner of unit definitions and unit instances
 *
 * Pure data and lifecycle: registering definitions, spawning units from them,
 * removing units and answering lookups. Behavior, combat and physics state is
 * initialized and driven by UnitManager and its controllers.
 *
 * Units are kept in insertion order; that order is the iteration order of
 * every query and of collision resolution.
 */

#include "entities/Unit.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <ostream>
#include <string>
#include <unordered_map>
#include <vector>

enum class UnitCreateError : uint8_t {
    None = 0,
    UnknownDefinition,  // definitionId was never registered
    CapacityExceeded,   // registry already holds maxUnits units
    InvalidStats        // stat override would break an invariant (e.g. radius <= 0)
};

constexpr const char* createErrorToString(UnitCreateError error) noexcept {
    switch (error) {
        case UnitCreateError::None:              return "None";
        case UnitCreateError::UnknownDefinition: return "UnknownDefinition";
        case UnitCreateError::CapacityExceeded:  return "CapacityExceeded";
        case UnitCreateError::InvalidStats:      return "InvalidStats";
    }
    return "Unknown";
}

inline std::ostream& operator<<(std::ostream& os, UnitCreateError error) {
    return os << createErrorToString(error);
}

/**
 * @brief Spawn request for UnitRegistry::createUnit()
 */
struct UnitCreateParams {
    std::string definitionId;
    Vector3D position{};
    float rotation{0.0f};
    StatsOverride statsOverride{};
    std::unordered_map<std::string, std::string> userData{};
};

class UnitRegistry
{
public:
    explicit UnitRegistry(size_t maxUnits = 1000);

    UnitRegistry(const UnitRegistry&) = delete;
    UnitRegistry& operator=(const UnitRegistry&) = delete;

    // --- Definitions ---

    /**
     * @brief Add a unit template to the catalog
     * @return false if the id is already registered (the original is kept)
     *         or the definition is invalid (empty id, health or radius <= 0)
     */
    bool registerDefinition(const UnitDefinition& definition);

    [[nodiscard]] std::shared_ptr<const UnitDefinition> getDefinition(const std::string& id) const;
    [[nodiscard]] bool hasDefinition(const std::string& id) const { return m_definitions.contains(id); }
    [[nodiscard]] size_t getDefinitionCount() const { return m_definitions.size(); }
    void clearDefinitions() { m_definitions.clear(); }

    // --- Units ---

    /**
     * @brief Spawn a unit from a registered definition
     * @return Owned-by-registry unit, or nullptr (see getLastCreateError())
     */
    Unit* createUnit(const UnitCreateParams& params);

    /// Reason the last createUnit() call failed (None after a success)
    [[nodiscard]] UnitCreateError getLastCreateError() const { return m_lastCreateError; }

    /**
     * @brief Destroy a unit
     * @return false if the id is unknown
     */
    bool removeUnit(UnitID id);

    [[nodiscard]] Unit* getUnit(UnitID id);
    [[nodiscard]] const Unit* getUnit(UnitID id) const;
    [[nodiscard]] bool contains(UnitID id) const { return m_idToIndex.contains(id); }

    /// First player unit in insertion order, nullptr if none
    [[nodiscard]] Unit* getPlayer();

    [[nodiscard]] std::vector<Unit*> getAllUnits() const;
    [[nodiscard]] std::vector<Unit*> getUnitsByType(UnitType type) const;

    /**
     * @brief Linear scan for units with distance <= range
     * @param exclude Unit to skip, may be null
     * @param outUnits Cleared, then filled in insertion order
     */
    void getUnitsInRange(const Vector3D& position, float range, const Unit* exclude,
                         std::vector<Unit*>& outUnits) const;

    [[nodiscard]] std::vector<Unit*> getUnitsInRange(const Vector3D& position, float range,
                                                     const Unit* exclude = nullptr) const;

    [[nodiscard]] size_t getUnitCount() const { return m_units.size(); }
    [[nodiscard]] size_t getMaxUnits() const { return m_maxUnits; }
    void setMaxUnits(size_t maxUnits) { m_maxUnits = maxUnits; }

    /// Direct access for the per-frame loops (insertion order)
    [[nodiscard]] const std::vector<std::unique_ptr<Unit>>& units() const { return m_units; }

    /// Remove every unit (definitions are kept)
    void clear();

private:
    void rebuildIndexFrom(size_t start);

    std::unordered_map<std::string, std::shared_ptr<const UnitDefinition>> m_definitions;
    std::vector<std::unique_ptr<Unit>> m_units;
    std::unordered_map<UnitID, size_t> m_idToIndex;

    size_t m_maxUnits;
    UnitID m_nextId{1};
    UnitCreateError m_lastCreateError{UnitCreateError::None};
};

#endif // UNIT_REGISTRY_HPP
