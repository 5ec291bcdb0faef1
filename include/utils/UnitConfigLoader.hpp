/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef UNIT_CONFIG_LOADER_HPP
#define UNIT_CONFIG_LOADER_HPP

#include "entities/Unit.hpp"
#include "managers/UnitManagerConfig.hpp"
#include "utils/JsonReader.hpp"
#include <limits>
#include <string>
#include <vector>

namespace Warband {

/**
 * @brief Everything needed to set up a simulation from a data file
 */
struct UnitSimulationConfig {
    UnitManagerConfig manager{};
    std::vector<UnitDefinition> definitions;
};

/**
 * @brief Reads UnitManager tuning and unit definitions from JSON
 *
 * Layout:
 * @code
 * { "manager":     { "maxUnits": 200, "collision": { "minDistance": 1.0 }, "ai": { ... } },
 *   "combat":      { "enableDamage": true, "lightAttack": { ... }, "heavyAttack": { ... } },
 *   "definitions": [ { "id": "zombie", "type": "enemy", "stats": { ... },
 *                      "ai": "aggressive" | { ... }, "combat": { ... }, "physics": { ... } } ] }
 * @endcode
 *
 * Missing keys keep their struct defaults. A key with the wrong type, an
 * unknown unit type or preset name fails the whole load; the reason is
 * available from getLastError().
 */
class UnitConfigLoader {
public:
    bool loadFromFile(const std::string& path, UnitSimulationConfig& outConfig);
    bool loadFromString(const std::string& json, UnitSimulationConfig& outConfig);

    [[nodiscard]] const std::string& getLastError() const { return m_lastError; }

    /// Built-in setup: a human player and a zombie enemy
    [[nodiscard]] static UnitSimulationConfig makeDefaultConfig();

private:
    bool parseRoot(const JsonValue& root, UnitSimulationConfig& outConfig);
    bool parseManager(const JsonValue& node, UnitManagerConfig& config);
    bool parseAI(const JsonValue& node, const std::string& path, AIBehaviorConfig& config);
    bool parseCombat(const JsonValue& node, const std::string& path, CombatConfig& config);
    bool parseAttack(const JsonValue& node, const std::string& path, AttackConfig& config);
    bool parsePhysics(const JsonValue& node, const std::string& path, PhysicsOverrides& overrides);
    bool parseDefinition(const JsonValue& node, const std::string& path, UnitDefinition& definition);

    bool readFloat(const JsonValue& object, const char* key, const std::string& path, float& out);
    bool readOptionalFloat(const JsonValue& object, const char* key, const std::string& path,
                           std::optional<float>& out);
    bool readBool(const JsonValue& object, const char* key, const std::string& path, bool& out);
    // Integer in [0, maxValue]; anything else fails without touching out
    bool readCount(const JsonValue& object, const char* key, const std::string& path, size_t& out,
                   size_t maxValue = std::numeric_limits<size_t>::max());

    bool fail(const std::string& message);

    std::string m_lastError;
};

} // namespace Warband

#endif // UNIT_CONFIG_LOADER_HPP
