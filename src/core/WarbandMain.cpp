/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/DeferredTaskScheduler.hpp"
#include "core/Logger.hpp"
#include "entities/AnimationSink.hpp"
#include "managers/UnitManager.hpp"
#include "utils/UnitConfigLoader.hpp"
#include <SDL3/SDL.h>
#include <array>
#include <cmath>
#include <cstdlib>
#include <format>
#include <memory>
#include <string>
#include <string_view>

namespace {

const std::string SIM_NAME{"Warband"};
constexpr float FIXED_TIMESTEP{1.0f / 60.0f};
constexpr float DEFAULT_DURATION{30.0f};
constexpr int ENEMY_COUNT{20};
constexpr int ENEMIES_PER_ROW{5};
constexpr float ENEMY_SPACING{1.5f};
constexpr float PLAYER_ATTACK_INTERVAL{2.0f};

// Stands in for a renderer: reports clip changes to the log
class LoggingAnimationSink : public AnimationSink {
public:
  void playAnimation([[maybe_unused]] const Unit& unit, [[maybe_unused]] std::string_view name,
                     [[maybe_unused]] float fadeDuration) override {
    SIM_DEBUG(std::format("Unit {} plays '{}' (fade {:.2f}s)", unit.id, name, fadeDuration));
  }

  void stopAnimations([[maybe_unused]] const Unit& unit) override {
    SIM_DEBUG(std::format("Unit {} stops all animations", unit.id));
  }

  [[nodiscard]] bool isAnimationPlaying(const Unit& unit, std::string_view name) const override {
    return unit.currentAnimation == name;
  }
};

struct SimOptions {
  std::string configPath;
  float duration{DEFAULT_DURATION};
  bool realtime{false};
};

bool parseArguments(int argc, char* argv[], SimOptions& options) {
  for (int i = 1; i < argc; ++i) {
    const std::string_view arg(argv[i]);
    if (arg == "--realtime") {
      options.realtime = true;
    } else if (arg == "--duration") {
      if (i + 1 >= argc) {
        SIM_ERROR("--duration needs a value in seconds");
        return false;
      }
      char* end = nullptr;
      const float seconds = std::strtof(argv[++i], &end);
      if (end == argv[i] || *end != '\0' || !(seconds > 0.0f)) {
        SIM_ERROR(std::format("Invalid duration '{}'", argv[i]));
        return false;
      }
      options.duration = seconds;
    } else if (arg == "--log-level") {
      if (i + 1 >= argc) {
        SIM_ERROR("--log-level needs one of critical, error, warning, info, debug");
        return false;
      }
      const auto level = Warband::logLevelFromString(argv[++i]);
      if (!level) {
        SIM_ERROR(std::format("Unknown log level '{}'", argv[i]));
        return false;
      }
      Warband::Logger::SetMinLevel(*level);
    } else if (!arg.empty() && arg.front() == '-') {
      SIM_ERROR(std::format("Unknown option '{}'", arg));
      return false;
    } else {
      options.configPath = std::string(arg);
    }
  }
  return true;
}

const UnitDefinition* findDefinitionOfType(const Warband::UnitSimulationConfig& config, UnitType type) {
  for (const UnitDefinition& definition : config.definitions) {
    if (definition.type == type) {
      return &definition;
    }
  }
  return nullptr;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
  SIM_INFO(std::format("Initializing {}", SIM_NAME));

  SimOptions options;
  if (!parseArguments(argc, argv, options)) {
    SIM_CRITICAL("Usage: warband_sim [config.json] [--duration seconds] [--realtime] [--log-level level]");
    return -1;
  }

  Warband::UnitSimulationConfig config = Warband::UnitConfigLoader::makeDefaultConfig();
  if (!options.configPath.empty()) {
    Warband::UnitConfigLoader loader;
    if (!loader.loadFromFile(options.configPath, config)) {
      SIM_CRITICAL(std::format("Failed to load {}: {}", options.configPath, loader.getLastError()));
      return -1;
    }
    SIM_INFO(std::format("Configuration loaded from {}", options.configPath));
  }

  const UnitDefinition* playerDefinition = findDefinitionOfType(config, UnitType::Player);
  const UnitDefinition* enemyDefinition = findDefinitionOfType(config, UnitType::Enemy);
  if (!playerDefinition || !enemyDefinition) {
    SIM_CRITICAL("Configuration needs at least one player and one enemy definition");
    return -1;
  }

  // Fixed step uses a manual clock so deferred hits line up with simulation time
  std::shared_ptr<Warband::TaskClock> clock;
  std::shared_ptr<Warband::ManualTaskClock> manualClock;
  if (options.realtime) {
    if (!SDL_Init(0)) {
      SIM_CRITICAL(std::format("SDL_Init failed: {}", SDL_GetError()));
      return -1;
    }
    clock = std::make_shared<Warband::SdlTaskClock>();
  } else {
    manualClock = std::make_shared<Warband::ManualTaskClock>();
    clock = manualClock;
  }

  UnitManager manager(config.manager, clock);
  LoggingAnimationSink animationSink;
  manager.setAnimationSink(&animationSink);

  for (const UnitDefinition& definition : config.definitions) {
    if (!manager.registerDefinition(definition)) {
      SIM_CRITICAL(std::format("Definition '{}' was rejected", definition.id));
      return -1;
    }
  }

  const Vector3D start(0.0f, 0.0f, 0.0f);
  Unit* player = manager.createUnit(playerDefinition->id, start);
  if (!player) {
    SIM_CRITICAL(std::format("Failed to spawn player: {}", createErrorToString(manager.getLastCreateError())));
    return -1;
  }
  const UnitID playerId = player->id;

  // Rows of five, each row shifted back along X and forward along Z
  for (int i = 0; i < ENEMY_COUNT; ++i) {
    const int row = i / ENEMIES_PER_ROW;
    const Vector3D position(start.getX() + 10.0f + i * ENEMY_SPACING - row * ENEMIES_PER_ROW * ENEMY_SPACING,
                            start.getY(),
                            start.getZ() - 10.0f + row * 2.0f);
    if (!manager.createUnit(enemyDefinition->id, position)) {
      SIM_ERROR(std::format("Failed to spawn enemy {}: {}", i, createErrorToString(manager.getLastCreateError())));
    }
  }

  [[maybe_unused]] size_t kills = 0;
  manager.getCombatController().setHitListener([&kills](const HitEvent& hit) {
    if (hit.killed) {
      ++kills;
    }
  });

  SIM_INFO(std::format("Starting simulation: {} units, {:.1f}s, {}", manager.getUnitCount(),
                       options.duration, options.realtime ? "realtime" : "fixed step"));

  float elapsed = 0.0f;
  float nextPlayerAttack = PLAYER_ATTACK_INTERVAL;
  bool heavyNext = false;
  uint64_t lastTicks = SDL_GetTicksNS();

  while (elapsed < options.duration) {
    float deltaTime = FIXED_TIMESTEP;
    if (options.realtime) {
      SDL_Delay(static_cast<Uint32>(FIXED_TIMESTEP * 1000.0f));
      const uint64_t ticks = SDL_GetTicksNS();
      deltaTime = static_cast<float>(ticks - lastTicks) / 1e9f;
      lastTicks = ticks;
    } else {
      manualClock->advance(FIXED_TIMESTEP);
    }
    elapsed += deltaTime;

    manager.update(deltaTime, elapsed);
    manager.updateCombat(deltaTime, elapsed);

    player = manager.getUnit(playerId);
    if (player && elapsed >= nextPlayerAttack) {
      const AttackResult result = heavyNext ? manager.performHeavyAttack(*player, elapsed)
                                            : manager.performLightAttack(*player, elapsed);
      if (result.success) {
        heavyNext = !heavyNext;
      } else {
        SIM_DEBUG(std::format("Player attack refused: {}", result.message));
      }
      nextPlayerAttack = elapsed + PLAYER_ATTACK_INTERVAL;
    }

    // Dead enemies leave the field
    for (Unit* enemy : manager.getUnitsByType(UnitType::Enemy)) {
      if (!enemy->isAlive()) {
        manager.removeUnit(enemy->id);
      }
    }
  }

  [[maybe_unused]] std::array<size_t, 5> stateCounts{};
  const auto enemies = manager.getUnitsByType(UnitType::Enemy);
  for (const Unit* enemy : enemies) {
    if (enemy->ai) {
      ++stateCounts[static_cast<size_t>(enemy->ai->state)];
    }
  }

  SIM_INFO(std::format("Simulated {:.1f}s: {} enemies alive, {} killed", elapsed, enemies.size(), kills));
  SIM_INFO(std::format("Enemy states: idle {}, patrol {}, chase {}, attack {}, return {}",
                       stateCounts[0], stateCounts[1], stateCounts[2], stateCounts[3], stateCounts[4]));

  SIM_INFO(std::format("{} shutting down", SIM_NAME));
  manager.dispose();
  if (options.realtime) {
    SDL_Quit();
  }

  return 0;
}
