/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

// Required includes for logging system:
// - string: Used in macro expansions for std::string() conversions
// - cstdio: Required for printf() and fflush() functions
// - cstdint: Required for uint8_t type
// - mutex: Required for thread-safe logging
// - atomic: Required for the std::atomic level threshold
#include <atomic> // IWYU pragma: keep - Required for std::atomic level threshold
#include <cstdint> // IWYU pragma: keep - Required for uint8_t type
#include <cstdio> // IWYU pragma: keep - Required for printf() and fflush() functions
#include <mutex> // IWYU pragma: keep - Required for thread-safe logging
#include <optional>
#include <string> // IWYU pragma: keep - Required for std::string() conversions in macros
#include <string_view>

namespace Warband {
enum class LogLevel : uint8_t {
  CRITICAL = 0,     // Always logs (even in release for crashes)
  ERROR_LEVEL = 1,  // Always logs (renamed to avoid macro conflicts)
  WARNING = 2,      // Debug only
  INFO = 3,         // Debug only
  DEBUG_LEVEL = 4   // Debug only (renamed to avoid macro conflicts)
};

constexpr const char *logLevelToString(LogLevel level) noexcept {
  switch (level) {
  case LogLevel::CRITICAL:
    return "CRITICAL";
  case LogLevel::ERROR_LEVEL:
    return "ERROR";
  case LogLevel::WARNING:
    return "WARNING";
  case LogLevel::INFO:
    return "INFO";
  case LogLevel::DEBUG_LEVEL:
    return "DEBUG";
  }
  return "UNKNOWN";
}

/**
 * @brief Parse a level name as accepted on the command line
 * @return nullopt for anything but critical, error, warning, info or debug
 */
inline std::optional<LogLevel> logLevelFromString(std::string_view name) {
  if (name == "critical") return LogLevel::CRITICAL;
  if (name == "error") return LogLevel::ERROR_LEVEL;
  if (name == "warning") return LogLevel::WARNING;
  if (name == "info") return LogLevel::INFO;
  if (name == "debug") return LogLevel::DEBUG_LEVEL;
  return std::nullopt;
}

class Logger {
private:
  static std::atomic<uint8_t> s_minLevel;
  static std::mutex s_logMutex;

public:
  /**
   * @brief Drop messages less severe than level
   *
   * CRITICAL always passes. Release builds have already compiled out
   * everything below ERROR.
   */
  static void SetMinLevel(LogLevel level) {
    s_minLevel.store(static_cast<uint8_t>(level), std::memory_order_relaxed);
  }

  static LogLevel GetMinLevel() {
    return static_cast<LogLevel>(s_minLevel.load(std::memory_order_relaxed));
  }

  static bool ShouldLog(LogLevel level) {
    return level == LogLevel::CRITICAL ||
           static_cast<uint8_t>(level) <= s_minLevel.load(std::memory_order_relaxed);
  }

  static void Log(LogLevel level, const char *system,
                  const std::string &message) {
    Log(level, system, message.c_str());
  }

#ifdef DEBUG
  // Console logging in debug builds
  static void Log(LogLevel level, const char *system, const char *message) {
    if (!ShouldLog(level)) {
      return;
    }

    std::lock_guard<std::mutex> lock(s_logMutex);
    printf("Warband - [%s] %s: %s\n", system, logLevelToString(level), message);
    fflush(stdout);
  }
#else
  // Release builds write to a log file; defined in Logger.cpp
  static void Log(LogLevel level, const char *system, const char *message);
#endif
};

#ifdef DEBUG
#define WARBAND_CRITICAL(system, msg)                                          \
  Warband::Logger::Log(Warband::LogLevel::CRITICAL, system, msg)
#define WARBAND_ERROR(system, msg)                                             \
  Warband::Logger::Log(Warband::LogLevel::ERROR_LEVEL, system, msg)
#define WARBAND_WARN(system, msg)                                              \
  Warband::Logger::Log(Warband::LogLevel::WARNING, system, msg)
#define WARBAND_INFO(system, msg)                                              \
  Warband::Logger::Log(Warband::LogLevel::INFO, system, msg)
#define WARBAND_DEBUG(system, msg)                                             \
  Warband::Logger::Log(Warband::LogLevel::DEBUG_LEVEL, system, msg)
#else
// Release builds - CRITICAL/ERROR go to a log file, everything else compiles out
#define WARBAND_CRITICAL(system, msg)                                          \
  Warband::Logger::Log(Warband::LogLevel::CRITICAL, system, msg)
#define WARBAND_ERROR(system, msg)                                             \
  Warband::Logger::Log(Warband::LogLevel::ERROR_LEVEL, system, msg)

#define WARBAND_WARN(system, msg) ((void)0)  // Zero overhead
#define WARBAND_INFO(system, msg) ((void)0)  // Zero overhead
#define WARBAND_DEBUG(system, msg) ((void)0) // Zero overhead
#endif

inline std::atomic<uint8_t> Logger::s_minLevel{
    static_cast<uint8_t>(LogLevel::DEBUG_LEVEL)};
inline std::mutex Logger::s_logMutex{};

} // namespace Warband

// Convenience macros for each simulation system

#define UNIT_CRITICAL(msg) WARBAND_CRITICAL("UnitManager", msg)
#define UNIT_ERROR(msg) WARBAND_ERROR("UnitManager", msg)
#define UNIT_WARN(msg) WARBAND_WARN("UnitManager", msg)
#define UNIT_INFO(msg) WARBAND_INFO("UnitManager", msg)
#define UNIT_DEBUG(msg) WARBAND_DEBUG("UnitManager", msg)

#define AI_CRITICAL(msg) WARBAND_CRITICAL("AIBehaviorController", msg)
#define AI_ERROR(msg) WARBAND_ERROR("AIBehaviorController", msg)
#define AI_WARN(msg) WARBAND_WARN("AIBehaviorController", msg)
#define AI_INFO(msg) WARBAND_INFO("AIBehaviorController", msg)
#define AI_DEBUG(msg) WARBAND_DEBUG("AIBehaviorController", msg)

#define COMBAT_CRITICAL(msg) WARBAND_CRITICAL("CombatController", msg)
#define COMBAT_ERROR(msg) WARBAND_ERROR("CombatController", msg)
#define COMBAT_WARN(msg) WARBAND_WARN("CombatController", msg)
#define COMBAT_INFO(msg) WARBAND_INFO("CombatController", msg)
#define COMBAT_DEBUG(msg) WARBAND_DEBUG("CombatController", msg)

#define PHYSICS_CRITICAL(msg) WARBAND_CRITICAL("UnitPhysics", msg)
#define PHYSICS_ERROR(msg) WARBAND_ERROR("UnitPhysics", msg)
#define PHYSICS_WARN(msg) WARBAND_WARN("UnitPhysics", msg)
#define PHYSICS_INFO(msg) WARBAND_INFO("UnitPhysics", msg)
#define PHYSICS_DEBUG(msg) WARBAND_DEBUG("UnitPhysics", msg)

#define SCHEDULER_CRITICAL(msg) WARBAND_CRITICAL("DeferredTaskScheduler", msg)
#define SCHEDULER_ERROR(msg) WARBAND_ERROR("DeferredTaskScheduler", msg)
#define SCHEDULER_WARN(msg) WARBAND_WARN("DeferredTaskScheduler", msg)
#define SCHEDULER_INFO(msg) WARBAND_INFO("DeferredTaskScheduler", msg)
#define SCHEDULER_DEBUG(msg) WARBAND_DEBUG("DeferredTaskScheduler", msg)

#define CONFIG_CRITICAL(msg) WARBAND_CRITICAL("UnitConfigLoader", msg)
#define CONFIG_ERROR(msg) WARBAND_ERROR("UnitConfigLoader", msg)
#define CONFIG_WARN(msg) WARBAND_WARN("UnitConfigLoader", msg)
#define CONFIG_INFO(msg) WARBAND_INFO("UnitConfigLoader", msg)
#define CONFIG_DEBUG(msg) WARBAND_DEBUG("UnitConfigLoader", msg)

#define SIM_CRITICAL(msg) WARBAND_CRITICAL("Simulation", msg)
#define SIM_ERROR(msg) WARBAND_ERROR("Simulation", msg)
#define SIM_WARN(msg) WARBAND_WARN("Simulation", msg)
#define SIM_INFO(msg) WARBAND_INFO("Simulation", msg)
#define SIM_DEBUG(msg) WARBAND_DEBUG("Simulation", msg)

#endif // LOGGER_HPP
