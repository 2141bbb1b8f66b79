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
// - atomic: Required for std::atomic<bool> benchmark mode flag
#include <atomic> // IWYU pragma: keep - Required for std::atomic<bool> benchmark mode flag
#include <cstdint> // IWYU pragma: keep - Required for uint8_t type
#include <cstdio> // IWYU pragma: keep - Required for printf() and fflush() functions
#include <mutex> // IWYU pragma: keep - Required for thread-safe logging
#include <string> // IWYU pragma: keep - Required for std::string() conversions in macros

namespace Driftwood {
enum class LogLevel : uint8_t {
  CRITICAL = 0,     // Always logs (even in release for crashes)
  ERROR_LEVEL = 1,  // Release builds keep errors in the log file
  WARNING = 2,      // Debug only
  INFO = 3,         // Debug only
  DEBUG_LEVEL = 4   // Debug only (renamed to avoid macro conflicts)
};

inline const char *getLevelString(LogLevel level) {
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

#ifdef DEBUG
// Debug builds print every level to stdout
class Logger {
private:
  static std::atomic<bool> s_benchmarkMode;
  static std::mutex s_logMutex;

public:
  static void SetBenchmarkMode(bool enabled) {
    s_benchmarkMode.store(enabled, std::memory_order_relaxed);
  }

  static bool IsBenchmarkMode() {
    return s_benchmarkMode.load(std::memory_order_relaxed);
  }

  static void Log(LogLevel level, const char *system,
                  const std::string &message) {
    Log(level, system, message.c_str());
  }

  static void Log(LogLevel level, const char *system, const char *message) {
    if (s_benchmarkMode.load(std::memory_order_relaxed)) {
      return;
    }

    std::lock_guard<std::mutex> lock(s_logMutex);
    printf("Driftwood Engine - [%s] %s: %s\n", system, getLevelString(level),
           message);
    fflush(stdout);
  }
};

#define DRIFT_CRITICAL(system, msg)                                            \
  Driftwood::Logger::Log(Driftwood::LogLevel::CRITICAL, system, msg)
#define DRIFT_ERROR(system, msg)                                               \
  Driftwood::Logger::Log(Driftwood::LogLevel::ERROR_LEVEL, system, msg)
#define DRIFT_WARN(system, msg)                                                \
  Driftwood::Logger::Log(Driftwood::LogLevel::WARNING, system, msg)
#define DRIFT_INFO(system, msg)                                                \
  Driftwood::Logger::Log(Driftwood::LogLevel::INFO, system, msg)
#define DRIFT_DEBUG(system, msg)                                               \
  Driftwood::Logger::Log(Driftwood::LogLevel::DEBUG_LEVEL, system, msg)

#else
// Release builds: CRITICAL and ERROR go to the rotating log file (Logger.cpp),
// everything else compiles away
class Logger {
private:
  static std::atomic<bool> s_benchmarkMode;
  static std::mutex s_logMutex;

public:
  static void SetBenchmarkMode(bool enabled) {
    s_benchmarkMode.store(enabled, std::memory_order_relaxed);
  }

  static bool IsBenchmarkMode() {
    return s_benchmarkMode.load(std::memory_order_relaxed);
  }

  static void Log(LogLevel level, const char *system,
                  const std::string &message);
  static void Log(LogLevel level, const char *system, const char *message);
};

#define DRIFT_CRITICAL(system, msg)                                            \
  Driftwood::Logger::Log(Driftwood::LogLevel::CRITICAL, system, msg)
#define DRIFT_ERROR(system, msg)                                               \
  Driftwood::Logger::Log(Driftwood::LogLevel::ERROR_LEVEL, system, msg)
#define DRIFT_WARN(system, msg) ((void)0)  // Zero overhead
#define DRIFT_INFO(system, msg) ((void)0)  // Zero overhead
#define DRIFT_DEBUG(system, msg) ((void)0) // Zero overhead
#endif

// Static member definitions - shared by both DEBUG and RELEASE builds
inline std::atomic<bool> Logger::s_benchmarkMode{false};
inline std::mutex Logger::s_logMutex{};

// Core Systems
#define SIMLOOP_CRITICAL(msg) DRIFT_CRITICAL("SimulationLoop", msg)
#define SIMLOOP_ERROR(msg) DRIFT_ERROR("SimulationLoop", msg)
#define SIMLOOP_WARN(msg) DRIFT_WARN("SimulationLoop", msg)
#define SIMLOOP_INFO(msg) DRIFT_INFO("SimulationLoop", msg)
#define SIMLOOP_DEBUG(msg) DRIFT_DEBUG("SimulationLoop", msg)

// Ocean
#define WAVE_CRITICAL(msg) DRIFT_CRITICAL("WaveField", msg)
#define WAVE_ERROR(msg) DRIFT_ERROR("WaveField", msg)
#define WAVE_WARN(msg) DRIFT_WARN("WaveField", msg)
#define WAVE_INFO(msg) DRIFT_INFO("WaveField", msg)
#define WAVE_DEBUG(msg) DRIFT_DEBUG("WaveField", msg)

// Construction
#define GRID_CRITICAL(msg) DRIFT_CRITICAL("GridTopology", msg)
#define GRID_ERROR(msg) DRIFT_ERROR("GridTopology", msg)
#define GRID_WARN(msg) DRIFT_WARN("GridTopology", msg)
#define GRID_INFO(msg) DRIFT_INFO("GridTopology", msg)
#define GRID_DEBUG(msg) DRIFT_DEBUG("GridTopology", msg)

#define CATALOG_CRITICAL(msg) DRIFT_CRITICAL("ConstructionCatalog", msg)
#define CATALOG_ERROR(msg) DRIFT_ERROR("ConstructionCatalog", msg)
#define CATALOG_WARN(msg) DRIFT_WARN("ConstructionCatalog", msg)
#define CATALOG_INFO(msg) DRIFT_INFO("ConstructionCatalog", msg)
#define CATALOG_DEBUG(msg) DRIFT_DEBUG("ConstructionCatalog", msg)

#define BUILD_CRITICAL(msg) DRIFT_CRITICAL("BuildSession", msg)
#define BUILD_ERROR(msg) DRIFT_ERROR("BuildSession", msg)
#define BUILD_WARN(msg) DRIFT_WARN("BuildSession", msg)
#define BUILD_INFO(msg) DRIFT_INFO("BuildSession", msg)
#define BUILD_DEBUG(msg) DRIFT_DEBUG("BuildSession", msg)

#define STRUCTURE_CRITICAL(msg) DRIFT_CRITICAL("StructureRegistry", msg)
#define STRUCTURE_ERROR(msg) DRIFT_ERROR("StructureRegistry", msg)
#define STRUCTURE_WARN(msg) DRIFT_WARN("StructureRegistry", msg)
#define STRUCTURE_INFO(msg) DRIFT_INFO("StructureRegistry", msg)
#define STRUCTURE_DEBUG(msg) DRIFT_DEBUG("StructureRegistry", msg)

#define MOTION_CRITICAL(msg) DRIFT_CRITICAL("RaftMotionController", msg)
#define MOTION_ERROR(msg) DRIFT_ERROR("RaftMotionController", msg)
#define MOTION_WARN(msg) DRIFT_WARN("RaftMotionController", msg)
#define MOTION_INFO(msg) DRIFT_INFO("RaftMotionController", msg)
#define MOTION_DEBUG(msg) DRIFT_DEBUG("RaftMotionController", msg)

// Resources and persistence
#define INVENTORY_CRITICAL(msg) DRIFT_CRITICAL("InventoryComponent", msg)
#define INVENTORY_ERROR(msg) DRIFT_ERROR("InventoryComponent", msg)
#define INVENTORY_WARN(msg) DRIFT_WARN("InventoryComponent", msg)
#define INVENTORY_INFO(msg) DRIFT_INFO("InventoryComponent", msg)
#define INVENTORY_DEBUG(msg) DRIFT_DEBUG("InventoryComponent", msg)

#define SAVEGAME_CRITICAL(msg) DRIFT_CRITICAL("SaveGameManager", msg)
#define SAVEGAME_ERROR(msg) DRIFT_ERROR("SaveGameManager", msg)
#define SAVEGAME_WARN(msg) DRIFT_WARN("SaveGameManager", msg)
#define SAVEGAME_INFO(msg) DRIFT_INFO("SaveGameManager", msg)
#define SAVEGAME_DEBUG(msg) DRIFT_DEBUG("SaveGameManager", msg)

#define SETTINGS_CRITICAL(msg) DRIFT_CRITICAL("SettingsManager", msg)
#define SETTINGS_ERROR(msg) DRIFT_ERROR("SettingsManager", msg)
#define SETTINGS_WARNING(msg) DRIFT_WARN("SettingsManager", msg)
#define SETTINGS_INFO(msg) DRIFT_INFO("SettingsManager", msg)
#define SETTINGS_DEBUG(msg) DRIFT_DEBUG("SettingsManager", msg)

// Benchmark mode convenience macros
#define DRIFT_ENABLE_BENCHMARK_MODE()                                          \
  Driftwood::Logger::SetBenchmarkMode(true)
#define DRIFT_DISABLE_BENCHMARK_MODE()                                         \
  Driftwood::Logger::SetBenchmarkMode(false)

} // namespace Driftwood

#endif // LOGGER_HPP
