/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <atomic> // IWYU pragma: keep - Required for the runtime level filter
#include <cstdint> // IWYU pragma: keep - Required for uint8_t type
#include <string> // IWYU pragma: keep - Required for std::string() conversions in macros

namespace CosmicEngine {

// Lower value = more severe
enum class LogLevel : uint8_t {
  CRITICAL = 0,
  ERROR_LEVEL = 1, // Renamed to avoid macro conflicts
  WARNING = 2,
  INFO = 3,
  DEBUG_LEVEL = 4
};

/**
 * Debug builds print every level to stdout. Release builds append CRITICAL,
 * ERROR and WARNING lines to a file in the SDL preference directory; INFO and
 * DEBUG compile away entirely.
 *
 * On top of that, messages less severe than the minimum level are dropped
 * before the message string is built.
 */
class Logger {
public:
  static void SetMinimumLevel(LogLevel level) {
    s_minimumLevel.store(static_cast<uint8_t>(level), std::memory_order_relaxed);
  }

  static LogLevel GetMinimumLevel() {
    return static_cast<LogLevel>(s_minimumLevel.load(std::memory_order_relaxed));
  }

  static bool IsEnabled(LogLevel level) {
    return static_cast<uint8_t>(level) <= s_minimumLevel.load(std::memory_order_relaxed);
  }

  static void Log(LogLevel level, const char *system, const std::string &message) {
    Log(level, system, message.c_str());
  }
  static void Log(LogLevel level, const char *system, const char *message);

  static const char *LevelName(LogLevel level);

private:
  static inline std::atomic<uint8_t> s_minimumLevel{
      static_cast<uint8_t>(LogLevel::DEBUG_LEVEL)};
};

#define COSMIC_LOG(level, system, msg)                                         \
  do {                                                                         \
    if (CosmicEngine::Logger::IsEnabled(level)) {                              \
      CosmicEngine::Logger::Log(level, system, msg);                           \
    }                                                                          \
  } while (0)

#define COSMIC_CRITICAL(system, msg)                                           \
  COSMIC_LOG(CosmicEngine::LogLevel::CRITICAL, system, msg)
#define COSMIC_ERROR(system, msg)                                              \
  COSMIC_LOG(CosmicEngine::LogLevel::ERROR_LEVEL, system, msg)
#define COSMIC_WARN(system, msg)                                               \
  COSMIC_LOG(CosmicEngine::LogLevel::WARNING, system, msg)

#ifdef DEBUG
#define COSMIC_INFO(system, msg)                                               \
  COSMIC_LOG(CosmicEngine::LogLevel::INFO, system, msg)
#define COSMIC_DEBUG(system, msg)                                              \
  COSMIC_LOG(CosmicEngine::LogLevel::DEBUG_LEVEL, system, msg)
#else
#define COSMIC_INFO(system, msg) ((void)0)  // Zero overhead
#define COSMIC_DEBUG(system, msg) ((void)0) // Zero overhead
#endif

// Per-system convenience macros

#define SPATIAL_ERROR(msg) COSMIC_ERROR("SpatialHash", msg)
#define SPATIAL_WARN(msg) COSMIC_WARN("SpatialHash", msg)
#define SPATIAL_INFO(msg) COSMIC_INFO("SpatialHash", msg)
#define SPATIAL_DEBUG(msg) COSMIC_DEBUG("SpatialHash", msg)

#define COLLISION_ERROR(msg) COSMIC_ERROR("CollisionSystem", msg)
#define COLLISION_WARN(msg) COSMIC_WARN("CollisionSystem", msg)
#define COLLISION_INFO(msg) COSMIC_INFO("CollisionSystem", msg)
#define COLLISION_DEBUG(msg) COSMIC_DEBUG("CollisionSystem", msg)

#define RESOLVER_WARN(msg) COSMIC_WARN("CollisionResolver", msg)
#define RESOLVER_DEBUG(msg) COSMIC_DEBUG("CollisionResolver", msg)

#define CONFIG_ERROR(msg) COSMIC_ERROR("CollisionConfig", msg)
#define CONFIG_WARN(msg) COSMIC_WARN("CollisionConfig", msg)
#define CONFIG_INFO(msg) COSMIC_INFO("CollisionConfig", msg)
#define CONFIG_DEBUG(msg) COSMIC_DEBUG("CollisionConfig", msg)

#define DEMO_ERROR(msg) COSMIC_ERROR("Demo", msg)
#define DEMO_WARN(msg) COSMIC_WARN("Demo", msg)
#define DEMO_INFO(msg) COSMIC_INFO("Demo", msg)

} // namespace CosmicEngine

#endif // LOGGER_HPP
