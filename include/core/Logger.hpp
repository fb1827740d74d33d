/* Copyright (c) 2025 Tether Contributors
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
// - atomic: Required for std::atomic<bool> quiet mode flag
#include <atomic> // IWYU pragma: keep - Required for std::atomic<bool> quiet mode flag
#include <cstdint> // IWYU pragma: keep - Required for uint8_t type
#include <cstdio> // IWYU pragma: keep - Required for printf() and fflush() functions
#include <mutex> // IWYU pragma: keep - Required for thread-safe logging
#include <string> // IWYU pragma: keep - Required for std::string() conversions in macros

namespace Tether {
enum class LogLevel : uint8_t {
  CRITICAL = 0,     // Always logs
  ERROR_LEVEL = 1,  // Always logs (renamed to avoid macro conflicts)
  WARNING = 2,      // Debug only
  INFO = 3,         // Debug only
  DEBUG_LEVEL = 4   // Debug only (renamed to avoid macro conflicts)
};

#ifdef DEBUG
// Debug builds print every level to stdout
class Logger {
private:
  static std::atomic<bool> s_quietMode;
  static std::mutex s_logMutex;

public:
  static void SetQuietMode(bool enabled) {
    s_quietMode.store(enabled, std::memory_order_relaxed);
  }

  static bool IsQuietMode() {
    return s_quietMode.load(std::memory_order_relaxed);
  }

  static void Log(LogLevel level, const char *system,
                  const std::string &message) {
    Log(level, system, message.c_str());
  }

  static void Log(LogLevel level, const char *system, const char *message) {
    if (s_quietMode.load(std::memory_order_relaxed)) {
      return;
    }

    std::lock_guard<std::mutex> lock(s_logMutex);
    printf("Tether - [%s] %s: %s\n", system, getLevelString(level), message);
    fflush(stdout);
  }

private:
  static const char *getLevelString(LogLevel level) {
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
    default:
      return "UNKNOWN";
    }
  }
};

#define TETHER_CRITICAL(system, msg)                                           \
  Tether::Logger::Log(Tether::LogLevel::CRITICAL, system, msg)
#define TETHER_ERROR(system, msg)                                              \
  Tether::Logger::Log(Tether::LogLevel::ERROR_LEVEL, system, msg)
#define TETHER_WARN(system, msg)                                               \
  Tether::Logger::Log(Tether::LogLevel::WARNING, system, msg)
#define TETHER_INFO(system, msg)                                               \
  Tether::Logger::Log(Tether::LogLevel::INFO, system, msg)
#define TETHER_DEBUG(system, msg)                                              \
  Tether::Logger::Log(Tether::LogLevel::DEBUG_LEVEL, system, msg)

#else
// Release builds write CRITICAL and ERROR to a log file, everything else is
// compiled out. Log() is defined in Logger.cpp.
class Logger {
private:
  static std::atomic<bool> s_quietMode;

public:
  static std::mutex s_logMutex; // Public for macro access

  static void SetQuietMode(bool enabled) {
    s_quietMode.store(enabled, std::memory_order_relaxed);
  }

  static bool IsQuietMode() {
    return s_quietMode.load(std::memory_order_relaxed);
  }

  static void Log(const char *level, const char *system,
                  const std::string &message);
  static void Log(const char *level, const char *system, const char *message);
};

#define TETHER_CRITICAL(system, msg)                                           \
  Tether::Logger::Log("CRITICAL", system, msg)

#define TETHER_ERROR(system, msg) Tether::Logger::Log("ERROR", system, msg)

#define TETHER_WARN(system, msg) ((void)0)  // Zero overhead
#define TETHER_INFO(system, msg) ((void)0)  // Zero overhead
#define TETHER_DEBUG(system, msg) ((void)0) // Zero overhead
#endif

// Static member definitions - shared by both DEBUG and RELEASE builds
inline std::atomic<bool> Logger::s_quietMode{false};
inline std::mutex Logger::s_logMutex{};

// Identity core
#define COUNTER_CRITICAL(msg) TETHER_CRITICAL("CounterRegistry", msg)
#define COUNTER_ERROR(msg) TETHER_ERROR("CounterRegistry", msg)
#define COUNTER_WARN(msg) TETHER_WARN("CounterRegistry", msg)
#define COUNTER_INFO(msg) TETHER_INFO("CounterRegistry", msg)
#define COUNTER_DEBUG(msg) TETHER_DEBUG("CounterRegistry", msg)

#define IDENTITY_CRITICAL(msg) TETHER_CRITICAL("IdentityResolver", msg)
#define IDENTITY_ERROR(msg) TETHER_ERROR("IdentityResolver", msg)
#define IDENTITY_WARN(msg) TETHER_WARN("IdentityResolver", msg)
#define IDENTITY_INFO(msg) TETHER_INFO("IdentityResolver", msg)
#define IDENTITY_DEBUG(msg) TETHER_DEBUG("IdentityResolver", msg)

#define REFERENCE_CRITICAL(msg) TETHER_CRITICAL("ReferenceField", msg)
#define REFERENCE_ERROR(msg) TETHER_ERROR("ReferenceField", msg)
#define REFERENCE_WARN(msg) TETHER_WARN("ReferenceField", msg)
#define REFERENCE_INFO(msg) TETHER_INFO("ReferenceField", msg)
#define REFERENCE_DEBUG(msg) TETHER_DEBUG("ReferenceField", msg)

#define SERVICE_CRITICAL(msg) TETHER_CRITICAL("IdentityService", msg)
#define SERVICE_ERROR(msg) TETHER_ERROR("IdentityService", msg)
#define SERVICE_WARN(msg) TETHER_WARN("IdentityService", msg)
#define SERVICE_INFO(msg) TETHER_INFO("IdentityService", msg)
#define SERVICE_DEBUG(msg) TETHER_DEBUG("IdentityService", msg)

// Host side
#define POOL_CRITICAL(msg) TETHER_CRITICAL("ScenePool", msg)
#define POOL_ERROR(msg) TETHER_ERROR("ScenePool", msg)
#define POOL_WARN(msg) TETHER_WARN("ScenePool", msg)
#define POOL_INFO(msg) TETHER_INFO("ScenePool", msg)
#define POOL_DEBUG(msg) TETHER_DEBUG("ScenePool", msg)

#define CONFIG_CRITICAL(msg) TETHER_CRITICAL("IdentityConfig", msg)
#define CONFIG_ERROR(msg) TETHER_ERROR("IdentityConfig", msg)
#define CONFIG_WARN(msg) TETHER_WARN("IdentityConfig", msg)
#define CONFIG_INFO(msg) TETHER_INFO("IdentityConfig", msg)
#define CONFIG_DEBUG(msg) TETHER_DEBUG("IdentityConfig", msg)

#define DEMO_CRITICAL(msg) TETHER_CRITICAL("Demo", msg)
#define DEMO_ERROR(msg) TETHER_ERROR("Demo", msg)
#define DEMO_WARN(msg) TETHER_WARN("Demo", msg)
#define DEMO_INFO(msg) TETHER_INFO("Demo", msg)

// Quiet mode convenience macros
#define TETHER_ENABLE_QUIET_MODE() Tether::Logger::SetQuietMode(true)
#define TETHER_DISABLE_QUIET_MODE() Tether::Logger::SetQuietMode(false)

} // namespace Tether

#endif // LOGGER_HPP
