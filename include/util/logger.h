#ifndef GUARDIAN_LOGGER_H_
#define GUARDIAN_LOGGER_H_

#include <string>

namespace GuardianLogger {

enum Level {
  DEBUG,
  INFO,
  WARN,
  ERROR
};

// Accepts "debug", "info", "warn", "warning" and "error"
bool ParseLevel(const std::string& name, Level* level);

/**
 * Process-wide log sink shared by every component.
 *
 * Lines always go to stderr and, once a file is attached, are appended to
 * it as well:
 *   [14:02:07.315] [WARN ] [Detector] Contextual recognizer degraded (timeout): ...
 *
 * The level starts at INFO (DEBUG in debug builds). All members are safe
 * to call from any thread.
 */
class Logger {
public:
  static void SetLevel(Level level);
  static bool IsEnabled(Level level);

  // Appends to |path| from now on. False, and stderr only, if it cannot
  // be opened.
  static bool AttachFile(const std::string& path);

  static void Write(Level level, const std::string& component, const std::string& message);
};

} // namespace GuardianLogger

// The message expression is only evaluated when the level is enabled
#define GUARDIAN_LOG(level, component, msg)                         \
  do {                                                              \
    if (GuardianLogger::Logger::IsEnabled(level)) {                 \
      GuardianLogger::Logger::Write(level, component, msg);         \
    }                                                               \
  } while (0)

#ifdef GUARDIAN_DEBUG_BUILD
  #define LOG_DEBUG(component, msg) GUARDIAN_LOG(GuardianLogger::DEBUG, component, msg)
#else
  #define LOG_DEBUG(component, msg) ((void)0)
#endif

#define LOG_INFO(component, msg) GUARDIAN_LOG(GuardianLogger::INFO, component, msg)
#define LOG_WARN(component, msg) GUARDIAN_LOG(GuardianLogger::WARN, component, msg)
#define LOG_ERROR(component, msg) GUARDIAN_LOG(GuardianLogger::ERROR, component, msg)

#endif  // GUARDIAN_LOGGER_H_
