#include "logger.h"
#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <unistd.h>
#include <fcntl.h>

namespace GuardianLogger {

namespace {

#ifdef GUARDIAN_DEBUG_BUILD
constexpr Level kDefaultLevel = DEBUG;
#else
constexpr Level kDefaultLevel = INFO;
#endif

std::atomic<int> current_level{kDefaultLevel};

std::mutex sink_mutex;
int file_fd = -1;  // Guarded by sink_mutex

std::string Timestamp() {
  auto now = std::chrono::system_clock::now();
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
      now.time_since_epoch()) % 1000;
  auto timer = std::chrono::system_clock::to_time_t(now);
  std::tm bt;
  localtime_r(&timer, &bt);

  std::ostringstream oss;
  oss << std::put_time(&bt, "%H:%M:%S");
  oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
  return oss.str();
}

const char* LevelTag(Level level) {
  switch (level) {
    case DEBUG: return "DEBUG";
    case INFO:  return "INFO ";
    case WARN:  return "WARN ";
    case ERROR: return "ERROR";
    default:    return "?????";
  }
}

}  // namespace

bool ParseLevel(const std::string& name, Level* level) {
  if (name == "debug") {
    *level = DEBUG;
  } else if (name == "info") {
    *level = INFO;
  } else if (name == "warn" || name == "warning") {
    *level = WARN;
  } else if (name == "error") {
    *level = ERROR;
  } else {
    return false;
  }
  return true;
}

void Logger::SetLevel(Level level) {
  current_level.store(level);
}

bool Logger::IsEnabled(Level level) {
  return level >= current_level.load();
}

bool Logger::AttachFile(const std::string& path) {
  int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);

  std::lock_guard<std::mutex> lock(sink_mutex);
  if (file_fd >= 0) {
    close(file_fd);
  }
  file_fd = fd;
  return fd >= 0;
}

void Logger::Write(Level level, const std::string& component, const std::string& message) {
  std::string line = "[" + Timestamp() + "] [" + LevelTag(level) + "] [" + component + "] " +
                     message + "\n";

  std::lock_guard<std::mutex> lock(sink_mutex);
  std::cerr << line;
  if (file_fd >= 0) {
    // O_APPEND keeps whole lines together when several processes share the file
    ssize_t written = write(file_fd, line.data(), line.size());
    (void)written;  // Losing a file line must not fail detection
  }
}

} // namespace GuardianLogger
