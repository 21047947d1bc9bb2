#ifndef CLOAK_LOGGER_H_
#define CLOAK_LOGGER_H_

#include <string>
#include <sstream>
#include <iostream>
#include <chrono>
#include <iomanip>

namespace CloakLogger {

enum Level {
  DEBUG,
  INFO,
  WARN,
  ERROR
};

class Logger {
public:
  static void Init();
  static void Init(const std::string& log_file_path);  // Also append to a log file
  static void SetLevel(Level level);
  static Level GetLevel();
  static void Log(Level level, const std::string& component, const std::string& message);

  // Parses "debug", "info", "warn", "error" (case-insensitive).
  // Returns false and leaves *level untouched on anything else.
  static bool ParseLevel(const std::string& name, Level* level);

  // Convenience methods
  static void Debug(const std::string& component, const std::string& message);
  static void Info(const std::string& component, const std::string& message);
  static void Warn(const std::string& component, const std::string& message);
  static void Error(const std::string& component, const std::string& message);

private:
  static Level current_level_;
  static std::string GetTimestamp();
  static std::string LevelToString(Level level);
};

} // namespace CloakLogger

// LOG_DEBUG only compiles in debug builds
#ifdef CLOAK_DEBUG_BUILD
  #define LOG_DEBUG(component, msg) CloakLogger::Logger::Debug(component, msg)
#else
  #define LOG_DEBUG(component, msg) ((void)0)
#endif

#define LOG_INFO(component, msg) CloakLogger::Logger::Info(component, msg)
#define LOG_WARN(component, msg) CloakLogger::Logger::Warn(component, msg)
#define LOG_ERROR(component, msg) CloakLogger::Logger::Error(component, msg)

#endif  // CLOAK_LOGGER_H_
