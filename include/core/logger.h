#ifndef LOGGER_H
#define LOGGER_H

#include "core/log_writer.h"
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

enum class LogLevel {
  DEBUG = 0,
  INFO = 1,
  WARNING = 2,
  ERROR = 3,
  CRITICAL = 4
};

enum class LogCategory {
  SYSTEM = 0,
  DATABASE = 1,
  TRANSFER = 2,
  CONFIG = 3,
  SYNC = 4,
  PARTITION = 5,
  TRANSPORT = 6,
  UNKNOWN = 99
};

class Logger {
private:
  static std::unique_ptr<ILogWriter> writer_;
  static std::mutex logMutex;

  static LogLevel currentLogLevel;
  static std::mutex configMutex;

  static const std::unordered_map<std::string, LogLevel> levelMap;

  static std::string formatLogMessage(const std::string &timestamp,
                                      const std::string &levelStr,
                                      const std::string &categoryStr,
                                      const std::string &function,
                                      const std::string &message);
  static std::string getLevelString(LogLevel level);
  static std::string getCategoryString(LogCategory category);
  static void writeLog(LogLevel level, LogCategory category,
                       const std::string &function,
                       const std::string &message);

public:
  // Opens logFile as the sink. An empty path, or a file that cannot be
  // opened, leaves logging on standard error.
  static void initialize(const std::string &logFile = "");
  static void initialize(std::unique_ptr<ILogWriter> writer);
  static void shutdown();

  static void debug(LogCategory category, const std::string &function,
                    const std::string &message);
  static void info(LogCategory category, const std::string &function,
                   const std::string &message);
  static void warning(LogCategory category, const std::string &function,
                      const std::string &message);
  static void error(LogCategory category, const std::string &function,
                    const std::string &message);
  static void critical(LogCategory category, const std::string &function,
                       const std::string &message);

  static void setLogLevel(LogLevel level);
  static void setLogLevel(const std::string &levelStr);
  static LogLevel getCurrentLogLevel();
};

#endif
