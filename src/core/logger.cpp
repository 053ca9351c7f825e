#include "core/logger.h"
#include "core/file_log_writer.h"
#include "utils/string_utils.h"
#include "utils/time_utils.h"
#include <iostream>
#include <sstream>

std::unique_ptr<ILogWriter> Logger::writer_;
std::mutex Logger::logMutex;

LogLevel Logger::currentLogLevel = LogLevel::INFO;
std::mutex Logger::configMutex;

const std::unordered_map<std::string, LogLevel> Logger::levelMap = {
    {"DEBUG", LogLevel::DEBUG},      {"INFO", LogLevel::INFO},
    {"WARN", LogLevel::WARNING},     {"WARNING", LogLevel::WARNING},
    {"ERROR", LogLevel::ERROR},      {"FATAL", LogLevel::CRITICAL},
    {"CRITICAL", LogLevel::CRITICAL}};

std::string Logger::formatLogMessage(const std::string &timestamp,
                                     const std::string &levelStr,
                                     const std::string &categoryStr,
                                     const std::string &function,
                                     const std::string &message) {
  std::ostringstream oss;
  oss << "[" << timestamp << "] [" << levelStr << "] [" << categoryStr << "]";
  if (!function.empty()) {
    oss << " [" << function << "]";
  }
  oss << " " << message;
  return oss.str();
}

std::string Logger::getLevelString(LogLevel level) {
  switch (level) {
  case LogLevel::DEBUG:
    return "DEBUG";
  case LogLevel::INFO:
    return "INFO";
  case LogLevel::WARNING:
    return "WARNING";
  case LogLevel::ERROR:
    return "ERROR";
  case LogLevel::CRITICAL:
    return "CRITICAL";
  }
  return "UNKNOWN";
}

std::string Logger::getCategoryString(LogCategory category) {
  switch (category) {
  case LogCategory::SYSTEM:
    return "SYSTEM";
  case LogCategory::DATABASE:
    return "DATABASE";
  case LogCategory::TRANSFER:
    return "TRANSFER";
  case LogCategory::CONFIG:
    return "CONFIG";
  case LogCategory::SYNC:
    return "SYNC";
  case LogCategory::PARTITION:
    return "PARTITION";
  case LogCategory::TRANSPORT:
    return "TRANSPORT";
  case LogCategory::UNKNOWN:
    break;
  }
  return "UNKNOWN";
}

// Filters by the configured minimum level, formats the line and hands it to
// the file sink. Lines that the sink rejects, or that arrive before a sink
// is opened, are written to standard error so nothing is dropped silently.
void Logger::writeLog(LogLevel level, LogCategory category,
                      const std::string &function,
                      const std::string &message) {
  LogLevel minLevel;
  {
    std::lock_guard<std::mutex> configLock(configMutex);
    minLevel = currentLogLevel;
  }

  if (level < minLevel) {
    return;
  }

  std::string line =
      formatLogMessage(TimeUtils::getCurrentTimestamp(), getLevelString(level),
                       getCategoryString(category), function, message);

  std::lock_guard<std::mutex> lock(logMutex);
  if (writer_ && writer_->isOpen() && writer_->write(line)) {
    return;
  }
  std::cerr << line << std::endl;
}

void Logger::debug(LogCategory category, const std::string &function,
                   const std::string &message) {
  writeLog(LogLevel::DEBUG, category, function, message);
}

void Logger::info(LogCategory category, const std::string &function,
                  const std::string &message) {
  writeLog(LogLevel::INFO, category, function, message);
}

void Logger::warning(LogCategory category, const std::string &function,
                     const std::string &message) {
  writeLog(LogLevel::WARNING, category, function, message);
}

void Logger::error(LogCategory category, const std::string &function,
                   const std::string &message) {
  writeLog(LogLevel::ERROR, category, function, message);
}

void Logger::critical(LogCategory category, const std::string &function,
                      const std::string &message) {
  writeLog(LogLevel::CRITICAL, category, function, message);
}

void Logger::initialize(const std::string &logFile) {
  std::lock_guard<std::mutex> lock(logMutex);

  if (writer_) {
    writer_->close();
    writer_.reset();
  }

  if (logFile.empty()) {
    return;
  }

  auto fileWriter = std::make_unique<FileLogWriter>(logFile);
  if (!fileWriter->isOpen()) {
    std::cerr << "Warning: log file '" << logFile
              << "' could not be opened, logging to stderr" << std::endl;
    return;
  }
  writer_ = std::move(fileWriter);
}

void Logger::initialize(std::unique_ptr<ILogWriter> writer) {
  std::lock_guard<std::mutex> lock(logMutex);
  if (writer_) {
    writer_->close();
  }
  writer_ = std::move(writer);
}

void Logger::shutdown() {
  std::lock_guard<std::mutex> lock(logMutex);
  if (writer_) {
    writer_->close();
  }
  writer_.reset();
}

void Logger::setLogLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(configMutex);
  currentLogLevel = level;
}

// Accepts DEBUG, INFO, WARN/WARNING, ERROR, FATAL/CRITICAL in any case.
// Anything else leaves the current level untouched.
void Logger::setLogLevel(const std::string &levelStr) {
  auto it = levelMap.find(StringUtils::toUpper(StringUtils::trim(levelStr)));
  if (it == levelMap.end()) {
    return;
  }
  setLogLevel(it->second);
}

LogLevel Logger::getCurrentLogLevel() {
  std::lock_guard<std::mutex> lock(configMutex);
  return currentLogLevel;
}
