#ifndef LOGGER_H
#define LOGGER_H

#include "core/log_writer.h"
#include <chrono>
#include <cstddef>
#include <iomanip>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>

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
  CONFIG = 2,
  KAFKA = 3,
  DISPATCH = 4,
  HANDLER = 5,
  SCHEMA = 6,
  PRODUCER = 7,
  UNKNOWN = 99
};

struct LoggerSettings {
  std::string level{"INFO"};
  bool console = true;
  std::string filePath;
  size_t maxFileSize = 10 * 1024 * 1024;
  int maxBackupFiles = 5;
  bool database = false;
  std::string databaseConnectionString;
};

class Logger {
private:
  static std::vector<std::unique_ptr<ILogWriter>> writers_;
  static bool initialized_;
  static std::mutex logMutex;

  static LogLevel currentLogLevel;
  static std::mutex configMutex;

  static const std::unordered_map<std::string, LogCategory> categoryMap;
  static const std::unordered_map<std::string, LogLevel> levelMap;

  static std::string formatLogMessage(const std::string &timestamp,
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

  static std::string getCurrentTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    struct tm tm_buf;
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  now.time_since_epoch()) %
              1000;

    std::stringstream ss;
    localtime_r(&time_t, &tm_buf);
    ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    ss << "." << std::setfill('0') << std::setw(3) << ms.count();
    return ss.str();
  }

  static void writeLog(LogLevel level, LogCategory category,
                       const std::string &function,
                       const std::string &message);

public:
  static std::string getLevelString(LogLevel level);
  static std::string getCategoryString(LogCategory category);
  static LogCategory stringToCategory(const std::string &categoryStr);
  static LogLevel stringToLogLevel(const std::string &levelStr);

  // Replaces the active sinks. Safe to call more than once; the previous
  // sinks are flushed and closed first.
  static void initialize(const LoggerSettings &settings = LoggerSettings{});
  static void shutdown();

  static void debug(const std::string &message) {
    writeLog(LogLevel::DEBUG, LogCategory::SYSTEM, "", message);
  }

  static void info(const std::string &message) {
    writeLog(LogLevel::INFO, LogCategory::SYSTEM, "", message);
  }

  static void warning(const std::string &message) {
    writeLog(LogLevel::WARNING, LogCategory::SYSTEM, "", message);
  }

  static void error(const std::string &message) {
    writeLog(LogLevel::ERROR, LogCategory::SYSTEM, "", message);
  }

  static void critical(const std::string &message) {
    writeLog(LogLevel::CRITICAL, LogCategory::SYSTEM, "", message);
  }

  static void debug(LogCategory category, const std::string &function,
                    const std::string &message) {
    writeLog(LogLevel::DEBUG, category, function, message);
  }

  static void info(LogCategory category, const std::string &function,
                   const std::string &message) {
    writeLog(LogLevel::INFO, category, function, message);
  }

  static void warning(LogCategory category, const std::string &function,
                      const std::string &message) {
    writeLog(LogLevel::WARNING, category, function, message);
  }

  static void error(LogCategory category, const std::string &function,
                    const std::string &message) {
    writeLog(LogLevel::ERROR, category, function, message);
  }

  static void critical(LogCategory category, const std::string &function,
                       const std::string &message) {
    writeLog(LogLevel::CRITICAL, category, function, message);
  }

  static void log(LogLevel level, LogCategory category,
                  const std::string &function, const std::string &message) {
    writeLog(level, category, function, message);
  }

  static void setLogLevel(LogLevel level);
  static void setLogLevel(const std::string &levelStr);
  static LogLevel getCurrentLogLevel();
};

#endif
