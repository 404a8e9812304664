#include "core/logger.h"
#include "core/console_log_writer.h"
#include "core/database_log_writer.h"
#include "core/file_log_writer.h"
#include <algorithm>
#include <iostream>

std::vector<std::unique_ptr<ILogWriter>> Logger::writers_;
bool Logger::initialized_ = false;
std::mutex Logger::logMutex;

LogLevel Logger::currentLogLevel = LogLevel::INFO;
std::mutex Logger::configMutex;

const std::unordered_map<std::string, LogCategory> Logger::categoryMap = {
    {"SYSTEM", LogCategory::SYSTEM},     {"DATABASE", LogCategory::DATABASE},
    {"CONFIG", LogCategory::CONFIG},     {"KAFKA", LogCategory::KAFKA},
    {"DISPATCH", LogCategory::DISPATCH}, {"HANDLER", LogCategory::HANDLER},
    {"SCHEMA", LogCategory::SCHEMA},     {"PRODUCER", LogCategory::PRODUCER}};

const std::unordered_map<std::string, LogLevel> Logger::levelMap = {
    {"DEBUG", LogLevel::DEBUG},      {"INFO", LogLevel::INFO},
    {"WARN", LogLevel::WARNING},     {"WARNING", LogLevel::WARNING},
    {"ERROR", LogLevel::ERROR},      {"FATAL", LogLevel::CRITICAL},
    {"CRITICAL", LogLevel::CRITICAL}};

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
  case LogCategory::CONFIG:
    return "CONFIG";
  case LogCategory::KAFKA:
    return "KAFKA";
  case LogCategory::DISPATCH:
    return "DISPATCH";
  case LogCategory::HANDLER:
    return "HANDLER";
  case LogCategory::SCHEMA:
    return "SCHEMA";
  case LogCategory::PRODUCER:
    return "PRODUCER";
  case LogCategory::UNKNOWN:
    break;
  }
  return "UNKNOWN";
}

LogCategory Logger::stringToCategory(const std::string &categoryStr) {
  auto it = categoryMap.find(categoryStr);
  return (it != categoryMap.end()) ? it->second : LogCategory::UNKNOWN;
}

LogLevel Logger::stringToLogLevel(const std::string &levelStr) {
  std::string upper = levelStr;
  std::transform(upper.begin(), upper.end(), upper.begin(), ::toupper);
  auto it = levelMap.find(upper);
  return (it != levelMap.end()) ? it->second : LogLevel::INFO;
}

// Records below the configured level are dropped before any formatting.
// Until initialize() runs, records go straight to the console so that
// configuration errors raised during startup are still visible.
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

  LogRecord record;
  record.timestamp = getCurrentTimestamp();
  record.level = getLevelString(level);
  record.category = getCategoryString(category);
  record.component = function;
  record.message = message;
  record.formatted = formatLogMessage(record.timestamp, record.level,
                                      record.category, function, message);
  record.isError = level >= LogLevel::WARNING;

  std::lock_guard<std::mutex> lock(logMutex);
  if (!initialized_) {
    (record.isError ? std::cerr : std::cout) << record.formatted << '\n';
    return;
  }

  for (auto &writer : writers_) {
    if (writer && writer->isOpen()) {
      writer->write(record);
    }
  }
}

void Logger::setLogLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(configMutex);
  currentLogLevel = level;
}

// Accepts DEBUG, INFO, WARN/WARNING, ERROR, FATAL/CRITICAL in any case.
// Anything else leaves the current level untouched.
void Logger::setLogLevel(const std::string &levelStr) {
  if (levelStr.empty()) {
    return;
  }

  std::string upperLevelStr = levelStr;
  std::transform(upperLevelStr.begin(), upperLevelStr.end(),
                 upperLevelStr.begin(), ::toupper);

  if (levelMap.find(upperLevelStr) == levelMap.end()) {
    return;
  }

  setLogLevel(stringToLogLevel(upperLevelStr));
}

LogLevel Logger::getCurrentLogLevel() {
  std::lock_guard<std::mutex> lock(configMutex);
  return currentLogLevel;
}

// Builds the sink list from the settings. A file or database sink that
// cannot be opened is reported on stderr and left out; logging continues
// with whatever sinks did open.
void Logger::initialize(const LoggerSettings &settings) {
  setLogLevel(settings.level);

  std::vector<std::unique_ptr<ILogWriter>> writers;

  if (settings.console) {
    writers.push_back(std::make_unique<ConsoleLogWriter>());
  }

  if (!settings.filePath.empty()) {
    auto fileWriter = std::make_unique<FileLogWriter>(
        settings.filePath, settings.maxFileSize, settings.maxBackupFiles);
    if (fileWriter->isOpen()) {
      writers.push_back(std::move(fileWriter));
    } else {
      std::cerr << "Warning: Could not open log file '" << settings.filePath
                << "'. File logging will be disabled." << std::endl;
    }
  }

  if (settings.database && !settings.databaseConnectionString.empty()) {
    try {
      auto dbWriter =
          std::make_unique<DatabaseLogWriter>(settings.databaseConnectionString);
      if (dbWriter->isEnabled()) {
        writers.push_back(std::move(dbWriter));
      } else {
        std::cerr << "Warning: Database log writer initialization failed. "
                     "Logging to database will be disabled."
                  << std::endl;
      }
    } catch (const std::exception &e) {
      std::cerr << "Error initializing database log writer: " << e.what()
                << std::endl;
    }
  }

  std::lock_guard<std::mutex> lock(logMutex);
  for (auto &writer : writers_) {
    writer->flush();
    writer->close();
  }
  writers_ = std::move(writers);
  initialized_ = true;
}

void Logger::shutdown() {
  std::lock_guard<std::mutex> lock(logMutex);
  for (auto &writer : writers_) {
    writer->flush();
    writer->close();
  }
  writers_.clear();
  initialized_ = false;
}
