#ifndef CONFIG_LOADER_H
#define CONFIG_LOADER_H

#include "core/logger.h"
#include <nlohmann/json.hpp>
#include <string>

// Reads config.json once and hands each section to its owner
// (DatabaseConfig, BrokerConfig, ConsumerConfig). Environment variables are
// applied afterwards so they override the file. A missing or unreadable file
// is not an error: the environment and defaults still apply.
class ConfigLoader {
public:
  static LoggerSettings load(const std::string &configPath = "config.json");
  static LoggerSettings apply(const nlohmann::json &config);

  static LoggerSettings loggerSettingsFrom(const nlohmann::json &config);
};

#endif
