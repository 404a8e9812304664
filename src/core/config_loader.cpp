#include "core/config_loader.h"
#include "core/broker_config.h"
#include "core/consumer_config.h"
#include "core/database_config.h"
#include <cstdlib>
#include <fstream>

using json = nlohmann::json;

LoggerSettings ConfigLoader::load(const std::string &configPath) {
  json config = json::object();

  std::ifstream configFile(configPath);
  if (!configFile.is_open()) {
    Logger::warning(LogCategory::CONFIG, "ConfigLoader",
                    "Could not open config file '" + configPath +
                        "', using defaults or environment variables");
  } else {
    try {
      configFile >> config;
      if (!config.is_object()) {
        Logger::error(LogCategory::CONFIG, "ConfigLoader",
                      "Config file '" + configPath +
                          "' is not a JSON object, ignoring it");
        config = json::object();
      }
    } catch (const json::parse_error &e) {
      Logger::error(LogCategory::CONFIG, "ConfigLoader",
                    "Error parsing config file: " + std::string(e.what()) +
                        ", falling back to environment variables");
      config = json::object();
    }
  }

  return apply(config);
}

LoggerSettings ConfigLoader::apply(const json &config) {
  DatabaseConfig::loadFromJson(config);
  DatabaseConfig::loadFromEnv();
  BrokerConfig::loadFromJson(config);
  BrokerConfig::loadFromEnv();
  ConsumerConfig::loadFromJson(config);

  LoggerSettings settings = loggerSettingsFrom(config);
  if (settings.database)
    settings.databaseConnectionString =
        DatabaseConfig::getPostgresConnectionString();
  return settings;
}

LoggerSettings ConfigLoader::loggerSettingsFrom(const json &config) {
  LoggerSettings settings;

  if (config.contains("logging") && config["logging"].is_object()) {
    const json &logging = config["logging"];
    if (logging.contains("level") && logging["level"].is_string())
      settings.level = logging["level"].get<std::string>();
    if (logging.contains("console") && logging["console"].is_boolean())
      settings.console = logging["console"].get<bool>();
    if (logging.contains("file") && logging["file"].is_string())
      settings.filePath = logging["file"].get<std::string>();
    if (logging.contains("max_file_size") &&
        logging["max_file_size"].is_number_integer() &&
        logging["max_file_size"].get<long long>() > 0)
      settings.maxFileSize = logging["max_file_size"].get<size_t>();
    if (logging.contains("max_backup_files") &&
        logging["max_backup_files"].is_number_integer())
      settings.maxBackupFiles = logging["max_backup_files"].get<int>();
    if (logging.contains("database") && logging["database"].is_boolean())
      settings.database = logging["database"].get<bool>();
  }

  const char *envLevel = std::getenv("LOG_LEVEL");
  if (envLevel && envLevel[0] != '\0')
    settings.level = envLevel;

  return settings;
}
