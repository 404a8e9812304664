#include "core/database_config.h"
#include "core/logger.h"
#include <cctype>
#include <cstdlib>
#include <cstring>

using json = nlohmann::json;

std::string DatabaseConfig::postgres_host_ = "localhost";
std::string DatabaseConfig::postgres_db_ = "analytics";
std::string DatabaseConfig::postgres_user_ = "postgres";
std::string DatabaseConfig::postgres_password_ = "";
std::string DatabaseConfig::postgres_port_ = "5432";
size_t DatabaseConfig::pool_min_ = DatabaseConfig::DEFAULT_POOL_MIN;
size_t DatabaseConfig::pool_max_ = DatabaseConfig::DEFAULT_POOL_MAX;
int DatabaseConfig::pool_acquire_timeout_seconds_ =
    DatabaseConfig::DEFAULT_POOL_ACQUIRE_TIMEOUT;
bool DatabaseConfig::initialized_ = false;
std::mutex DatabaseConfig::configMutex_;

namespace {
bool validateAndSetPort(const std::string &portStr, std::string &targetPort) {
  if (portStr.empty() || portStr.length() > 5)
    return false;

  for (char c : portStr) {
    if (!std::isdigit(static_cast<unsigned char>(c)))
      return false;
  }

  try {
    int portNum = std::stoi(portStr);
    if (portNum > 0 && portNum <= 65535) {
      targetPort = portStr;
      return true;
    }
  } catch (const std::exception &) {
  }
  return false;
}

// Ports show up both as strings and as numbers in hand-written config files.
std::string portToString(const json &value) {
  if (value.is_number_integer())
    return std::to_string(value.get<long long>());
  if (value.is_string())
    return value.get<std::string>();
  return "";
}
} // namespace

// libpq keyword/value syntax: values with spaces, quotes or backslashes must
// be single-quoted with the quote and backslash escaped.
std::string DatabaseConfig::escapeConnectionParam(const std::string &param) {
  bool needsQuoting = param.empty();
  for (char c : param) {
    if (c == ' ' || c == '\'' || c == '\\' || c == '=') {
      needsQuoting = true;
      break;
    }
  }
  if (!needsQuoting)
    return param;

  std::string escaped = "'";
  for (char c : param) {
    if (c == '\'' || c == '\\')
      escaped += '\\';
    escaped += c;
  }
  escaped += "'";
  return escaped;
}

void DatabaseConfig::loadFromJson(const json &config) {
  std::lock_guard<std::mutex> lock(configMutex_);

  if (!config.contains("database") || !config["database"].is_object() ||
      !config["database"].contains("postgres")) {
    initialized_ = true;
    return;
  }

  const json &pgConfig = config["database"]["postgres"];

  if (pgConfig.contains("host") && pgConfig["host"].is_string()) {
    std::string host = pgConfig["host"].get<std::string>();
    if (!host.empty())
      postgres_host_ = host;
  }
  if (pgConfig.contains("port")) {
    std::string port = portToString(pgConfig["port"]);
    if (!validateAndSetPort(port, postgres_port_)) {
      Logger::warning(LogCategory::CONFIG, "DatabaseConfig",
                      "Invalid port number: " + port +
                          ", keeping: " + postgres_port_);
    }
  }
  if (pgConfig.contains("database") && pgConfig["database"].is_string()) {
    std::string db = pgConfig["database"].get<std::string>();
    if (!db.empty())
      postgres_db_ = db;
  }
  if (pgConfig.contains("user") && pgConfig["user"].is_string()) {
    std::string user = pgConfig["user"].get<std::string>();
    if (!user.empty())
      postgres_user_ = user;
  }
  if (pgConfig.contains("password") && pgConfig["password"].is_string())
    postgres_password_ = pgConfig["password"].get<std::string>();

  if (pgConfig.contains("pool_min") && pgConfig["pool_min"].is_number_integer() &&
      pgConfig["pool_min"].get<long long>() >= 0)
    pool_min_ = pgConfig["pool_min"].get<size_t>();
  if (pgConfig.contains("pool_max") && pgConfig["pool_max"].is_number_integer() &&
      pgConfig["pool_max"].get<long long>() >= 0)
    pool_max_ = pgConfig["pool_max"].get<size_t>();
  if (pgConfig.contains("pool_acquire_timeout_seconds") &&
      pgConfig["pool_acquire_timeout_seconds"].is_number_integer())
    pool_acquire_timeout_seconds_ =
        pgConfig["pool_acquire_timeout_seconds"].get<int>();

  if (pool_max_ == 0) {
    Logger::warning(LogCategory::CONFIG, "DatabaseConfig",
                    "pool_max must be at least 1, using default: " +
                        std::to_string(DEFAULT_POOL_MAX));
    pool_max_ = DEFAULT_POOL_MAX;
  }
  if (pool_min_ > pool_max_) {
    Logger::warning(LogCategory::CONFIG, "DatabaseConfig",
                    "pool_min exceeds pool_max, clamping to " +
                        std::to_string(pool_max_));
    pool_min_ = pool_max_;
  }
  if (pool_acquire_timeout_seconds_ <= 0)
    pool_acquire_timeout_seconds_ = DEFAULT_POOL_ACQUIRE_TIMEOUT;

  initialized_ = true;
}

void DatabaseConfig::loadFromEnv() {
  std::lock_guard<std::mutex> lock(configMutex_);
  loadFromEnvUnlocked();
}

void DatabaseConfig::loadFromEnvUnlocked() {
  const char *host = std::getenv("POSTGRES_HOST");
  const char *port = std::getenv("POSTGRES_PORT");
  const char *db = std::getenv("POSTGRES_DB");
  const char *user = std::getenv("POSTGRES_USER");
  const char *password = std::getenv("POSTGRES_PASSWORD");

  if (host && strlen(host) > 0)
    postgres_host_ = host;
  if (port && strlen(port) > 0) {
    std::string portStr(port);
    if (!validateAndSetPort(portStr, postgres_port_)) {
      Logger::warning(LogCategory::CONFIG, "DatabaseConfig",
                      "Invalid port number: " + portStr +
                          ", keeping: " + postgres_port_);
    }
  }
  if (db && strlen(db) > 0)
    postgres_db_ = db;
  if (user && strlen(user) > 0)
    postgres_user_ = user;
  if (password)
    postgres_password_ = password;

  if (postgres_password_.empty()) {
    Logger::warning(LogCategory::CONFIG, "DatabaseConfig",
                    "POSTGRES_PASSWORD not set in config.json or environment. "
                    "Database connections may fail.");
  }

  initialized_ = true;
}

void DatabaseConfig::setForTesting(const std::string &host,
                                   const std::string &db,
                                   const std::string &user,
                                   const std::string &password,
                                   const std::string &port) {
  std::lock_guard<std::mutex> lock(configMutex_);
  postgres_host_ = host;
  postgres_db_ = db;
  postgres_user_ = user;
  postgres_password_ = password;
  postgres_port_ = port;
  initialized_ = true;
}
