#ifndef DATABASE_CONFIG_H
#define DATABASE_CONFIG_H

#include <cstddef>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>

// PostgreSQL target and connection pool settings. Values come from the
// "database.postgres" object of config.json, then from POSTGRES_* variables
// which take precedence.
class DatabaseConfig {
private:
  static std::string postgres_host_;
  static std::string postgres_db_;
  static std::string postgres_user_;
  static std::string postgres_password_;
  static std::string postgres_port_;
  static size_t pool_min_;
  static size_t pool_max_;
  static int pool_acquire_timeout_seconds_;
  static bool initialized_;
  static std::mutex configMutex_;

  static void loadFromEnvUnlocked();

public:
  static constexpr size_t DEFAULT_POOL_MIN = 1;
  static constexpr size_t DEFAULT_POOL_MAX = 5;
  static constexpr int DEFAULT_POOL_ACQUIRE_TIMEOUT = 30;

  static std::string escapeConnectionParam(const std::string &param);

  static void loadFromJson(const nlohmann::json &config);
  static void loadFromEnv();

  static void setForTesting(const std::string &host, const std::string &db,
                            const std::string &user,
                            const std::string &password,
                            const std::string &port);

  static std::string getPostgresHost() {
    std::lock_guard<std::mutex> lock(configMutex_);
    return postgres_host_;
  }
  static std::string getPostgresDB() {
    std::lock_guard<std::mutex> lock(configMutex_);
    return postgres_db_;
  }
  static std::string getPostgresUser() {
    std::lock_guard<std::mutex> lock(configMutex_);
    return postgres_user_;
  }
  static std::string getPostgresPort() {
    std::lock_guard<std::mutex> lock(configMutex_);
    return postgres_port_;
  }
  static size_t getPoolMin() {
    std::lock_guard<std::mutex> lock(configMutex_);
    return pool_min_;
  }
  static size_t getPoolMax() {
    std::lock_guard<std::mutex> lock(configMutex_);
    return pool_max_;
  }
  static int getPoolAcquireTimeoutSeconds() {
    std::lock_guard<std::mutex> lock(configMutex_);
    return pool_acquire_timeout_seconds_;
  }

  static std::string getPostgresConnectionString() {
    std::lock_guard<std::mutex> lock(configMutex_);
    return "host=" + escapeConnectionParam(postgres_host_) +
           " dbname=" + escapeConnectionParam(postgres_db_) +
           " user=" + escapeConnectionParam(postgres_user_) +
           " password=" + escapeConnectionParam(postgres_password_) +
           " port=" + escapeConnectionParam(postgres_port_);
  }

  static std::string getPostgresConnectionStringForLogging() {
    std::lock_guard<std::mutex> lock(configMutex_);
    return "host=" + escapeConnectionParam(postgres_host_) +
           " dbname=" + escapeConnectionParam(postgres_db_) +
           " user=" + escapeConnectionParam(postgres_user_) +
           " password=*** port=" + escapeConnectionParam(postgres_port_);
  }

  static bool isInitialized() {
    std::lock_guard<std::mutex> lock(configMutex_);
    return initialized_;
  }
};

#endif
