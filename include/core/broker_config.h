#ifndef BROKER_CONFIG_H
#define BROKER_CONFIG_H

#include <mutex>
#include <nlohmann/json.hpp>
#include <string>

// Kafka client settings shared by the consumer daemon and the producer side.
// Sources in order of precedence: KAFKA_* / EVENTSYNC_DOMAINS environment
// variables, then the "kafka" object of config.json, then the defaults below.
class BrokerConfig {
private:
  static std::string bootstrap_servers_;
  static std::string client_id_;
  static std::string group_id_;
  static std::string auto_offset_reset_;
  static int session_timeout_ms_;
  static std::string domains_;
  static std::mutex configMutex_;

public:
  static constexpr const char *DEFAULT_BOOTSTRAP_SERVERS = "localhost:9092";
  static constexpr const char *DEFAULT_CLIENT_ID = "eventsync";
  static constexpr const char *DEFAULT_GROUP_ID = "analytics-replica-service";
  static constexpr const char *DEFAULT_AUTO_OFFSET_RESET = "earliest";
  static constexpr int DEFAULT_SESSION_TIMEOUT_MS = 45000;

  static void loadFromJson(const nlohmann::json &config);
  static void loadFromEnv();

  static std::string getBootstrapServers() {
    std::lock_guard<std::mutex> lock(configMutex_);
    return bootstrap_servers_;
  }
  static std::string getClientId() {
    std::lock_guard<std::mutex> lock(configMutex_);
    return client_id_;
  }
  static std::string getGroupId() {
    std::lock_guard<std::mutex> lock(configMutex_);
    return group_id_;
  }
  static std::string getAutoOffsetReset() {
    std::lock_guard<std::mutex> lock(configMutex_);
    return auto_offset_reset_;
  }
  static int getSessionTimeoutMs() {
    std::lock_guard<std::mutex> lock(configMutex_);
    return session_timeout_ms_;
  }
  // Raw comma separated domain list; empty means every domain.
  static std::string getDomains() {
    std::lock_guard<std::mutex> lock(configMutex_);
    return domains_;
  }

  static void setGroupId(const std::string &groupId);
  static void setDomains(const std::string &domains);
};

#endif
