#include "core/broker_config.h"
#include "core/logger.h"
#include <cstdlib>
#include <cstring>

using json = nlohmann::json;

std::string BrokerConfig::bootstrap_servers_ =
    BrokerConfig::DEFAULT_BOOTSTRAP_SERVERS;
std::string BrokerConfig::client_id_ = BrokerConfig::DEFAULT_CLIENT_ID;
std::string BrokerConfig::group_id_ = BrokerConfig::DEFAULT_GROUP_ID;
std::string BrokerConfig::auto_offset_reset_ =
    BrokerConfig::DEFAULT_AUTO_OFFSET_RESET;
int BrokerConfig::session_timeout_ms_ = BrokerConfig::DEFAULT_SESSION_TIMEOUT_MS;
std::string BrokerConfig::domains_;
std::mutex BrokerConfig::configMutex_;

namespace {
bool isValidOffsetReset(const std::string &value) {
  return value == "earliest" || value == "latest" || value == "none";
}

void assignNonEmpty(const json &obj, const char *key, std::string &target) {
  if (obj.contains(key) && obj[key].is_string()) {
    std::string value = obj[key].get<std::string>();
    if (!value.empty())
      target = value;
  }
}
} // namespace

void BrokerConfig::loadFromJson(const json &config) {
  if (!config.contains("kafka") || !config["kafka"].is_object())
    return;

  const json &kafka = config["kafka"];
  std::lock_guard<std::mutex> lock(configMutex_);

  assignNonEmpty(kafka, "bootstrap_servers", bootstrap_servers_);
  assignNonEmpty(kafka, "client_id", client_id_);
  assignNonEmpty(kafka, "group_id", group_id_);

  std::string offsetReset = auto_offset_reset_;
  assignNonEmpty(kafka, "auto_offset_reset", offsetReset);
  if (isValidOffsetReset(offsetReset)) {
    auto_offset_reset_ = offsetReset;
  } else {
    Logger::warning(LogCategory::CONFIG, "BrokerConfig",
                    "Invalid auto_offset_reset: " + offsetReset +
                        ", keeping: " + auto_offset_reset_);
  }

  if (kafka.contains("session_timeout_ms") &&
      kafka["session_timeout_ms"].is_number_integer()) {
    int timeout = kafka["session_timeout_ms"].get<int>();
    if (timeout > 0)
      session_timeout_ms_ = timeout;
  }

  if (kafka.contains("domains")) {
    const json &domains = kafka["domains"];
    if (domains.is_string()) {
      domains_ = domains.get<std::string>();
    } else if (domains.is_array()) {
      std::string joined;
      for (const auto &d : domains) {
        if (!d.is_string())
          continue;
        if (!joined.empty())
          joined += ",";
        joined += d.get<std::string>();
      }
      domains_ = joined;
    }
  }
}

void BrokerConfig::loadFromEnv() {
  const char *servers = std::getenv("KAFKA_BOOTSTRAP_SERVERS");
  const char *clientId = std::getenv("KAFKA_CLIENT_ID");
  const char *groupId = std::getenv("KAFKA_GROUP_ID");
  const char *offsetReset = std::getenv("KAFKA_AUTO_OFFSET_RESET");
  const char *sessionTimeout = std::getenv("KAFKA_SESSION_TIMEOUT_MS");
  const char *domains = std::getenv("EVENTSYNC_DOMAINS");

  std::lock_guard<std::mutex> lock(configMutex_);

  if (servers && strlen(servers) > 0)
    bootstrap_servers_ = servers;
  if (clientId && strlen(clientId) > 0)
    client_id_ = clientId;
  if (groupId && strlen(groupId) > 0)
    group_id_ = groupId;
  if (offsetReset && strlen(offsetReset) > 0) {
    if (isValidOffsetReset(offsetReset)) {
      auto_offset_reset_ = offsetReset;
    } else {
      Logger::warning(LogCategory::CONFIG, "BrokerConfig",
                      "Invalid KAFKA_AUTO_OFFSET_RESET: " +
                          std::string(offsetReset) +
                          ", keeping: " + auto_offset_reset_);
    }
  }
  if (sessionTimeout && strlen(sessionTimeout) > 0) {
    try {
      int timeout = std::stoi(sessionTimeout);
      if (timeout <= 0)
        throw std::out_of_range("non-positive");
      session_timeout_ms_ = timeout;
    } catch (const std::exception &) {
      Logger::warning(LogCategory::CONFIG, "BrokerConfig",
                      "Invalid KAFKA_SESSION_TIMEOUT_MS: " +
                          std::string(sessionTimeout) + ", keeping: " +
                          std::to_string(session_timeout_ms_));
    }
  }
  if (domains)
    domains_ = domains;
}

void BrokerConfig::setGroupId(const std::string &groupId) {
  std::lock_guard<std::mutex> lock(configMutex_);
  group_id_ = groupId.empty() ? DEFAULT_GROUP_ID : groupId;
}

void BrokerConfig::setDomains(const std::string &domains) {
  std::lock_guard<std::mutex> lock(configMutex_);
  domains_ = domains;
}
