#include "core/consumer_config.h"

std::atomic<size_t> ConsumerConfig::POLL_TIMEOUT_MS =
    ConsumerConfig::DEFAULT_POLL_TIMEOUT_MS;
std::atomic<size_t> ConsumerConfig::MAX_BATCH_SIZE =
    ConsumerConfig::DEFAULT_MAX_BATCH_SIZE;
std::atomic<size_t> ConsumerConfig::MAX_HANDLER_RETRIES =
    ConsumerConfig::DEFAULT_MAX_HANDLER_RETRIES;
std::atomic<size_t> ConsumerConfig::RETRY_BACKOFF_MS =
    ConsumerConfig::DEFAULT_RETRY_BACKOFF_MS;

namespace {
bool readSize(const nlohmann::json &obj, const char *key, size_t &out) {
  if (!obj.contains(key))
    return false;
  const auto &value = obj[key];
  if (!value.is_number_integer())
    throw std::invalid_argument(std::string(key) + " must be an integer");
  if (value.get<long long>() < 0)
    throw std::invalid_argument(std::string(key) + " must not be negative");
  out = static_cast<size_t>(value.get<long long>());
  return true;
}
} // namespace

void ConsumerConfig::loadFromJson(const nlohmann::json &config) {
  if (!config.contains("consumer") || !config["consumer"].is_object())
    return;

  const auto &consumer = config["consumer"];
  size_t value = 0;

  if (readSize(consumer, "poll_timeout_ms", value))
    setPollTimeoutMs(value);
  if (readSize(consumer, "max_batch_size", value))
    setMaxBatchSize(value);
  if (readSize(consumer, "max_handler_retries", value))
    setMaxHandlerRetries(value);
  if (readSize(consumer, "retry_backoff_ms", value))
    setRetryBackoffMs(value);
}
