#ifndef CONSUMER_CONFIG_H
#define CONSUMER_CONFIG_H

#include <atomic>
#include <cstddef>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

struct ConsumerConfig {
  static std::atomic<size_t> POLL_TIMEOUT_MS;
  static std::atomic<size_t> MAX_BATCH_SIZE;
  static std::atomic<size_t> MAX_HANDLER_RETRIES;
  static std::atomic<size_t> RETRY_BACKOFF_MS;

  static constexpr size_t DEFAULT_POLL_TIMEOUT_MS = 1000;
  static constexpr size_t DEFAULT_MAX_BATCH_SIZE = 100;
  static constexpr size_t DEFAULT_MAX_HANDLER_RETRIES = 0;
  static constexpr size_t DEFAULT_RETRY_BACKOFF_MS = 1000;

  static constexpr size_t MIN_POLL_TIMEOUT_MS = 10;
  static constexpr size_t MAX_POLL_TIMEOUT_MS = 60000;
  static constexpr size_t MIN_BATCH_SIZE = 1;
  static constexpr size_t MAX_BATCH_SIZE_LIMIT = 10000;
  static constexpr size_t MAX_HANDLER_RETRIES_LIMIT = 1000;
  static constexpr size_t MAX_RETRY_BACKOFF_MS = 600000;

  static void setPollTimeoutMs(size_t v) {
    if (v < MIN_POLL_TIMEOUT_MS || v > MAX_POLL_TIMEOUT_MS) {
      throw std::invalid_argument("POLL_TIMEOUT_MS must be between " +
                                  std::to_string(MIN_POLL_TIMEOUT_MS) +
                                  " and " +
                                  std::to_string(MAX_POLL_TIMEOUT_MS));
    }
    POLL_TIMEOUT_MS = v;
  }

  static size_t getPollTimeoutMs() { return POLL_TIMEOUT_MS; }

  static void setMaxBatchSize(size_t v) {
    if (v < MIN_BATCH_SIZE || v > MAX_BATCH_SIZE_LIMIT) {
      throw std::invalid_argument("MAX_BATCH_SIZE must be between " +
                                  std::to_string(MIN_BATCH_SIZE) + " and " +
                                  std::to_string(MAX_BATCH_SIZE_LIMIT));
    }
    MAX_BATCH_SIZE = v;
  }

  static size_t getMaxBatchSize() { return MAX_BATCH_SIZE; }

  // 0 keeps a failing message at the head of its partition until it
  // succeeds.
  static void setMaxHandlerRetries(size_t v) {
    if (v > MAX_HANDLER_RETRIES_LIMIT) {
      throw std::invalid_argument("MAX_HANDLER_RETRIES must be between 0 and " +
                                  std::to_string(MAX_HANDLER_RETRIES_LIMIT));
    }
    MAX_HANDLER_RETRIES = v;
  }

  static size_t getMaxHandlerRetries() { return MAX_HANDLER_RETRIES; }

  static void setRetryBackoffMs(size_t v) {
    if (v > MAX_RETRY_BACKOFF_MS) {
      throw std::invalid_argument("RETRY_BACKOFF_MS must be between 0 and " +
                                  std::to_string(MAX_RETRY_BACKOFF_MS));
    }
    RETRY_BACKOFF_MS = v;
  }

  static size_t getRetryBackoffMs() { return RETRY_BACKOFF_MS; }

  static void resetToDefaults() {
    POLL_TIMEOUT_MS = DEFAULT_POLL_TIMEOUT_MS;
    MAX_BATCH_SIZE = DEFAULT_MAX_BATCH_SIZE;
    MAX_HANDLER_RETRIES = DEFAULT_MAX_HANDLER_RETRIES;
    RETRY_BACKOFF_MS = DEFAULT_RETRY_BACKOFF_MS;
  }

  // Reads the "consumer" object of config.json. Out-of-range values throw
  // std::invalid_argument through the setters.
  static void loadFromJson(const nlohmann::json &config);
};

#endif
