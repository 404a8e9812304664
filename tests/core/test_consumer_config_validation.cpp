#include "../test_runner.h"
#include "core/consumer_config.h"

int main() {
  TestRunner runner;

  std::cout << "\n========================================" << std::endl;
  std::cout << "CONSUMER CONFIG - VALIDATION TESTS" << std::endl;
  std::cout << "========================================\n" << std::endl;

  runner.runTest("Defaults", [&]() {
    ConsumerConfig::resetToDefaults();
    runner.assertEquals(1000, ConsumerConfig::getPollTimeoutMs(),
                        "poll timeout default");
    runner.assertEquals(100, ConsumerConfig::getMaxBatchSize(),
                        "batch size default");
    runner.assertEquals(0, ConsumerConfig::getMaxHandlerRetries(),
                        "retry limit default keeps stall-until-fixed");
    runner.assertEquals(1000, ConsumerConfig::getRetryBackoffMs(),
                        "backoff default");
  });

  runner.runTest("POLL_TIMEOUT_MS bounds", [&]() {
    ConsumerConfig::resetToDefaults();
    runner.assertThrows<std::invalid_argument>(
        [] { ConsumerConfig::setPollTimeoutMs(5); }, "below minimum rejected");
    runner.assertThrows<std::invalid_argument>(
        [] { ConsumerConfig::setPollTimeoutMs(60001); },
        "above maximum rejected");
    ConsumerConfig::setPollTimeoutMs(250);
    runner.assertEquals(250, ConsumerConfig::getPollTimeoutMs(),
                        "valid value accepted");
  });

  runner.runTest("MAX_BATCH_SIZE bounds", [&]() {
    ConsumerConfig::resetToDefaults();
    runner.assertThrows<std::invalid_argument>(
        [] { ConsumerConfig::setMaxBatchSize(0); }, "zero rejected");
    runner.assertThrows<std::invalid_argument>(
        [] { ConsumerConfig::setMaxBatchSize(10001); },
        "above maximum rejected");
    ConsumerConfig::setMaxBatchSize(1);
    runner.assertEquals(1, ConsumerConfig::getMaxBatchSize(),
                        "minimum accepted");
  });

  runner.runTest("MAX_HANDLER_RETRIES and RETRY_BACKOFF_MS bounds", [&]() {
    ConsumerConfig::resetToDefaults();
    runner.assertThrows<std::invalid_argument>(
        [] { ConsumerConfig::setMaxHandlerRetries(1001); },
        "retry limit above maximum rejected");
    runner.assertThrows<std::invalid_argument>(
        [] { ConsumerConfig::setRetryBackoffMs(600001); },
        "backoff above maximum rejected");
    ConsumerConfig::setMaxHandlerRetries(0);
    ConsumerConfig::setRetryBackoffMs(0);
    runner.assertEquals(0, ConsumerConfig::getRetryBackoffMs(),
                        "zero backoff accepted");
  });

  runner.runTest("Load from JSON", [&]() {
    ConsumerConfig::resetToDefaults();
    ConsumerConfig::loadFromJson(nlohmann::json::parse(
        R"({"consumer": {"poll_timeout_ms": 500, "max_batch_size": 20,
                         "max_handler_retries": 3, "retry_backoff_ms": 0}})"));
    runner.assertEquals(500, ConsumerConfig::getPollTimeoutMs(), "poll");
    runner.assertEquals(20, ConsumerConfig::getMaxBatchSize(), "batch");
    runner.assertEquals(3, ConsumerConfig::getMaxHandlerRetries(), "retries");
    runner.assertEquals(0, ConsumerConfig::getRetryBackoffMs(), "backoff");
  });

  runner.runTest("Load from JSON rejects bad values", [&]() {
    ConsumerConfig::resetToDefaults();
    runner.assertThrows<std::invalid_argument>(
        [] {
          ConsumerConfig::loadFromJson(
              nlohmann::json::parse(R"({"consumer": {"max_batch_size": -1}})"));
        },
        "negative value rejected");
    runner.assertThrows<std::invalid_argument>(
        [] {
          ConsumerConfig::loadFromJson(nlohmann::json::parse(
              R"({"consumer": {"poll_timeout_ms": "fast"}})"));
        },
        "non-integer rejected");
    ConsumerConfig::loadFromJson(nlohmann::json::parse(R"({"other": 1})"));
    runner.assertEquals(100, ConsumerConfig::getMaxBatchSize(),
                        "missing section leaves defaults");
  });

  ConsumerConfig::resetToDefaults();
  runner.printSummary();
  return 0;
}
