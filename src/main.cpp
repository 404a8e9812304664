#include "core/broker_config.h"
#include "core/config_loader.h"
#include "core/database_config.h"
#include "core/errors.h"
#include "core/logger.h"
#include "events/topic_router.h"
#include "sync/ReplicaService.h"
#include <atomic>
#include <csignal>
#include <iostream>

namespace {
constexpr int EXIT_SUCCESS_CODE = 0;
constexpr int EXIT_INIT_ERROR = 2;
constexpr int EXIT_EXECUTION_ERROR = 3;
constexpr int EXIT_CRITICAL_ERROR = 4;
constexpr int EXIT_UNKNOWN_ERROR = 5;
constexpr int EXIT_CONFIG_ERROR = 6;
constexpr int EXIT_SIGNAL_ERROR = 7;

std::atomic<bool> g_shutdownRequested{false};

void signalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_shutdownRequested.store(true);
  }
}

void cleanupLogger() {
  try {
    Logger::shutdown();
  } catch (const std::exception &e) {
    std::cerr << "Error while closing log writers: " << e.what() << std::endl;
  }
}
} // namespace

int main(int argc, char *argv[]) {
  const std::string configPath = argc > 1 ? argv[1] : "config.json";

  try {
    LoggerSettings logSettings;
    try {
      logSettings = ConfigLoader::load(configPath);
      TopicRouter::parseDomainList(BrokerConfig::getDomains());
    } catch (const std::exception &e) {
      std::cerr << "Configuration error: " << e.what() << std::endl;
      return EXIT_CONFIG_ERROR;
    }

    if (!DatabaseConfig::isInitialized()) {
      std::cerr << "Error: Database configuration failed to initialize. "
                   "Please check "
                << configPath << " or the POSTGRES_* environment variables."
                << std::endl;
      return EXIT_CONFIG_ERROR;
    }

    Logger::initialize(logSettings);

    if (std::signal(SIGINT, signalHandler) == SIG_ERR) {
      std::cerr << "Error: Failed to register SIGINT handler" << std::endl;
      cleanupLogger();
      return EXIT_SIGNAL_ERROR;
    }

    if (std::signal(SIGTERM, signalHandler) == SIG_ERR) {
      std::cerr << "Error: Failed to register SIGTERM handler" << std::endl;
      cleanupLogger();
      return EXIT_SIGNAL_ERROR;
    }

    Logger::info(LogCategory::SYSTEM, "main", "EventSync started");
    Logger::info(LogCategory::SYSTEM, "main",
                 "Replica " + DatabaseConfig::getPostgresDB() + "@" +
                     DatabaseConfig::getPostgresHost() + ", brokers " +
                     BrokerConfig::getBootstrapServers() + ", group " +
                     BrokerConfig::getGroupId());

    ReplicaService service;

    try {
      service.initialize();
      Logger::info(LogCategory::SYSTEM, "main",
                   "ReplicaService initialized successfully");
    } catch (const std::exception &e) {
      Logger::critical(LogCategory::SYSTEM, "main",
                       "Exception during ReplicaService initialization: " +
                           std::string(e.what()));
      std::cerr << "Initialization error: " << e.what() << std::endl;
      cleanupLogger();
      return EXIT_INIT_ERROR;
    }

    try {
      service.run([&]() { return g_shutdownRequested.load(); });
      service.shutdown();
      Logger::info(LogCategory::SYSTEM, "main", "EventSync stopped cleanly");
    } catch (const std::exception &e) {
      Logger::error(LogCategory::SYSTEM, "main",
                    "Exception during dispatch: " + std::string(e.what()));
      std::cerr << "Execution error: " << e.what() << std::endl;
      cleanupLogger();
      return EXIT_EXECUTION_ERROR;
    }

    cleanupLogger();
    return EXIT_SUCCESS_CODE;

  } catch (const std::exception &e) {
    std::cerr << "Critical error in main: " << e.what() << std::endl;
    cleanupLogger();
    return EXIT_CRITICAL_ERROR;
  } catch (...) {
    std::cerr << "Unknown critical error in main" << std::endl;
    cleanupLogger();
    return EXIT_UNKNOWN_ERROR;
  }
}
