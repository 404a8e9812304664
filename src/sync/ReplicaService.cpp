#include "sync/ReplicaService.h"
#include "consumers/OrderConsumer.h"
#include "consumers/PostConsumer.h"
#include "consumers/ProductConsumer.h"
#include "consumers/SupplierConsumer.h"
#include "consumers/UserConsumer.h"
#include "core/broker_config.h"
#include "core/database_config.h"
#include "core/logger.h"
#include "db/schema_bootstrap.h"
#include "events/topic_router.h"

ReplicaService::ReplicaService() = default;

ReplicaService::~ReplicaService() {
  try {
    shutdown();
  } catch (const std::exception &e) {
    Logger::error(LogCategory::SYSTEM, "ReplicaService",
                  "Error during shutdown: " + std::string(e.what()));
  }
}

void ReplicaService::initialize() {
  domains_ = TopicRouter::parseDomainList(BrokerConfig::getDomains());

  initializeDatabase();
  registerConsumers();
  initializeBroker();

  dispatcher_ = std::make_unique<EventDispatcher>(*kafka_, registry_);
  dispatcher_->start();
}

void ReplicaService::initializeDatabase() {
  ConnectionPool::PoolConfig poolConfig;
  poolConfig.connectionString = DatabaseConfig::getPostgresConnectionString();
  poolConfig.minConnections = DatabaseConfig::getPoolMin();
  poolConfig.maxConnections = DatabaseConfig::getPoolMax();
  poolConfig.acquireTimeout =
      std::chrono::seconds(DatabaseConfig::getPoolAcquireTimeoutSeconds());

  Logger::info(LogCategory::DATABASE, "ReplicaService",
               "Connecting to " +
                   DatabaseConfig::getPostgresConnectionStringForLogging());
  pool_ = std::make_unique<ConnectionPool>(poolConfig);
  pool_->initialize();

  SchemaBootstrap bootstrap(*pool_);
  bootstrap.run();

  userDal_ = std::make_unique<UserDAL>(*pool_);
  supplierDal_ = std::make_unique<SupplierDAL>(*pool_);
  productDal_ = std::make_unique<ProductDAL>(*pool_);
  orderDal_ = std::make_unique<OrderDAL>(*pool_);
  postDal_ = std::make_unique<PostDAL>(*pool_);
}

std::unique_ptr<IDomainConsumer> ReplicaService::makeConsumer(Domain domain) {
  switch (domain) {
  case Domain::USER:
    return std::make_unique<UserConsumer>(*userDal_);
  case Domain::SUPPLIER:
    return std::make_unique<SupplierConsumer>(*supplierDal_);
  case Domain::PRODUCT:
    return std::make_unique<ProductConsumer>(*productDal_);
  case Domain::ORDER:
    return std::make_unique<OrderConsumer>(*orderDal_);
  case Domain::POST:
    return std::make_unique<PostConsumer>(*postDal_);
  }
  throw std::logic_error("Unknown domain");
}

void ReplicaService::registerConsumers() {
  for (Domain domain : domains_) {
    consumers_.push_back(makeConsumer(domain));
    registry_.registerConsumer(*consumers_.back());
  }
  Logger::info(LogCategory::SYSTEM, "ReplicaService",
               "Consuming " + std::to_string(domains_.size()) +
                   " domains, " + std::to_string(registry_.size()) +
                   " handlers");
}

void ReplicaService::initializeBroker() {
  KafkaEngine::KafkaConfig config;
  config.brokers = BrokerConfig::getBootstrapServers();
  config.clientId = BrokerConfig::getClientId();
  config.groupId = BrokerConfig::getGroupId();
  config.autoOffsetReset = BrokerConfig::getAutoOffsetReset();
  config.sessionTimeoutMs = BrokerConfig::getSessionTimeoutMs();

  kafka_ = std::make_unique<KafkaEngine>(config);
  kafka_->initializeConsumer();
}

void ReplicaService::run(std::function<bool()> shutdownCheck) {
  if (!dispatcher_) {
    throw std::logic_error("ReplicaService::run called before initialize");
  }
  dispatcher_->run(shutdownCheck);
}

void ReplicaService::shutdown() {
  if (shutdownCalled_.exchange(true))
    return;

  if (dispatcher_)
    dispatcher_->stop();
  if (pool_)
    pool_->shutdown();

  Logger::info(LogCategory::SYSTEM, "ReplicaService", "Shutdown complete");
}

DispatchStats ReplicaService::getStats() const {
  if (!dispatcher_)
    return DispatchStats{};
  return dispatcher_->getStats();
}
