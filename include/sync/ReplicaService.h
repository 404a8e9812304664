#ifndef REPLICA_SERVICE_H
#define REPLICA_SERVICE_H

#include "consumers/IDomainConsumer.h"
#include "dal/order_dal.h"
#include "dal/post_dal.h"
#include "dal/product_dal.h"
#include "dal/supplier_dal.h"
#include "dal/user_dal.h"
#include "db/connection_pool.h"
#include "engines/kafka_engine.h"
#include "sync/EventDispatcher.h"
#include "sync/HandlerRegistry.h"
#include <atomic>
#include <functional>
#include <memory>
#include <vector>

// Owns the whole consuming side of the replica: connection pool, schema
// bootstrap, DALs, one consumer per selected domain, the Kafka client and the
// dispatcher. initialize() does everything that can fail at startup, so a
// failure there means no message was consumed.
class ReplicaService {
public:
  ReplicaService();
  ~ReplicaService();

  void initialize();
  void run(std::function<bool()> shutdownCheck);
  void shutdown();

  const std::vector<Domain> &domains() const { return domains_; }
  DispatchStats getStats() const;

private:
  std::atomic<bool> shutdownCalled_{false};
  std::vector<Domain> domains_;

  std::unique_ptr<ConnectionPool> pool_;
  std::unique_ptr<UserDAL> userDal_;
  std::unique_ptr<SupplierDAL> supplierDal_;
  std::unique_ptr<ProductDAL> productDal_;
  std::unique_ptr<OrderDAL> orderDal_;
  std::unique_ptr<PostDAL> postDal_;

  std::vector<std::unique_ptr<IDomainConsumer>> consumers_;
  HandlerRegistry registry_;
  std::unique_ptr<KafkaEngine> kafka_;
  std::unique_ptr<EventDispatcher> dispatcher_;

  void initializeDatabase();
  void registerConsumers();
  void initializeBroker();
  std::unique_ptr<IDomainConsumer> makeConsumer(Domain domain);
};

#endif
