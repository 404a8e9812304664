#ifndef CONNECTION_POOL_H
#define CONNECTION_POOL_H

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <string>

namespace pqxx {
class connection;
}

struct PoolStats {
  size_t totalConnections = 0;
  size_t activeConnections = 0;
  size_t idleConnections = 0;
  size_t failedConnections = 0;
  size_t discardedConnections = 0;
};

// Bounded pool of PostgreSQL connections to the replica. Connections are
// opened lazily up to maxConnections; a caller that finds the pool exhausted
// waits up to acquireTimeout and then gets ConnectionPoolError.
class ConnectionPool {
public:
  struct PoolConfig {
    std::string connectionString;
    size_t minConnections = 1;
    size_t maxConnections = 5;
    std::chrono::seconds acquireTimeout{30};
  };

  struct PooledConnection {
    std::unique_ptr<pqxx::connection> connection;
    std::chrono::steady_clock::time_point lastUsed;
    int connectionId = 0;

    ~PooledConnection();
  };

  explicit ConnectionPool(PoolConfig config);
  ~ConnectionPool();

  ConnectionPool(const ConnectionPool &) = delete;
  ConnectionPool &operator=(const ConnectionPool &) = delete;

  // Opens minConnections up front. Throws ConnectionPoolError if none can be
  // opened.
  void initialize();
  void shutdown();

  std::shared_ptr<PooledConnection> acquire();
  void release(std::shared_ptr<PooledConnection> conn);

  PoolStats getStats() const;
  size_t maxConnections() const { return config_.maxConnections; }

private:
  PoolConfig config_;
  mutable std::mutex poolMutex;
  std::condition_variable poolCondition;
  std::deque<std::shared_ptr<PooledConnection>> availableConnections;
  PoolStats stats;
  bool isShuttingDown = false;
  int nextConnectionId = 1;

  std::shared_ptr<PooledConnection> createConnection(int connectionId);
  static bool validateConnection(const PooledConnection &conn);
};

// Holds one pooled connection for the lifetime of a scope and hands it back
// on every exit path.
class ConnectionGuard {
private:
  ConnectionPool &pool;
  std::shared_ptr<ConnectionPool::PooledConnection> connection;

public:
  explicit ConnectionGuard(ConnectionPool &pool);
  ~ConnectionGuard();

  ConnectionGuard(const ConnectionGuard &) = delete;
  ConnectionGuard &operator=(const ConnectionGuard &) = delete;

  pqxx::connection &get() const { return *connection->connection; }
  int getConnectionId() const { return connection->connectionId; }
};

#endif
