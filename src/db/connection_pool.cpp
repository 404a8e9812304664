#include "db/connection_pool.h"
#include "core/errors.h"
#include "core/logger.h"
#include <pqxx/pqxx>

ConnectionPool::PooledConnection::~PooledConnection() = default;

ConnectionPool::ConnectionPool(PoolConfig config) : config_(std::move(config)) {
  if (config_.maxConnections == 0)
    config_.maxConnections = 1;
  if (config_.minConnections > config_.maxConnections)
    config_.minConnections = config_.maxConnections;
}

ConnectionPool::~ConnectionPool() { shutdown(); }

std::shared_ptr<ConnectionPool::PooledConnection>
ConnectionPool::createConnection(int connectionId) {
  auto pooledConn = std::make_shared<PooledConnection>();
  pooledConn->connection =
      std::make_unique<pqxx::connection>(config_.connectionString);
  pooledConn->connectionId = connectionId;
  pooledConn->lastUsed = std::chrono::steady_clock::now();

  Logger::debug(LogCategory::DATABASE, "ConnectionPool",
                "Created PostgreSQL connection (ID: " +
                    std::to_string(connectionId) + ")");
  return pooledConn;
}

bool ConnectionPool::validateConnection(const PooledConnection &conn) {
  return conn.connection && conn.connection->is_open();
}

void ConnectionPool::initialize() {
  std::lock_guard<std::mutex> lock(poolMutex);

  Logger::info(LogCategory::DATABASE, "ConnectionPool",
               "Initializing connection pool (min " +
                   std::to_string(config_.minConnections) + ", max " +
                   std::to_string(config_.maxConnections) + ")");

  std::string lastError;
  while (stats.totalConnections < config_.minConnections) {
    try {
      auto conn = createConnection(nextConnectionId++);
      availableConnections.push_back(conn);
      stats.totalConnections++;
      stats.idleConnections++;
    } catch (const std::exception &e) {
      stats.failedConnections++;
      lastError = e.what();
      break;
    }
  }

  if (config_.minConnections > 0 && stats.totalConnections == 0) {
    throw ConnectionPoolError("Failed to open any PostgreSQL connection: " +
                              lastError);
  }

  Logger::info(LogCategory::DATABASE, "ConnectionPool",
               "Connection pool initialized with " +
                   std::to_string(stats.totalConnections) + " connections");
}

void ConnectionPool::shutdown() {
  std::lock_guard<std::mutex> lock(poolMutex);

  if (isShuttingDown)
    return;
  isShuttingDown = true;

  size_t closed = availableConnections.size();
  availableConnections.clear();
  stats.totalConnections -= closed;
  stats.idleConnections = 0;

  poolCondition.notify_all();
  Logger::info(LogCategory::DATABASE, "ConnectionPool",
               "Connection pool shutdown complete (" + std::to_string(closed) +
                   " idle connections closed)");
}

// Prefers an idle connection, discarding any that were closed underneath
// us; otherwise opens a new one while below the limit; otherwise waits.
// The connection is opened outside the lock so a slow server does not block
// callers returning connections.
std::shared_ptr<ConnectionPool::PooledConnection> ConnectionPool::acquire() {
  std::unique_lock<std::mutex> lock(poolMutex);

  auto deadline = std::chrono::steady_clock::now() + config_.acquireTimeout;

  while (true) {
    if (isShuttingDown)
      throw ConnectionPoolError("Connection pool is shutting down");

    while (!availableConnections.empty()) {
      auto conn = availableConnections.front();
      availableConnections.pop_front();
      stats.idleConnections--;

      if (validateConnection(*conn)) {
        conn->lastUsed = std::chrono::steady_clock::now();
        stats.activeConnections++;
        return conn;
      }

      stats.totalConnections--;
      stats.discardedConnections++;
      Logger::warning(LogCategory::DATABASE, "ConnectionPool",
                      "Discarding closed connection (ID: " +
                          std::to_string(conn->connectionId) + ")");
    }

    if (stats.totalConnections < config_.maxConnections) {
      int connectionId = nextConnectionId++;
      stats.totalConnections++;
      stats.activeConnections++;
      lock.unlock();

      try {
        return createConnection(connectionId);
      } catch (const std::exception &e) {
        lock.lock();
        stats.totalConnections--;
        stats.activeConnections--;
        stats.failedConnections++;
        poolCondition.notify_one();
        throw ConnectionPoolError("Failed to create PostgreSQL connection: " +
                                  std::string(e.what()));
      }
    }

    if (poolCondition.wait_until(lock, deadline) == std::cv_status::timeout &&
        availableConnections.empty() &&
        stats.totalConnections >= config_.maxConnections) {
      throw ConnectionPoolError(
          "Timeout waiting for a PostgreSQL connection after " +
          std::to_string(config_.acquireTimeout.count()) + "s");
    }
  }
}

void ConnectionPool::release(std::shared_ptr<PooledConnection> conn) {
  if (!conn)
    return;

  std::lock_guard<std::mutex> lock(poolMutex);
  stats.activeConnections--;

  if (isShuttingDown || !validateConnection(*conn)) {
    stats.totalConnections--;
    if (!isShuttingDown) {
      stats.discardedConnections++;
      Logger::warning(LogCategory::DATABASE, "ConnectionPool",
                      "Connection validation failed, closing connection (ID: " +
                          std::to_string(conn->connectionId) + ")");
    }
  } else {
    conn->lastUsed = std::chrono::steady_clock::now();
    availableConnections.push_back(std::move(conn));
    stats.idleConnections++;
  }

  poolCondition.notify_one();
}

PoolStats ConnectionPool::getStats() const {
  std::lock_guard<std::mutex> lock(poolMutex);
  return stats;
}

ConnectionGuard::ConnectionGuard(ConnectionPool &pool)
    : pool(pool), connection(pool.acquire()) {}

ConnectionGuard::~ConnectionGuard() { pool.release(std::move(connection)); }
