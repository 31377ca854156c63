#include "database_connection_pool.hpp"
#include "job_exceptions.hpp"
#include "logger.hpp"
#include <algorithm>
#include <numeric>

namespace mdjobs {

DatabaseConnectionPool::DatabaseConnectionPool(
    const DatabaseConnectionConfig &config)
    : config_(config) {
  if (config_.maxConnections < config_.minConnections) {
    throw ValidationException(
        ErrorCode::INVALID_RANGE,
        "maxConnections cannot be less than minConnections", "maxConnections",
        std::to_string(config_.maxConnections));
  }

  DB_LOG_INFO("Database connection pool initialized with max={}, min={}",
              config_.maxConnections, config_.minConnections);

  for (size_t i = 0; i < config_.minConnections; ++i) {
    try {
      idleConnections_.push_back(
          std::make_shared<PooledConnection>(createConnection()));
      metrics_.connectionsCreated++;
    } catch (const JobsException &e) {
      DB_LOG_ERROR("Failed to create initial connection {}: {}", i, e.what());
    }
  }

  if (config_.enableHealthChecks) {
    startHealthMonitoring();
  }
}

DatabaseConnectionPool::~DatabaseConnectionPool() { closeAll(); }

std::shared_ptr<pqxx::connection> DatabaseConnectionPool::acquireConnection() {
  std::unique_lock<std::mutex> lock(poolMutex_);
  auto startTime = std::chrono::steady_clock::now();

  if (shutdown_.load()) {
    throw SystemException(ErrorCode::DATABASE_ERROR,
                          "Connection pool is shutting down",
                          "DatabaseConnectionPool");
  }

  bool available = poolCondition_.wait_until(
      lock, startTime + config_.connectionTimeout, [this]() {
        return !idleConnections_.empty() ||
               activeConnections_.size() < config_.maxConnections ||
               shutdown_.load();
      });

  if (!available) {
    metrics_.connectionTimeouts++;
    throw SystemException(ErrorCode::LOCK_TIMEOUT,
                          "Connection pool timeout - no available connections",
                          "DatabaseConnectionPool");
  }
  if (shutdown_.load()) {
    throw SystemException(ErrorCode::DATABASE_ERROR,
                          "Connection pool is shutting down",
                          "DatabaseConnectionPool");
  }

  std::shared_ptr<PooledConnection> pooledConn;
  if (!idleConnections_.empty()) {
    pooledConn = idleConnections_.front();
    idleConnections_.pop_front();
  } else {
    // Reserve the slot before creating the connection outside the lock
    activeConnections_.push_back(nullptr);
    lock.unlock();

    std::shared_ptr<pqxx::connection> conn;
    try {
      conn = createConnection();
    } catch (const JobsException &) {
      lock.lock();
      activeConnections_.erase(std::find(activeConnections_.begin(),
                                         activeConnections_.end(), nullptr));
      poolCondition_.notify_one();
      throw;
    }

    lock.lock();
    activeConnections_.erase(std::find(activeConnections_.begin(),
                                       activeConnections_.end(), nullptr));
    pooledConn = std::make_shared<PooledConnection>(std::move(conn));
    metrics_.connectionsCreated++;
  }

  pooledConn->lastUsedTime = std::chrono::steady_clock::now();
  activeConnections_.push_back(pooledConn);

  double waitTimeMs = std::chrono::duration<double, std::milli>(
                          std::chrono::steady_clock::now() - startTime)
                          .count();
  waitTimes_.push_back(waitTimeMs);
  if (waitTimes_.size() > MAX_WAIT_TIMES) {
    waitTimes_.pop_front();
  }

  return pooledConn->connection;
}

void DatabaseConnectionPool::releaseConnection(
    std::shared_ptr<pqxx::connection> conn) {
  if (!conn)
    return;

  std::shared_ptr<PooledConnection> pooledConn;
  {
    std::lock_guard<std::mutex> lock(poolMutex_);
    auto it = std::find_if(activeConnections_.begin(), activeConnections_.end(),
                           [&conn](const std::shared_ptr<PooledConnection> &pc) {
                             return pc && pc->connection == conn;
                           });
    if (it == activeConnections_.end()) {
      return;
    }
    pooledConn = *it;
    activeConnections_.erase(it);
  }

  bool healthy = !shutdown_.load() && validateConnection(conn);

  std::lock_guard<std::mutex> lock(poolMutex_);
  if (healthy) {
    pooledConn->lastUsedTime = std::chrono::steady_clock::now();
    idleConnections_.push_back(pooledConn);
  } else {
    metrics_.connectionsDestroyed++;
  }
  poolCondition_.notify_one();
}

void DatabaseConnectionPool::closeAll() {
  shutdown_.store(true);
  stopHealthMonitoring();

  std::lock_guard<std::mutex> lock(poolMutex_);
  metrics_.connectionsDestroyed +=
      idleConnections_.size() + activeConnections_.size();
  idleConnections_.clear();
  activeConnections_.clear();
  poolCondition_.notify_all();
}

void DatabaseConnectionPool::startHealthMonitoring() {
  if (monitoring_.exchange(true))
    return;

  healthCheckThread_ = std::thread([this]() {
    while (monitoring_.load()) {
      {
        std::unique_lock<std::mutex> lock(healthMutex_);
        healthCondition_.wait_for(lock, config_.healthCheckInterval,
                                  [this]() { return !monitoring_.load(); });
      }
      if (!monitoring_.load()) {
        break;
      }
      try {
        performHealthCheck();
        topUpIdleConnections();
      } catch (const std::exception &e) {
        DB_LOG_ERROR("Health check error: {}", e.what());
      }
    }
  });

  DB_LOG_INFO("Database connection pool health monitoring started");
}

void DatabaseConnectionPool::stopHealthMonitoring() {
  {
    std::lock_guard<std::mutex> lock(healthMutex_);
    monitoring_.store(false);
  }
  healthCondition_.notify_all();
  if (healthCheckThread_.joinable()) {
    healthCheckThread_.join();
  }
}

DatabaseConnectionPool::PoolMetrics DatabaseConnectionPool::getMetrics() const {
  std::lock_guard<std::mutex> lock(poolMutex_);
  PoolMetrics metrics = metrics_;
  metrics.activeConnections = activeConnections_.size();
  metrics.idleConnections = idleConnections_.size();
  if (!waitTimes_.empty()) {
    metrics.averageWaitTimeMs =
        std::accumulate(waitTimes_.begin(), waitTimes_.end(), 0.0) /
        static_cast<double>(waitTimes_.size());
  }
  return metrics;
}

std::shared_ptr<pqxx::connection> DatabaseConnectionPool::createConnection() {
  const std::string connStr = buildConnectionString();

  for (int attempt = 0; attempt < config_.maxRetries; ++attempt) {
    try {
      auto conn = std::make_shared<pqxx::connection>(connStr);
      if (conn->is_open()) {
        DB_LOG_DEBUG("Database connection created successfully");
        return conn;
      }
    } catch (const pqxx::failure &e) {
      DB_LOG_WARN("Connection attempt {} failed: {}", attempt + 1, e.what());
    }
    if (attempt < config_.maxRetries - 1) {
      std::this_thread::sleep_for(config_.retryDelay);
    }
  }

  throw SystemException(ErrorCode::DATABASE_ERROR,
                        "Failed to create database connection after " +
                            std::to_string(config_.maxRetries) + " attempts",
                        "DatabaseConnectionPool");
}

bool DatabaseConnectionPool::validateConnection(
    const std::shared_ptr<pqxx::connection> &conn) {
  if (!conn || !conn->is_open())
    return false;

  try {
    pqxx::nontransaction txn(*conn);
    pqxx::result result = txn.exec("SELECT 1");
    return result.size() == 1;
  } catch (const pqxx::failure &e) {
    DB_LOG_WARN("Connection validation failed: {}", e.what());
    return false;
  }
}

void DatabaseConnectionPool::performHealthCheck() {
  std::deque<std::shared_ptr<PooledConnection>> idleSnapshot;
  {
    std::lock_guard<std::mutex> lock(poolMutex_);
    idleSnapshot.swap(idleConnections_);
  }

  size_t unhealthyCount = 0;
  std::deque<std::shared_ptr<PooledConnection>> healthyIdle;
  const auto maxAge = std::chrono::hours(1);
  const auto now = std::chrono::steady_clock::now();
  for (auto &pooledConn : idleSnapshot) {
    if (now - pooledConn->createdTime < maxAge &&
        validateConnection(pooledConn->connection)) {
      healthyIdle.push_back(pooledConn);
    } else {
      unhealthyCount++;
    }
  }

  std::lock_guard<std::mutex> lock(poolMutex_);
  for (auto &conn : healthyIdle) {
    idleConnections_.push_back(conn);
  }
  metrics_.connectionsDestroyed += unhealthyCount;
  metrics_.healthCheckFailures += unhealthyCount;
  if (!healthyIdle.empty()) {
    poolCondition_.notify_all();
  }

  if (unhealthyCount > 0) {
    DB_LOG_WARN("Health check dropped {} idle connections", unhealthyCount);
  }
}

void DatabaseConnectionPool::topUpIdleConnections() {
  size_t connectionsToCreate = 0;
  {
    std::lock_guard<std::mutex> lock(poolMutex_);
    size_t total = idleConnections_.size() + activeConnections_.size();
    if (total < config_.minConnections) {
      connectionsToCreate = config_.minConnections - total;
    }
  }

  for (size_t i = 0; i < connectionsToCreate; ++i) {
    try {
      auto pooled = std::make_shared<PooledConnection>(createConnection());
      std::lock_guard<std::mutex> lock(poolMutex_);
      idleConnections_.push_back(pooled);
      metrics_.connectionsCreated++;
      poolCondition_.notify_one();
    } catch (const JobsException &e) {
      DB_LOG_ERROR("Failed to create connection during pool top-up: {}",
                   e.what());
      break;
    }
  }
}

std::string DatabaseConnectionPool::buildConnectionString() const {
  return "host=" + config_.host + " port=" + std::to_string(config_.port) +
         " dbname=" + config_.database + " user=" + config_.username +
         " password=" + config_.getPassword() + " connect_timeout=" +
         std::to_string(config_.connectionTimeout.count());
}

} // namespace mdjobs
