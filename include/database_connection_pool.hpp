#ifndef MDJOBS_DATABASE_CONNECTION_POOL_HPP
#define MDJOBS_DATABASE_CONNECTION_POOL_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include <thread>
#include <vector>

namespace mdjobs {

struct DatabaseConnectionConfig {
    std::string host = "localhost";
    int port = 5432;
    std::string database = "stockwatchlist";
    std::string username = "stockuser";
    std::vector<char> password;
    size_t maxConnections = 10;
    size_t minConnections = 2;
    std::chrono::seconds connectionTimeout = std::chrono::seconds(30);
    std::chrono::seconds healthCheckInterval = std::chrono::seconds(60);
    bool enableHealthChecks = true;
    int maxRetries = 3;
    std::chrono::milliseconds retryDelay = std::chrono::milliseconds(1000);

    void setPassword(const std::string& pwd) {
        password.assign(pwd.begin(), pwd.end());
    }

    std::string getPassword() const {
        return std::string(password.begin(), password.end());
    }

    void clearPassword() {
        std::fill(password.begin(), password.end(), 0);
        password.clear();
    }
};

class DatabaseConnectionPool {
public:
    explicit DatabaseConnectionPool(const DatabaseConnectionConfig& config);
    ~DatabaseConnectionPool();

    DatabaseConnectionPool(const DatabaseConnectionPool&) = delete;
    DatabaseConnectionPool& operator=(const DatabaseConnectionPool&) = delete;
    DatabaseConnectionPool(DatabaseConnectionPool&&) = delete;
    DatabaseConnectionPool& operator=(DatabaseConnectionPool&&) = delete;

    // Blocks up to connectionTimeout; throws SystemException(DATABASE_ERROR)
    std::shared_ptr<pqxx::connection> acquireConnection();
    void releaseConnection(std::shared_ptr<pqxx::connection> conn);
    void closeAll();

    void startHealthMonitoring();
    void stopHealthMonitoring();

    struct PoolMetrics {
        size_t activeConnections = 0;
        size_t idleConnections = 0;
        size_t connectionsCreated = 0;
        size_t connectionsDestroyed = 0;
        size_t connectionTimeouts = 0;
        size_t healthCheckFailures = 0;
        double averageWaitTimeMs = 0.0;
    };

    PoolMetrics getMetrics() const;

private:
    struct PooledConnection {
        std::shared_ptr<pqxx::connection> connection;
        std::chrono::steady_clock::time_point createdTime;
        std::chrono::steady_clock::time_point lastUsedTime;

        explicit PooledConnection(std::shared_ptr<pqxx::connection> conn)
            : connection(std::move(conn)),
              createdTime(std::chrono::steady_clock::now()),
              lastUsedTime(std::chrono::steady_clock::now()) {}
    };

    DatabaseConnectionConfig config_;
    std::deque<std::shared_ptr<PooledConnection>> idleConnections_;
    std::vector<std::shared_ptr<PooledConnection>> activeConnections_;
    mutable std::mutex poolMutex_;
    std::condition_variable poolCondition_;
    std::atomic<bool> shutdown_{false};

    std::atomic<bool> monitoring_{false};
    std::thread healthCheckThread_;
    std::mutex healthMutex_;
    std::condition_variable healthCondition_;

    PoolMetrics metrics_;
    static constexpr size_t MAX_WAIT_TIMES = 100;
    std::deque<double> waitTimes_;

    std::shared_ptr<pqxx::connection> createConnection();
    bool validateConnection(const std::shared_ptr<pqxx::connection>& conn);
    void performHealthCheck();
    void topUpIdleConnections();
    std::string buildConnectionString() const;
};

} // namespace mdjobs

#endif // MDJOBS_DATABASE_CONNECTION_POOL_HPP
