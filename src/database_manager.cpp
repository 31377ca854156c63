#include "database_manager.hpp"
#include "database_schema.hpp"
#include "job_exceptions.hpp"
#include "logger.hpp"
#include <pqxx/pqxx>

namespace mdjobs {

namespace {

// Returns the connection to the pool on scope exit
class ConnectionLease {
public:
    explicit ConnectionLease(DatabaseConnectionPool& pool)
        : pool_(pool), conn_(pool.acquireConnection()) {}
    ~ConnectionLease() { pool_.releaseConnection(conn_); }

    ConnectionLease(const ConnectionLease&) = delete;
    ConnectionLease& operator=(const ConnectionLease&) = delete;

    pqxx::connection& get() { return *conn_; }

private:
    DatabaseConnectionPool& pool_;
    std::shared_ptr<pqxx::connection> conn_;
};

std::string preview(const std::string& query) {
    return query.substr(0, 100) + (query.length() > 100 ? "..." : "");
}

pqxx::result run(pqxx::work& txn, const std::string& query, const SqlParams& params) {
    if (params.empty()) {
        return txn.exec(query);
    }
    return txn.exec_params(query, pqxx::prepare::make_dynamic_params(params.begin(), params.end()));
}

} // namespace

SqlParam toSqlParam(const std::optional<int>& value) {
    return value ? SqlParam(std::to_string(*value)) : std::nullopt;
}

SqlParam toSqlParam(const std::optional<int64_t>& value) {
    return value ? SqlParam(std::to_string(*value)) : std::nullopt;
}

SqlParam toSqlParam(const std::optional<double>& value) {
    return value ? SqlParam(std::to_string(*value)) : std::nullopt;
}

SqlParam toSqlParam(const std::optional<std::string>& value) {
    return value ? SqlParam(*value) : std::nullopt;
}

SqlParam toSqlParam(bool value) {
    return SqlParam(value ? "true" : "false");
}

std::optional<int> optionalIntColumn(const std::string& field) {
    if (field.empty()) return std::nullopt;
    return std::stoi(field);
}

std::optional<int64_t> optionalInt64Column(const std::string& field) {
    if (field.empty()) return std::nullopt;
    return static_cast<int64_t>(std::stoll(field));
}

std::optional<double> optionalDoubleColumn(const std::string& field) {
    if (field.empty()) return std::nullopt;
    return std::stod(field);
}

std::optional<std::string> optionalTextColumn(const std::string& field) {
    if (field.empty()) return std::nullopt;
    return field;
}

bool boolColumn(const std::string& field) {
    return field == "t" || field == "true" || field == "1";
}

struct DatabaseManager::Impl {
    bool connected = false;
    DatabaseConnectionConfig poolConfig;
    std::unique_ptr<DatabaseConnectionPool> connectionPool;
};

DatabaseManager::DatabaseManager() : pImpl(std::make_unique<Impl>()) {}

DatabaseManager::~DatabaseManager() {
    disconnect();
}

bool DatabaseManager::connect(const DatabaseSettings& settings) {
    pImpl->poolConfig.host = settings.host;
    pImpl->poolConfig.port = settings.port;
    pImpl->poolConfig.database = settings.name;
    pImpl->poolConfig.username = settings.user;
    pImpl->poolConfig.setPassword(settings.password);
    pImpl->poolConfig.minConnections = static_cast<size_t>(settings.minConnections);
    pImpl->poolConfig.maxConnections = static_cast<size_t>(settings.maxConnections);
    pImpl->poolConfig.connectionTimeout = std::chrono::seconds(settings.connectionTimeoutSeconds);

    DB_LOG_INFO("Attempting to connect to PostgreSQL database: {}:{}/{}",
                settings.host, settings.port, settings.name);
    DB_LOG_DEBUG("Using username: {}", settings.user);

    try {
        pImpl->connectionPool = std::make_unique<DatabaseConnectionPool>(pImpl->poolConfig);

        {
            ConnectionLease lease(*pImpl->connectionPool);
            if (!lease.get().is_open()) {
                DB_LOG_ERROR("Failed to establish database connection pool");
                pImpl->connectionPool.reset();
                return false;
            }
        }

        pImpl->connected = true;
        DB_LOG_INFO("PostgreSQL database connection pool established successfully");
        return true;
    } catch (const JobsException& e) {
        DB_LOG_ERROR("PostgreSQL connection pool failed: {}", e.toLogString());
        pImpl->connectionPool.reset();
        return false;
    }
}

bool DatabaseManager::initializeSchema() {
    if (!isConnected()) {
        DB_LOG_ERROR("Cannot initialize schema: database not connected");
        return false;
    }

    DB_LOG_INFO("Initializing PostgreSQL database schema");

    for (const auto& stmt : DatabaseSchema::getCreateTableStatements()) {
        if (!executeQuery(stmt)) {
            DB_LOG_ERROR("Failed to create table: {}", preview(stmt));
            return false;
        }
    }

    for (const auto& stmt : DatabaseSchema::getIndexStatements()) {
        if (!executeQuery(stmt)) {
            DB_LOG_ERROR("Failed to create index: {}", preview(stmt));
            return false;
        }
    }

    DB_LOG_INFO("Database schema initialized successfully");
    return true;
}

void DatabaseManager::disconnect() {
    if (pImpl->connected && pImpl->connectionPool) {
        DB_LOG_INFO("Disconnecting PostgreSQL database connection pool");
        pImpl->connectionPool->closeAll();
        pImpl->connectionPool.reset();
        pImpl->connected = false;
    }
}

bool DatabaseManager::isConnected() const {
    return pImpl->connected && pImpl->connectionPool != nullptr;
}

bool DatabaseManager::executeQuery(const std::string& query, const SqlParams& params) {
    return executeUpdate(query, params) >= 0;
}

int DatabaseManager::executeUpdate(const std::string& query, const SqlParams& params) {
    if (!isConnected()) {
        DB_LOG_ERROR("Cannot execute query: database not connected");
        return -1;
    }

    DB_LOG_DEBUG("Executing query: {}", preview(query));

    try {
        ConnectionLease lease(*pImpl->connectionPool);
        pqxx::work txn(lease.get());
        pqxx::result result = run(txn, query, params);
        txn.commit();
        return static_cast<int>(result.affected_rows());
    } catch (const pqxx::failure& e) {
        DB_LOG_ERROR("Query execution failed: {}", e.what());
        return -1;
    } catch (const JobsException& e) {
        DB_LOG_ERROR("Query execution failed: {}", e.toLogString());
        return -1;
    }
}

QueryResult DatabaseManager::selectQuery(const std::string& query, const SqlParams& params) {
    if (!isConnected()) {
        DB_LOG_ERROR("Cannot execute select query: database not connected");
        return {};
    }

    DB_LOG_DEBUG("Executing select query: {}", preview(query));

    try {
        ConnectionLease lease(*pImpl->connectionPool);
        pqxx::work txn(lease.get());
        pqxx::result result = run(txn, query, params);
        txn.commit();

        QueryResult rows;
        if (!result.empty()) {
            std::vector<std::string> headers;
            for (pqxx::row::size_type col = 0; col < result.columns(); ++col) {
                headers.emplace_back(result.column_name(col));
            }
            rows.push_back(std::move(headers));
        }

        for (const auto& row : result) {
            std::vector<std::string> dataRow;
            dataRow.reserve(row.size());
            for (const auto& field : row) {
                dataRow.emplace_back(field.is_null() ? std::string() : field.c_str());
            }
            rows.push_back(std::move(dataRow));
        }

        return rows;
    } catch (const pqxx::failure& e) {
        DB_LOG_ERROR("Select query failed: {}", e.what());
        return {};
    } catch (const JobsException& e) {
        DB_LOG_ERROR("Select query failed: {}", e.toLogString());
        return {};
    }
}

DatabaseConnectionPool::PoolMetrics DatabaseManager::getPoolMetrics() const {
    if (pImpl->connectionPool) {
        return pImpl->connectionPool->getMetrics();
    }
    return DatabaseConnectionPool::PoolMetrics{};
}

} // namespace mdjobs
