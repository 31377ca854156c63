#pragma once

#include "config_manager.hpp"
#include "database_connection_pool.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mdjobs {

// Positional query parameters ($1, $2, ...). std::nullopt binds SQL NULL.
using SqlParam = std::optional<std::string>;
using SqlParams = std::vector<SqlParam>;

// Row 0 carries the column headers when the result is non-empty
using QueryResult = std::vector<std::vector<std::string>>;

// Binding and reading nullable columns. selectQuery reports NULL as "".
SqlParam toSqlParam(const std::optional<int>& value);
SqlParam toSqlParam(const std::optional<int64_t>& value);
SqlParam toSqlParam(const std::optional<double>& value);
SqlParam toSqlParam(const std::optional<std::string>& value);
SqlParam toSqlParam(bool value);

std::optional<int> optionalIntColumn(const std::string& field);
std::optional<int64_t> optionalInt64Column(const std::string& field);
std::optional<double> optionalDoubleColumn(const std::string& field);
std::optional<std::string> optionalTextColumn(const std::string& field);
bool boolColumn(const std::string& field);

class DatabaseManager {
public:
    DatabaseManager();
    ~DatabaseManager();

    bool connect(const DatabaseSettings& settings);
    void disconnect();
    bool isConnected() const;

    // Creates the tables and indexes
    bool initializeSchema();

    bool executeQuery(const std::string& query, const SqlParams& params = {});
    // Affected row count, -1 on failure
    int executeUpdate(const std::string& query, const SqlParams& params = {});
    QueryResult selectQuery(const std::string& query, const SqlParams& params = {});

    DatabaseConnectionPool::PoolMetrics getPoolMetrics() const;

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mdjobs
