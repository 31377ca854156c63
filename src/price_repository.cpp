#include "price_repository.hpp"
#include "database_manager.hpp"
#include "job_exceptions.hpp"
#include "logger.hpp"
#include "symbol_filter.hpp"
#include <map>
#include <sstream>

namespace mdjobs {

namespace {

std::string numberText(double value) {
  std::ostringstream oss;
  oss.precision(17);
  oss << value;
  return oss.str();
}

} // namespace

PriceRepository::PriceRepository(std::shared_ptr<DatabaseManager> dbManager)
    : dbManager_(std::move(dbManager)) {}

UpsertCounts PriceRepository::upsertBars(const std::string &symbol,
                                         const std::vector<Bar> &bars,
                                         const std::string &source) {
  UpsertCounts counts;
  if (bars.empty()) {
    return counts;
  }

  if (!dbManager_ || !dbManager_->isConnected()) {
    DB_LOG_ERROR("Database not connected");
    throw SystemException(ErrorCode::DATABASE_ERROR, "Database not connected",
                          "PriceRepository", {{"symbol", symbol}});
  }

  // One row per date; the last bar for a date wins
  std::map<std::string, Bar> byDate;
  for (const auto &bar : bars) {
    byDate[bar.date] = bar;
  }

  std::string values;
  SqlParams params;
  params.reserve(byDate.size() * 8);
  for (const auto &[date, bar] : byDate) {
    const size_t base = params.size();
    if (!values.empty()) {
      values += ", ";
    }
    values += "(";
    for (size_t i = 1; i <= 8; ++i) {
      values += "$" + std::to_string(base + i) + (i < 8 ? ", " : "");
    }
    values += ")";

    params.emplace_back(symbol);
    params.emplace_back(date);
    params.emplace_back(numberText(bar.open));
    params.emplace_back(numberText(bar.high));
    params.emplace_back(numberText(bar.low));
    params.emplace_back(numberText(bar.close));
    params.emplace_back(std::to_string(bar.volume));
    params.emplace_back(source);
  }

  const std::string query =
      "WITH upserted AS (INSERT INTO prices_daily (symbol, date, open, high, "
      "low, close, volume, source) VALUES " +
      values +
      " ON CONFLICT (symbol, date) DO UPDATE SET open = EXCLUDED.open, "
      "high = EXCLUDED.high, low = EXCLUDED.low, close = EXCLUDED.close, "
      "volume = EXCLUDED.volume, source = EXCLUDED.source "
      "WHERE (prices_daily.open, prices_daily.high, prices_daily.low, "
      "prices_daily.close, prices_daily.volume, prices_daily.source) "
      "IS DISTINCT FROM (EXCLUDED.open, EXCLUDED.high, EXCLUDED.low, "
      "EXCLUDED.close, EXCLUDED.volume, EXCLUDED.source) "
      "RETURNING (xmax = 0) AS inserted) "
      "SELECT COUNT(*) FILTER (WHERE inserted) AS inserted, "
      "COUNT(*) FILTER (WHERE NOT inserted) AS updated FROM upserted";

  auto result = dbManager_->selectQuery(query, params);
  if (result.size() <= 1 || result[1].size() < 2) {
    throw SystemException(ErrorCode::DATABASE_ERROR,
                          "Failed to upsert daily bars for " + symbol,
                          "PriceRepository", {{"symbol", symbol}});
  }

  counts.inserted = std::stoi(result[1][0]);
  counts.updated = std::stoi(result[1][1]);
  counts.skipped = static_cast<int>(bars.size()) - counts.inserted -
                   counts.updated;
  return counts;
}

SymbolRepository::SymbolRepository(std::shared_ptr<DatabaseManager> dbManager)
    : dbManager_(std::move(dbManager)) {}

std::vector<std::string> SymbolRepository::resolveSymbolUniverse() {
  if (!dbManager_ || !dbManager_->isConnected()) {
    DB_LOG_ERROR("Database not connected");
    return {};
  }

  std::vector<SymbolRecord> rows;
  try {
    auto result = dbManager_->selectQuery(
        "SELECT symbol, COALESCE(test_issue, 'N') FROM symbols ORDER BY symbol");
    rows.reserve(result.size());
    for (size_t i = 1; i < result.size(); ++i) {
      rows.push_back(SymbolRecord{result[i][0], result[i][1]});
    }
  } catch (const std::exception &e) {
    DB_LOG_ERROR("Failed to load symbol universe: {}", e.what());
    return {};
  }
  return filterSymbols(rows);
}

} // namespace mdjobs
