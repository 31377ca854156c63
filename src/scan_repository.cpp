#include "scan_repository.hpp"
#include "job_exceptions.hpp"
#include "logger.hpp"
#include <algorithm>

namespace mdjobs {

namespace {

const char *kRunColumns =
    "SELECT id, status, scan_date, symbols_requested, symbols_fetched, "
    "error_count, started_at, completed_at FROM scan_runs";

const char *kErrorColumns =
    "SELECT id, scan_run_id, symbol, error_type, error_message, http_status, "
    "occurred_at FROM scan_errors";

} // namespace

ScanRepository::ScanRepository(std::shared_ptr<DatabaseManager> dbManager)
    : dbManager_(std::move(dbManager)) {}

bool ScanRepository::connected() const {
  if (!dbManager_ || !dbManager_->isConnected()) {
    DB_LOG_ERROR("Database not connected");
    return false;
  }
  return true;
}

int64_t ScanRepository::createRun(const std::string &scanDate,
                                  TimePoint startedAt) {
  if (!connected()) {
    throw SystemException(ErrorCode::DATABASE_ERROR, "Database not connected",
                          "ScanRepository", {{"scan_date", scanDate}});
  }

  auto result = dbManager_->selectQuery(
      "INSERT INTO scan_runs (status, scan_date, started_at) "
      "VALUES ('running', $1, $2) RETURNING id",
      {scanDate, timePointToString(startedAt)});

  if (result.size() <= 1 || result[1].empty()) {
    throw SystemException(ErrorCode::DATABASE_ERROR,
                          "Failed to create scan run for " + scanDate,
                          "ScanRepository", {{"scan_date", scanDate}});
  }
  return std::stoll(result[1][0]);
}

void ScanRepository::updateCounter(const std::string &query,
                                   const SqlParams &params, int64_t scanId) {
  if (!connected()) {
    return;
  }
  if (dbManager_->executeUpdate(query, params) < 0) {
    DB_LOG_WARN("Counter update failed for scan {}", scanId);
  }
}

void ScanRepository::setRequested(int64_t scanId, int count) {
  updateCounter("UPDATE scan_runs SET symbols_requested = $2 WHERE id = $1",
                {std::to_string(scanId), std::to_string(count)}, scanId);
}

void ScanRepository::incrementFetched(int64_t scanId) {
  updateCounter("UPDATE scan_runs SET symbols_fetched = symbols_fetched + 1 "
                "WHERE id = $1",
                {std::to_string(scanId)}, scanId);
}

void ScanRepository::addError(const ScanError &error) {
  if (!connected()) {
    return;
  }

  std::optional<std::string> status;
  if (error.httpStatus) {
    status = std::to_string(*error.httpStatus);
  }

  bool stored = dbManager_->executeQuery(
      "INSERT INTO scan_errors (scan_run_id, symbol, error_type, "
      "error_message, http_status, occurred_at) "
      "VALUES ($1, $2, $3, $4, $5, $6)",
      {std::to_string(error.scanRunId), error.symbol,
       scanErrorTypeToString(error.errorType), error.message, status,
       timePointToString(error.occurredAt)});
  if (!stored) {
    DB_LOG_WARN("Failed to record {} error for {} in scan {}",
                scanErrorTypeToString(error.errorType), error.symbol,
                error.scanRunId);
    return;
  }

  updateCounter("UPDATE scan_runs SET error_count = error_count + 1 "
                "WHERE id = $1",
                {std::to_string(error.scanRunId)}, error.scanRunId);
}

void ScanRepository::finishRun(int64_t scanId, ScanStatus status,
                               TimePoint completedAt) {
  if (!connected()) {
    throw SystemException(ErrorCode::DATABASE_ERROR, "Database not connected",
                          "ScanRepository",
                          {{"scan_id", std::to_string(scanId)}});
  }

  int affected = dbManager_->executeUpdate(
      "UPDATE scan_runs SET status = $2, completed_at = $3 WHERE id = $1",
      {std::to_string(scanId), scanStatusToString(status),
       timePointToString(completedAt)});
  if (affected < 0) {
    throw SystemException(ErrorCode::DATABASE_ERROR,
                          "Failed to finalize scan run", "ScanRepository",
                          {{"scan_id", std::to_string(scanId)}});
  }
  if (affected == 0) {
    throw BusinessException(ErrorCode::SCAN_NOT_FOUND,
                            "Scan " + std::to_string(scanId) + " not found",
                            "finishRun");
  }
}

std::optional<ScanRun> ScanRepository::getRun(int64_t scanId) {
  if (!connected()) {
    return std::nullopt;
  }

  try {
    auto result = dbManager_->selectQuery(
        std::string(kRunColumns) + " WHERE id = $1", {std::to_string(scanId)});
    if (result.size() <= 1) {
      return std::nullopt;
    }
    return runFromRow(result[1]);
  } catch (const std::exception &e) {
    DB_LOG_ERROR("Failed to load scan {}: {}", scanId, e.what());
    return std::nullopt;
  }
}

std::vector<ScanRun> ScanRepository::listRuns(int limit) {
  std::vector<ScanRun> runs;
  if (!connected()) {
    return runs;
  }

  try {
    auto result = dbManager_->selectQuery(
        std::string(kRunColumns) + " ORDER BY started_at DESC, id DESC LIMIT $1",
        {std::to_string(limit)});
    for (size_t i = 1; i < result.size(); ++i) {
      runs.push_back(runFromRow(result[i]));
    }
  } catch (const std::exception &e) {
    DB_LOG_ERROR("Failed to list scans: {}", e.what());
  }
  return runs;
}

std::vector<ScanError> ScanRepository::getErrors(int64_t scanId, int limit) {
  std::vector<ScanError> errors;
  if (!connected()) {
    return errors;
  }

  try {
    auto result = dbManager_->selectQuery(
        std::string(kErrorColumns) +
            " WHERE scan_run_id = $1 ORDER BY occurred_at DESC, id DESC LIMIT $2",
        {std::to_string(scanId), std::to_string(limit)});
    for (size_t i = 1; i < result.size(); ++i) {
      errors.push_back(errorFromRow(result[i]));
    }
  } catch (const std::exception &e) {
    DB_LOG_ERROR("Failed to load errors for scan {}: {}", scanId, e.what());
  }
  return errors;
}

std::vector<std::string> ScanRepository::retryableSymbols(int64_t scanId) {
  std::vector<std::string> symbols;
  if (!connected()) {
    return symbols;
  }

  auto result = dbManager_->selectQuery(
      "SELECT DISTINCT symbol FROM scan_errors WHERE scan_run_id = $1 "
      "AND error_type = 'provider_error' AND symbol <> 'unknown' "
      "AND (http_status IS NULL OR http_status IN (401, 429) "
      "OR http_status >= 500) ORDER BY symbol",
      {std::to_string(scanId)});
  for (size_t i = 1; i < result.size(); ++i) {
    symbols.push_back(result[i][0]);
  }
  return symbols;
}

int ScanRepository::deleteProviderErrors(int64_t scanId,
                                         const std::string &symbol) {
  if (!connected()) {
    return 0;
  }

  int deleted = dbManager_->executeUpdate(
      "DELETE FROM scan_errors WHERE scan_run_id = $1 AND symbol = $2 "
      "AND error_type = 'provider_error'",
      {std::to_string(scanId), symbol});
  if (deleted < 0) {
    DB_LOG_WARN("Failed to clear retried errors for {} in scan {}", symbol,
                scanId);
    return 0;
  }
  return deleted;
}

void ScanRepository::decrementErrors(int64_t scanId, int count) {
  updateCounter("UPDATE scan_runs SET error_count = GREATEST(0, error_count - "
                "$2) WHERE id = $1",
                {std::to_string(scanId), std::to_string(count)}, scanId);
}

int ScanRepository::pruneRuns(int keep) {
  if (!connected()) {
    return 0;
  }

  int deleted = dbManager_->executeUpdate(
      "DELETE FROM scan_runs WHERE id NOT IN (SELECT id FROM scan_runs "
      "ORDER BY started_at DESC, id DESC LIMIT $1)",
      {std::to_string(std::max(keep, 0))});
  if (deleted < 0) {
    DB_LOG_WARN("Failed to prune scan runs");
    return 0;
  }
  return deleted;
}

int ScanRepository::failRunningScans(TimePoint now) {
  if (!connected()) {
    throw SystemException(ErrorCode::DATABASE_ERROR, "Database not connected",
                          "ScanRepository");
  }

  int changed = dbManager_->executeUpdate(
      "UPDATE scan_runs SET status = 'failed', completed_at = $1 "
      "WHERE status = 'running' AND completed_at IS NULL",
      {timePointToString(now)});
  if (changed < 0) {
    throw SystemException(ErrorCode::DATABASE_ERROR,
                          "Failed to clean up running scans", "ScanRepository");
  }
  return changed;
}

ScanRun ScanRepository::runFromRow(const std::vector<std::string> &row) const {
  ScanRun run;
  run.id = std::stoll(row[0]);
  run.status = stringToScanStatus(row[1]);
  run.scanDate = row[2];
  run.symbolsRequested = optionalIntColumn(row[3]).value_or(0);
  run.symbolsFetched = optionalIntColumn(row[4]).value_or(0);
  run.errorCount = optionalIntColumn(row[5]).value_or(0);
  run.startedAt = stringToTimePoint(row[6]);
  if (!row[7].empty()) {
    run.completedAt = stringToTimePoint(row[7]);
  }
  return run;
}

ScanError
ScanRepository::errorFromRow(const std::vector<std::string> &row) const {
  ScanError error;
  error.id = std::stoll(row[0]);
  error.scanRunId = std::stoll(row[1]);
  error.symbol = row[2];
  error.errorType = stringToScanErrorType(row[3]);
  error.message = row[4];
  error.httpStatus = optionalIntColumn(row[5]);
  error.occurredAt = stringToTimePoint(row[6]);
  return error;
}

} // namespace mdjobs
