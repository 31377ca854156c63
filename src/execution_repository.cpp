#include "execution_repository.hpp"
#include "database_manager.hpp"
#include "job_exceptions.hpp"
#include "logger.hpp"
#include <algorithm>

namespace mdjobs {

namespace {

const char *kSelectColumns =
    "SELECT id, job_name, status, started_at, completed_at, duration_seconds, "
    "records_processed, error_message, next_run_at FROM job_execution_status";

std::optional<std::string> timestampParam(const std::optional<TimePoint> &tp) {
  if (!tp) {
    return std::nullopt;
  }
  return timePointToString(*tp);
}

} // namespace

ExecutionRepository::ExecutionRepository(
    std::shared_ptr<DatabaseManager> dbManager)
    : dbManager_(std::move(dbManager)) {}

bool ExecutionRepository::connected() const {
  if (!dbManager_ || !dbManager_->isConnected()) {
    DB_LOG_ERROR("Database not connected");
    return false;
  }
  return true;
}

int64_t ExecutionRepository::insertRun(const ExecutionRun &run) {
  if (!connected()) {
    throw SystemException(ErrorCode::DATABASE_ERROR, "Database not connected",
                          "ExecutionRepository", {{"job_name", run.jobName}});
  }

  auto result = dbManager_->selectQuery(
      "INSERT INTO job_execution_status (job_name, status, started_at, "
      "completed_at, duration_seconds, records_processed, error_message, "
      "next_run_at) VALUES ($1, $2, $3, $4, $5, $6, $7, $8) RETURNING id",
      {run.jobName, runStatusToString(run.status),
       timePointToString(run.startedAt), timestampParam(run.completedAt),
       toSqlParam(run.durationSeconds), toSqlParam(run.recordsProcessed),
       toSqlParam(run.errorMessage), timestampParam(run.nextRunAt)});

  if (result.size() <= 1 || result[1].empty()) {
    throw SystemException(ErrorCode::DATABASE_ERROR,
                          "Failed to insert execution row for " + run.jobName,
                          "ExecutionRepository", {{"job_name", run.jobName}});
  }
  return std::stoll(result[1][0]);
}

bool ExecutionRepository::finishRun(int64_t runId, const RunOutcome &outcome) {
  if (!connected()) {
    throw SystemException(ErrorCode::DATABASE_ERROR, "Database not connected",
                          "ExecutionRepository",
                          {{"run_id", std::to_string(runId)}});
  }

  const std::string completedAt = timePointToString(outcome.completedAt);
  int affected = dbManager_->executeUpdate(
      "UPDATE job_execution_status SET status = $2, completed_at = $3, "
      "duration_seconds = GREATEST(0, EXTRACT(EPOCH FROM ($3::timestamp - "
      "started_at))), records_processed = COALESCE($4, records_processed), "
      "error_message = COALESCE($5, error_message) "
      "WHERE id = $1 AND status = 'running'",
      {std::to_string(runId), runStatusToString(outcome.status), completedAt,
       toSqlParam(outcome.recordsProcessed), toSqlParam(outcome.errorMessage)});

  if (affected < 0) {
    throw SystemException(ErrorCode::DATABASE_ERROR,
                          "Failed to finish execution row",
                          "ExecutionRepository",
                          {{"run_id", std::to_string(runId)}});
  }
  return affected == 1;
}

std::optional<ExecutionRun> ExecutionRepository::getRun(int64_t runId) {
  if (!connected()) {
    return std::nullopt;
  }

  try {
    auto result = dbManager_->selectQuery(
        std::string(kSelectColumns) + " WHERE id = $1", {std::to_string(runId)});
    if (result.size() <= 1) {
      return std::nullopt;
    }
    return runFromRow(result[1]);
  } catch (const std::exception &e) {
    DB_LOG_ERROR("Failed to get execution row {}: {}", runId, e.what());
    return std::nullopt;
  }
}

std::vector<ExecutionRun>
ExecutionRepository::history(const std::string &jobName, int limit) {
  std::vector<ExecutionRun> runs;
  if (!connected()) {
    return runs;
  }

  try {
    auto result = dbManager_->selectQuery(
        std::string(kSelectColumns) +
            " WHERE job_name = $1 ORDER BY started_at DESC, id DESC LIMIT $2",
        {jobName, std::to_string(limit)});
    for (size_t i = 1; i < result.size(); ++i) {
      runs.push_back(runFromRow(result[i]));
    }
  } catch (const std::exception &e) {
    DB_LOG_ERROR("Failed to load execution history for {}: {}", jobName,
                 e.what());
  }
  return runs;
}

std::vector<std::string> ExecutionRepository::jobNames() {
  std::vector<std::string> names;
  if (!connected()) {
    return names;
  }

  auto result = dbManager_->selectQuery(
      "SELECT DISTINCT job_name FROM job_execution_status ORDER BY job_name");
  for (size_t i = 1; i < result.size(); ++i) {
    names.push_back(result[i][0]);
  }
  return names;
}

int ExecutionRepository::pruneHistory(const std::string &jobName, int keep) {
  if (!connected()) {
    return 0;
  }

  int deleted = dbManager_->executeUpdate(
      "DELETE FROM job_execution_status WHERE job_name = $1 AND id NOT IN ("
      "SELECT id FROM job_execution_status WHERE job_name = $1 "
      "ORDER BY started_at DESC, id DESC LIMIT $2)",
      {jobName, std::to_string(std::max(keep, 0))});

  if (deleted < 0) {
    DB_LOG_WARN("Failed to prune execution history for {}", jobName);
    return 0;
  }
  return deleted;
}

int ExecutionRepository::failRunningRuns(const std::string &message,
                                         TimePoint now) {
  if (!connected()) {
    throw SystemException(ErrorCode::DATABASE_ERROR, "Database not connected",
                          "ExecutionRepository");
  }

  int changed = dbManager_->executeUpdate(
      "UPDATE job_execution_status SET status = 'failed', completed_at = $1, "
      "duration_seconds = GREATEST(0, EXTRACT(EPOCH FROM ($1::timestamp - "
      "started_at))), error_message = $2 WHERE status = 'running'",
      {timePointToString(now), message});

  if (changed < 0) {
    throw SystemException(ErrorCode::DATABASE_ERROR,
                          "Failed to clean up running execution rows",
                          "ExecutionRepository");
  }
  return changed;
}

ExecutionRun
ExecutionRepository::runFromRow(const std::vector<std::string> &row) const {
  ExecutionRun run;
  run.id = std::stoll(row[0]);
  run.jobName = row[1];
  run.status = stringToRunStatus(row[2]);
  run.startedAt = stringToTimePoint(row[3]);
  if (!row[4].empty()) {
    run.completedAt = stringToTimePoint(row[4]);
  }
  run.durationSeconds = optionalDoubleColumn(row[5]);
  run.recordsProcessed = optionalInt64Column(row[6]);
  run.errorMessage = optionalTextColumn(row[7]);
  if (!row[8].empty()) {
    run.nextRunAt = stringToTimePoint(row[8]);
  }
  return run;
}

} // namespace mdjobs
