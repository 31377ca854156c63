#include "execution_tracker.hpp"
#include "job_exceptions.hpp"
#include "logger.hpp"

namespace mdjobs {

ExecutionTracker::ExecutionTracker(std::shared_ptr<ExecutionStore> store,
                                   int keepHistory)
    : store_(std::move(store)), keepHistory_(keepHistory) {
  if (!store_) {
    throw SystemException(ErrorCode::CONFIGURATION_ERROR,
                          "Execution store is required", "ExecutionTracker");
  }
}

int64_t ExecutionTracker::begin(const std::string &jobName,
                                std::optional<TimePoint> nextRunAt) {
  ExecutionRun run;
  run.jobName = jobName;
  run.status = RunStatus::RUNNING;
  run.startedAt = Clock::now();
  run.nextRunAt = nextRunAt;

  int64_t runId = store_->insertRun(run);
  TRACKER_LOG_DEBUG("Started run {} for job {}", runId, jobName);
  return runId;
}

void ExecutionTracker::complete(int64_t runId, int64_t recordsProcessed) {
  RunOutcome outcome;
  outcome.status = RunStatus::COMPLETED;
  outcome.completedAt = Clock::now();
  outcome.recordsProcessed = recordsProcessed;
  finish(runId, outcome, "complete");
  TRACKER_LOG_INFO("Run {} completed with {} records", runId, recordsProcessed);
}

void ExecutionTracker::fail(int64_t runId, const std::string &message) {
  RunOutcome outcome;
  outcome.status = RunStatus::FAILED;
  outcome.completedAt = Clock::now();
  outcome.errorMessage = message;
  finish(runId, outcome, "fail");
  TRACKER_LOG_WARN("Run {} failed: {}", runId, message);
}

void ExecutionTracker::finish(int64_t runId, const RunOutcome &outcome,
                              const char *operation) {
  if (!store_->finishRun(runId, outcome)) {
    throw BusinessException(ErrorCode::INVALID_JOB_STATE,
                            "Run " + std::to_string(runId) +
                                " is not running",
                            operation, {{"run_id", std::to_string(runId)}});
  }
}

int64_t ExecutionTracker::recordSkipped(const std::string &jobName,
                                        const std::string &reason) {
  auto now = Clock::now();
  ExecutionRun run;
  run.jobName = jobName;
  run.status = RunStatus::SKIPPED;
  run.startedAt = now;
  run.completedAt = now;
  run.durationSeconds = 0.0;
  run.errorMessage = reason;

  int64_t runId = store_->insertRun(run);
  TRACKER_LOG_INFO("Recorded skipped run {} for job {}: {}", runId, jobName,
                   reason);
  return runId;
}

int ExecutionTracker::pruneHistory(const std::string &jobName) {
  return pruneHistory(jobName, keepHistory_);
}

int ExecutionTracker::pruneHistory(const std::string &jobName, int keep) {
  int deleted = store_->pruneHistory(jobName, keep);
  if (deleted > 0) {
    TRACKER_LOG_DEBUG("Pruned {} history rows for job {}", deleted, jobName);
  }
  return deleted;
}

int ExecutionTracker::pruneAll() {
  int deleted = 0;
  for (const auto &jobName : store_->jobNames()) {
    deleted += pruneHistory(jobName);
  }
  return deleted;
}

std::vector<ExecutionRun> ExecutionTracker::history(const std::string &jobName,
                                                    int limit) {
  return store_->history(jobName, limit);
}

std::optional<ExecutionRun> ExecutionTracker::latest(const std::string &jobName) {
  auto runs = store_->history(jobName, 1);
  if (runs.empty()) {
    return std::nullopt;
  }
  return runs.front();
}

std::optional<ExecutionRun> ExecutionTracker::getRun(int64_t runId) {
  return store_->getRun(runId);
}

int ExecutionTracker::cleanupStuckRuns() {
  int changed = store_->failRunningRuns(kStuckRunMessage, Clock::now());
  if (changed > 0) {
    TRACKER_LOG_WARN("Marked {} stuck runs as failed", changed);
  }
  return changed;
}

} // namespace mdjobs
