#pragma once

#include "execution_store.hpp"
#include <memory>

namespace mdjobs {

/**
 * Run-record state machine: running -> completed | failed.
 *
 * begin() must succeed before a job body does any work. complete() and
 * fail() are one-shot per run id and throw BusinessException
 * (INVALID_JOB_STATE) when the row is no longer running.
 */
class ExecutionTracker {
public:
  static constexpr int kDefaultKeep = 5;
  static constexpr const char *kStuckRunMessage =
      "Marked failed by stuck-run cleanup";

  explicit ExecutionTracker(std::shared_ptr<ExecutionStore> store,
                            int keepHistory = kDefaultKeep);

  int64_t begin(const std::string &jobName,
                std::optional<TimePoint> nextRunAt = std::nullopt);
  void complete(int64_t runId, int64_t recordsProcessed);
  void fail(int64_t runId, const std::string &message);

  // Terminal row for a fire that did not start because an instance was live
  int64_t recordSkipped(const std::string &jobName, const std::string &reason);

  int pruneHistory(const std::string &jobName);
  int pruneHistory(const std::string &jobName, int keep);
  // Prunes every job name that has history
  int pruneAll();

  std::vector<ExecutionRun> history(const std::string &jobName, int limit);
  std::optional<ExecutionRun> latest(const std::string &jobName);
  std::optional<ExecutionRun> getRun(int64_t runId);

  int cleanupStuckRuns();

  int keepHistory() const { return keepHistory_; }

private:
  std::shared_ptr<ExecutionStore> store_;
  int keepHistory_;

  void finish(int64_t runId, const RunOutcome &outcome, const char *operation);
};

} // namespace mdjobs
