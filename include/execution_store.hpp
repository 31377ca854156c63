#pragma once

#include "job_models.hpp"
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mdjobs {

// Terminal values written once per run
struct RunOutcome {
  RunStatus status = RunStatus::COMPLETED;
  TimePoint completedAt{};
  std::optional<int64_t> recordsProcessed;
  std::optional<std::string> errorMessage;
};

// Persistence for job_execution_status rows
class ExecutionStore {
public:
  virtual ~ExecutionStore() = default;

  // Returns the new row id; throws SystemException when the row is not stored
  virtual int64_t insertRun(const ExecutionRun &run) = 0;

  // Applies the outcome only while the row is still running. Duration is
  // measured from the stored start time.
  virtual bool finishRun(int64_t runId, const RunOutcome &outcome) = 0;

  virtual std::optional<ExecutionRun> getRun(int64_t runId) = 0;
  // Newest first
  virtual std::vector<ExecutionRun> history(const std::string &jobName,
                                            int limit) = 0;
  virtual std::vector<std::string> jobNames() = 0;

  // Deletes all but the `keep` most recently started rows; returns the
  // number deleted
  virtual int pruneHistory(const std::string &jobName, int keep) = 0;

  // Fails every running row; returns the number changed
  virtual int failRunningRuns(const std::string &message, TimePoint now) = 0;
};

class InMemoryExecutionStore : public ExecutionStore {
public:
  int64_t insertRun(const ExecutionRun &run) override;
  bool finishRun(int64_t runId, const RunOutcome &outcome) override;
  std::optional<ExecutionRun> getRun(int64_t runId) override;
  std::vector<ExecutionRun> history(const std::string &jobName,
                                    int limit) override;
  std::vector<std::string> jobNames() override;
  int pruneHistory(const std::string &jobName, int keep) override;
  int failRunningRuns(const std::string &message, TimePoint now) override;

private:
  std::mutex mutex_;
  int64_t nextId_ = 1;
  std::map<int64_t, ExecutionRun> runs_;

  void applyOutcome(ExecutionRun &run, const RunOutcome &outcome);
};

} // namespace mdjobs
