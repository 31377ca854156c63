#pragma once

#include "execution_store.hpp"
#include <memory>

namespace mdjobs {

class DatabaseManager;

// job_execution_status table
class ExecutionRepository : public ExecutionStore {
public:
  explicit ExecutionRepository(std::shared_ptr<DatabaseManager> dbManager);

  int64_t insertRun(const ExecutionRun &run) override;
  bool finishRun(int64_t runId, const RunOutcome &outcome) override;
  std::optional<ExecutionRun> getRun(int64_t runId) override;
  std::vector<ExecutionRun> history(const std::string &jobName,
                                    int limit) override;
  std::vector<std::string> jobNames() override;
  int pruneHistory(const std::string &jobName, int keep) override;
  int failRunningRuns(const std::string &message, TimePoint now) override;

private:
  std::shared_ptr<DatabaseManager> dbManager_;

  bool connected() const;
  ExecutionRun runFromRow(const std::vector<std::string> &row) const;
};

} // namespace mdjobs
