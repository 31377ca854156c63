#include "execution_store.hpp"
#include <algorithm>
#include <set>

namespace mdjobs {

int64_t InMemoryExecutionStore::insertRun(const ExecutionRun &run) {
  std::lock_guard<std::mutex> lock(mutex_);
  ExecutionRun stored = run;
  stored.id = nextId_++;
  runs_.emplace(stored.id, stored);
  return stored.id;
}

bool InMemoryExecutionStore::finishRun(int64_t runId,
                                       const RunOutcome &outcome) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = runs_.find(runId);
  if (it == runs_.end() || it->second.status != RunStatus::RUNNING) {
    return false;
  }
  applyOutcome(it->second, outcome);
  return true;
}

std::optional<ExecutionRun> InMemoryExecutionStore::getRun(int64_t runId) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = runs_.find(runId);
  if (it == runs_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<ExecutionRun>
InMemoryExecutionStore::history(const std::string &jobName, int limit) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<ExecutionRun> result;
  for (const auto &[id, run] : runs_) {
    if (run.jobName == jobName) {
      result.push_back(run);
    }
  }
  std::stable_sort(result.begin(), result.end(),
                   [](const ExecutionRun &a, const ExecutionRun &b) {
                     if (a.startedAt != b.startedAt) {
                       return a.startedAt > b.startedAt;
                     }
                     return a.id > b.id;
                   });
  if (limit >= 0 && result.size() > static_cast<size_t>(limit)) {
    result.resize(static_cast<size_t>(limit));
  }
  return result;
}

std::vector<std::string> InMemoryExecutionStore::jobNames() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::set<std::string> names;
  for (const auto &[id, run] : runs_) {
    names.insert(run.jobName);
  }
  return {names.begin(), names.end()};
}

int InMemoryExecutionStore::pruneHistory(const std::string &jobName,
                                         int keep) {
  auto kept = history(jobName, std::max(keep, 0));
  std::set<int64_t> keepIds;
  for (const auto &run : kept) {
    keepIds.insert(run.id);
  }

  std::lock_guard<std::mutex> lock(mutex_);
  int deleted = 0;
  for (auto it = runs_.begin(); it != runs_.end();) {
    if (it->second.jobName == jobName && keepIds.count(it->first) == 0) {
      it = runs_.erase(it);
      ++deleted;
    } else {
      ++it;
    }
  }
  return deleted;
}

int InMemoryExecutionStore::failRunningRuns(const std::string &message,
                                            TimePoint now) {
  std::lock_guard<std::mutex> lock(mutex_);
  int changed = 0;
  for (auto &[id, run] : runs_) {
    if (run.status == RunStatus::RUNNING) {
      applyOutcome(run, RunOutcome{RunStatus::FAILED, now, std::nullopt, message});
      ++changed;
    }
  }
  return changed;
}

void InMemoryExecutionStore::applyOutcome(ExecutionRun &run,
                                          const RunOutcome &outcome) {
  run.status = outcome.status;
  run.completedAt = outcome.completedAt;
  run.durationSeconds =
      std::chrono::duration<double>(outcome.completedAt - run.startedAt).count();
  if (outcome.recordsProcessed) {
    run.recordsProcessed = outcome.recordsProcessed;
  }
  if (outcome.errorMessage) {
    run.errorMessage = outcome.errorMessage;
  }
}

} // namespace mdjobs
