#include "scan_store.hpp"
#include "job_exceptions.hpp"
#include <algorithm>
#include <set>

namespace mdjobs {

int64_t InMemoryScanStore::createRun(const std::string &scanDate,
                                     TimePoint startedAt) {
  std::lock_guard<std::mutex> lock(mutex_);
  ScanRun run;
  run.id = nextRunId_++;
  run.status = ScanStatus::RUNNING;
  run.scanDate = scanDate;
  run.startedAt = startedAt;
  runs_.emplace(run.id, run);
  return run.id;
}

void InMemoryScanStore::setRequested(int64_t scanId, int count) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = runs_.find(scanId);
  if (it != runs_.end()) {
    it->second.symbolsRequested = count;
  }
}

void InMemoryScanStore::incrementFetched(int64_t scanId) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = runs_.find(scanId);
  if (it != runs_.end()) {
    it->second.symbolsFetched++;
  }
}

void InMemoryScanStore::addError(const ScanError &error) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = runs_.find(error.scanRunId);
  if (it == runs_.end()) {
    return;
  }
  ScanError stored = error;
  stored.id = nextErrorId_++;
  errors_.push_back(stored);
  it->second.errorCount++;
}

void InMemoryScanStore::finishRun(int64_t scanId, ScanStatus status,
                                  TimePoint completedAt) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = runs_.find(scanId);
  if (it == runs_.end()) {
    throw BusinessException(ErrorCode::SCAN_NOT_FOUND,
                            "Scan " + std::to_string(scanId) + " not found",
                            "finishRun");
  }
  it->second.status = status;
  it->second.completedAt = completedAt;
}

std::optional<ScanRun> InMemoryScanStore::getRun(int64_t scanId) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = runs_.find(scanId);
  if (it == runs_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<ScanRun> InMemoryScanStore::listRuns(int limit) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<ScanRun> result;
  for (auto it = runs_.rbegin(); it != runs_.rend(); ++it) {
    if (limit >= 0 && result.size() >= static_cast<size_t>(limit)) {
      break;
    }
    result.push_back(it->second);
  }
  return result;
}

std::vector<ScanError> InMemoryScanStore::getErrors(int64_t scanId, int limit) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<ScanError> result;
  for (auto it = errors_.rbegin(); it != errors_.rend(); ++it) {
    if (limit >= 0 && result.size() >= static_cast<size_t>(limit)) {
      break;
    }
    if (it->scanRunId == scanId) {
      result.push_back(*it);
    }
  }
  return result;
}

std::vector<std::string> InMemoryScanStore::retryableSymbols(int64_t scanId) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::set<std::string> symbols;
  for (const auto &error : errors_) {
    if (error.scanRunId == scanId &&
        error.errorType == ScanErrorType::PROVIDER_ERROR &&
        error.symbol != "unknown" && isTransientStatus(error.httpStatus)) {
      symbols.insert(error.symbol);
    }
  }
  return {symbols.begin(), symbols.end()};
}

int InMemoryScanStore::deleteProviderErrors(int64_t scanId,
                                            const std::string &symbol) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto before = errors_.size();
  errors_.erase(std::remove_if(errors_.begin(), errors_.end(),
                               [&](const ScanError &error) {
                                 return error.scanRunId == scanId &&
                                        error.symbol == symbol &&
                                        error.errorType ==
                                            ScanErrorType::PROVIDER_ERROR;
                               }),
                errors_.end());
  return static_cast<int>(before - errors_.size());
}

void InMemoryScanStore::decrementErrors(int64_t scanId, int count) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = runs_.find(scanId);
  if (it != runs_.end()) {
    it->second.errorCount = std::max(0, it->second.errorCount - count);
  }
}

int InMemoryScanStore::pruneRuns(int keep) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<ScanRun> ordered;
  for (const auto &[id, run] : runs_) {
    ordered.push_back(run);
  }
  std::stable_sort(ordered.begin(), ordered.end(),
                   [](const ScanRun &a, const ScanRun &b) {
                     if (a.startedAt != b.startedAt) {
                       return a.startedAt > b.startedAt;
                     }
                     return a.id > b.id;
                   });

  std::set<int64_t> removed;
  for (size_t i = static_cast<size_t>(std::max(keep, 0)); i < ordered.size();
       ++i) {
    removed.insert(ordered[i].id);
    runs_.erase(ordered[i].id);
  }
  errors_.erase(std::remove_if(errors_.begin(), errors_.end(),
                               [&](const ScanError &error) {
                                 return removed.count(error.scanRunId) > 0;
                               }),
                errors_.end());
  return static_cast<int>(removed.size());
}

int InMemoryScanStore::failRunningScans(TimePoint now) {
  std::lock_guard<std::mutex> lock(mutex_);
  int changed = 0;
  for (auto &[id, run] : runs_) {
    if (run.status == ScanStatus::RUNNING && !run.completedAt) {
      run.status = ScanStatus::FAILED;
      run.completedAt = now;
      ++changed;
    }
  }
  return changed;
}

} // namespace mdjobs
