#pragma once

#include "job_models.hpp"
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mdjobs {

/**
 * Persistence for scan_runs and their scan_errors.
 *
 * Counter updates are single-row increments issued by concurrent workers;
 * only decrementErrors() lowers a counter.
 */
class ScanStore {
public:
  virtual ~ScanStore() = default;

  // Throws SystemException when the row is not stored
  virtual int64_t createRun(const std::string &scanDate, TimePoint startedAt) = 0;
  virtual void setRequested(int64_t scanId, int count) = 0;
  virtual void incrementFetched(int64_t scanId) = 0;

  // Appends the row and increments the run's error count
  virtual void addError(const ScanError &error) = 0;

  virtual void finishRun(int64_t scanId, ScanStatus status,
                         TimePoint completedAt) = 0;

  virtual std::optional<ScanRun> getRun(int64_t scanId) = 0;
  // Newest first
  virtual std::vector<ScanRun> listRuns(int limit) = 0;
  // Newest first
  virtual std::vector<ScanError> getErrors(int64_t scanId, int limit) = 0;

  // Distinct symbols with a transient provider_error row for the run
  virtual std::vector<std::string> retryableSymbols(int64_t scanId) = 0;
  // Returns the number of rows removed
  virtual int deleteProviderErrors(int64_t scanId, const std::string &symbol) = 0;
  // Lowers the error count, never below zero
  virtual void decrementErrors(int64_t scanId, int count) = 0;

  // Keeps the `keep` most recently started runs; errors cascade
  virtual int pruneRuns(int keep) = 0;
  // Fails every running scan; returns the number changed
  virtual int failRunningScans(TimePoint now) = 0;
};

class InMemoryScanStore : public ScanStore {
public:
  int64_t createRun(const std::string &scanDate, TimePoint startedAt) override;
  void setRequested(int64_t scanId, int count) override;
  void incrementFetched(int64_t scanId) override;
  void addError(const ScanError &error) override;
  void finishRun(int64_t scanId, ScanStatus status,
                 TimePoint completedAt) override;
  std::optional<ScanRun> getRun(int64_t scanId) override;
  std::vector<ScanRun> listRuns(int limit) override;
  std::vector<ScanError> getErrors(int64_t scanId, int limit) override;
  std::vector<std::string> retryableSymbols(int64_t scanId) override;
  int deleteProviderErrors(int64_t scanId, const std::string &symbol) override;
  void decrementErrors(int64_t scanId, int count) override;
  int pruneRuns(int keep) override;
  int failRunningScans(TimePoint now) override;

private:
  std::mutex mutex_;
  int64_t nextRunId_ = 1;
  int64_t nextErrorId_ = 1;
  std::map<int64_t, ScanRun> runs_;
  std::vector<ScanError> errors_;
};

} // namespace mdjobs
