#pragma once

#include "database_manager.hpp"
#include "scan_store.hpp"
#include <memory>

namespace mdjobs {

// scan_runs and scan_errors tables
class ScanRepository : public ScanStore {
public:
  explicit ScanRepository(std::shared_ptr<DatabaseManager> dbManager);

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
  std::shared_ptr<DatabaseManager> dbManager_;

  bool connected() const;
  void updateCounter(const std::string &query, const SqlParams &params,
                     int64_t scanId);
  ScanRun runFromRow(const std::vector<std::string> &row) const;
  ScanError errorFromRow(const std::vector<std::string> &row) const;
};

} // namespace mdjobs
