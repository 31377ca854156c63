#pragma once

#include "eod_scan_engine.hpp"
#include "execution_tracker.hpp"
#include "job_config_store.hpp"
#include "job_runner.hpp"
#include "market_hours.hpp"
#include "scan_store.hpp"
#include "scheduler_service.hpp"
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace mdjobs {

struct JobOverview {
  JobConfiguration config;
  std::string schedule;
  std::optional<TimePoint> nextRunTime;
  std::optional<ExecutionRun> latestRun;

  nlohmann::json toJson() const;
};

struct StuckRunCleanup {
  int scansFailed = 0;
  int runsFailed = 0;

  nlohmann::json toJson() const;
};

nlohmann::json toJson(const JobConfiguration &config);
nlohmann::json toJson(const ExecutionRun &run);
nlohmann::json toJson(const ScanRun &run);
nlohmann::json toJson(const ScanError &error);
nlohmann::json toJson(const RunResult &result);

/**
 * Administrative operations over the job fleet. Transport-neutral: an HTTP
 * layer or a CLI maps its requests onto these calls.
 */
class JobControlService {
public:
  static constexpr int kDefaultScanListLimit = 20;
  static constexpr int kDefaultScanErrorLimit = 100;
  static constexpr int kDefaultHistoryLimit = 10;

  JobControlService(std::shared_ptr<JobConfigStore> configs,
                    std::shared_ptr<JobRunner> runner,
                    std::shared_ptr<ScanStore> scans,
                    std::shared_ptr<EodScanEngine> scanEngine,
                    MarketHours hours);

  // Optional; without it next run times are empty and reloads fail
  void setScheduler(std::shared_ptr<SchedulerService> scheduler);

  std::vector<JobOverview> listJobs();

  // Validates the resulting schedule before storing it. The change is
  // applied to timers on the next reloadSchedules().
  JobConfiguration updateJobConfig(const std::string &jobName,
                                   const JobConfigurationPatch &patch);

  RunResult runJobNow(const std::string &jobName,
                      const std::optional<DateRange> &range = std::nullopt);

  std::vector<ExecutionRun> getExecutionHistory(const std::string &jobName,
                                                int limit = kDefaultHistoryLimit);

  std::vector<ScanRun> listScans(int limit = kDefaultScanListLimit);
  std::vector<ScanError> getScanErrors(int64_t scanId,
                                       int limit = kDefaultScanErrorLimit);
  RetrySummary retryScan(int64_t scanId);

  StuckRunCleanup cleanupStuckRuns();
  ReloadSummary reloadSchedules();

private:
  std::shared_ptr<JobConfigStore> configs_;
  std::shared_ptr<JobRunner> runner_;
  std::shared_ptr<ScanStore> scans_;
  std::shared_ptr<EodScanEngine> scanEngine_;
  std::shared_ptr<SchedulerService> scheduler_;
  MarketHours hours_;

  std::string describeSchedule(const JobConfiguration &config) const;
};

} // namespace mdjobs
