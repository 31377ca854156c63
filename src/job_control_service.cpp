#include "job_control_service.hpp"
#include "job_exceptions.hpp"
#include "job_trigger.hpp"
#include "logger.hpp"

namespace mdjobs {

namespace {

template <typename T>
nlohmann::json optionalJson(const std::optional<T> &value) {
  return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

nlohmann::json optionalTime(const std::optional<TimePoint> &value) {
  return value ? nlohmann::json(timePointToString(*value))
               : nlohmann::json(nullptr);
}

void requirePositive(int limit, const char *field) {
  if (limit <= 0) {
    throw ValidationException(ErrorCode::INVALID_RANGE,
                              std::string(field) + " must be positive", field,
                              std::to_string(limit));
  }
}

} // namespace

nlohmann::json toJson(const JobConfiguration &config) {
  return {{"job_name", config.jobName},
          {"description", config.description},
          {"enabled", config.enabled},
          {"schedule_type", scheduleKindToString(config.scheduleKind)},
          {"interval_value", optionalJson(config.intervalValue)},
          {"interval_unit", optionalJson(config.intervalUnit)},
          {"cron_day_of_week", optionalJson(config.cronDayOfWeek)},
          {"cron_hour", optionalJson(config.cronHour)},
          {"cron_minute", optionalJson(config.cronMinute)},
          {"only_market_hours", config.onlyMarketHours},
          {"market_start_hour", optionalJson(config.marketStartHour)},
          {"market_end_hour", optionalJson(config.marketEndHour)}};
}

nlohmann::json toJson(const ExecutionRun &run) {
  return {{"id", run.id},
          {"job_name", run.jobName},
          {"status", runStatusToString(run.status)},
          {"started_at", timePointToString(run.startedAt)},
          {"completed_at", optionalTime(run.completedAt)},
          {"duration_seconds", optionalJson(run.durationSeconds)},
          {"records_processed", optionalJson(run.recordsProcessed)},
          {"error_message", optionalJson(run.errorMessage)},
          {"next_run_at", optionalTime(run.nextRunAt)}};
}

nlohmann::json toJson(const ScanRun &run) {
  return {{"id", run.id},
          {"status", scanStatusToString(run.status)},
          {"scan_date", run.scanDate},
          {"symbols_requested", run.symbolsRequested},
          {"symbols_fetched", run.symbolsFetched},
          {"error_count", run.errorCount},
          {"started_at", timePointToString(run.startedAt)},
          {"completed_at", optionalTime(run.completedAt)}};
}

nlohmann::json toJson(const ScanError &error) {
  return {{"id", error.id},
          {"scan_run_id", error.scanRunId},
          {"symbol", error.symbol},
          {"error_type", scanErrorTypeToString(error.errorType)},
          {"error_message", error.message},
          {"http_status", optionalJson(error.httpStatus)},
          {"occurred_at", timePointToString(error.occurredAt)}};
}

nlohmann::json toJson(const RunResult &result) {
  nlohmann::json json = {{"job_name", result.jobName},
                         {"run_id", optionalJson(result.runId)},
                         {"status", runStatusToString(result.status)},
                         {"records_processed", result.recordsProcessed},
                         {"chained", result.chained}};
  if (!result.errorMessage.empty()) {
    json["error_message"] = result.errorMessage;
  }
  return json;
}

nlohmann::json JobOverview::toJson() const {
  nlohmann::json json = mdjobs::toJson(config);
  json["schedule"] = schedule;
  json["next_run_time"] = optionalTime(nextRunTime);
  json["last_run"] =
      latestRun ? mdjobs::toJson(*latestRun) : nlohmann::json(nullptr);
  return json;
}

nlohmann::json StuckRunCleanup::toJson() const {
  return {{"scans_marked_failed", scansFailed},
          {"runs_marked_failed", runsFailed}};
}

JobControlService::JobControlService(std::shared_ptr<JobConfigStore> configs,
                                     std::shared_ptr<JobRunner> runner,
                                     std::shared_ptr<ScanStore> scans,
                                     std::shared_ptr<EodScanEngine> scanEngine,
                                     MarketHours hours)
    : configs_(std::move(configs)), runner_(std::move(runner)),
      scans_(std::move(scans)), scanEngine_(std::move(scanEngine)),
      hours_(std::move(hours)) {
  if (!configs_ || !runner_ || !scans_) {
    throw SystemException(ErrorCode::CONFIGURATION_ERROR,
                          "JobControlService requires a configuration store, "
                          "job runner and scan store",
                          "JobControlService");
  }
}

void JobControlService::setScheduler(
    std::shared_ptr<SchedulerService> scheduler) {
  scheduler_ = std::move(scheduler);
}

std::string
JobControlService::describeSchedule(const JobConfiguration &config) const {
  try {
    return JobTrigger::fromConfiguration(config, hours_, Clock::now())
        ->describe();
  } catch (const ValidationException &e) {
    return "Invalid schedule: " + e.getMessage();
  }
}

std::vector<JobOverview> JobControlService::listJobs() {
  std::vector<JobOverview> overviews;
  for (auto &config : configs_->listAll()) {
    JobOverview overview;
    overview.schedule = describeSchedule(config);
    if (scheduler_) {
      overview.nextRunTime = scheduler_->nextFireTime(config.jobName);
    }
    overview.latestRun = runner_->tracker().latest(config.jobName);
    overview.config = std::move(config);
    overviews.push_back(std::move(overview));
  }
  return overviews;
}

JobConfiguration
JobControlService::updateJobConfig(const std::string &jobName,
                                   const JobConfigurationPatch &patch) {
  if (patch.empty()) {
    throw ValidationException(ErrorCode::MISSING_FIELD,
                              "No configuration fields to update", "patch");
  }

  auto current = configs_->get(jobName);
  if (!current) {
    throw BusinessException(ErrorCode::JOB_NOT_FOUND,
                            "Job configuration not found: " + jobName,
                            "updateJobConfig", {{"job_name", jobName}});
  }

  JobConfiguration candidate = *current;
  patch.applyTo(candidate);
  if (candidate.enabled) {
    JobTrigger::fromConfiguration(candidate, hours_, Clock::now());
  }

  auto stored = configs_->update(jobName, patch);
  if (!stored) {
    throw BusinessException(ErrorCode::JOB_NOT_FOUND,
                            "Job configuration not found: " + jobName,
                            "updateJobConfig", {{"job_name", jobName}});
  }
  CONTROL_LOG_INFO("Updated configuration for {}; applies on next reload",
                   jobName);
  return *stored;
}

RunResult JobControlService::runJobNow(const std::string &jobName,
                                       const std::optional<DateRange> &range) {
  RunRequest request;
  request.source = TriggerSource::MANUAL;
  request.dateRange = range;
  CONTROL_LOG_INFO("Manual run requested for {}", jobName);
  return runner_->runJob(jobName, request);
}

std::vector<ExecutionRun>
JobControlService::getExecutionHistory(const std::string &jobName, int limit) {
  requirePositive(limit, "limit");
  return runner_->tracker().history(jobName, limit);
}

std::vector<ScanRun> JobControlService::listScans(int limit) {
  requirePositive(limit, "limit");
  return scans_->listRuns(limit);
}

std::vector<ScanError> JobControlService::getScanErrors(int64_t scanId,
                                                        int limit) {
  requirePositive(limit, "limit");
  return scans_->getErrors(scanId, limit);
}

RetrySummary JobControlService::retryScan(int64_t scanId) {
  if (!scanEngine_) {
    throw SystemException(ErrorCode::CONFIGURATION_ERROR,
                          "Scan engine is not configured", "JobControlService");
  }
  CONTROL_LOG_INFO("Retry requested for scan {}", scanId);
  return scanEngine_->retryScan(scanId);
}

StuckRunCleanup JobControlService::cleanupStuckRuns() {
  StuckRunCleanup result;
  result.scansFailed = scans_->failRunningScans(Clock::now());
  result.runsFailed = runner_->tracker().cleanupStuckRuns();
  CONTROL_LOG_WARN("Stuck-run cleanup marked {} scans and {} runs failed",
                   result.scansFailed, result.runsFailed);
  return result;
}

ReloadSummary JobControlService::reloadSchedules() {
  if (!scheduler_ || !scheduler_->isRunning()) {
    throw SystemException(ErrorCode::CONFIGURATION_ERROR,
                          "Scheduler is not running", "JobControlService");
  }
  return scheduler_->reload();
}

} // namespace mdjobs
