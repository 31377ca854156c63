#include "job_control_service.hpp"
#include "job_exceptions.hpp"
#include "logger.hpp"
#include <gtest/gtest.h>

namespace mdjobs {

namespace {

class NullProvider : public MarketDataProvider {
public:
  void preWarmToken() override {}
  std::vector<Bar> fetchDailyBars(const std::string &, const DateRange &) override {
    return {};
  }
};

} // namespace

class JobControlServiceTest : public ::testing::Test {
protected:
  void SetUp() override {
    LogConfig config;
    config.level = LogLevel::DEBUG;
    config.consoleOutput = true;
    config.fileOutput = false;
    Logger::getInstance().configure(config);

    configs_ = std::make_shared<InMemoryJobConfigStore>();
    configs_->seedDefaults(defaultJobConfigurations());
    tracker_ = std::make_shared<ExecutionTracker>(
        std::make_shared<InMemoryExecutionStore>(), 5);
    runner_ = std::make_shared<JobRunner>(tracker_, std::make_shared<JobLockRegistry>());
    runner_->registerJob("eod_scan", [this](const JobContext &context) -> int64_t {
      lastSource_ = context.source;
      return 7;
    });
    scans_ = std::make_shared<InMemoryScanStore>();

    ScanConfig scanConfig;
    scanConfig.requestSleepMs = 0;
    engine_ = std::make_shared<EodScanEngine>(
        scanConfig, MarketHours(), scans_, std::make_shared<NullProvider>(),
        std::make_shared<InMemoryBarStore>(),
        std::make_shared<StaticSymbolUniverse>(std::vector<SymbolRecord>{}));

    control_ = std::make_unique<JobControlService>(configs_, runner_, scans_, engine_,
                                                   MarketHours());
  }

  const JobOverview *find(const std::vector<JobOverview> &jobs, const std::string &name) {
    for (const auto &job : jobs) {
      if (job.config.jobName == name) {
        return &job;
      }
    }
    return nullptr;
  }

  std::shared_ptr<InMemoryJobConfigStore> configs_;
  std::shared_ptr<ExecutionTracker> tracker_;
  std::shared_ptr<JobRunner> runner_;
  std::shared_ptr<InMemoryScanStore> scans_;
  std::shared_ptr<EodScanEngine> engine_;
  std::unique_ptr<JobControlService> control_;
  TriggerSource lastSource_ = TriggerSource::SCHEDULED;
};

TEST_F(JobControlServiceTest, ListJobsDescribesSchedules) {
  auto jobs = control_->listJobs();
  ASSERT_EQ(jobs.size(), 5u);

  const auto *eod = find(jobs, "eod_scan");
  ASSERT_NE(eod, nullptr);
  EXPECT_EQ(eod->schedule, "Weekdays at 17:30");
  EXPECT_FALSE(eod->nextRunTime.has_value());
  EXPECT_FALSE(eod->latestRun.has_value());

  const auto *refresh = find(jobs, "market_data_refresh");
  ASSERT_NE(refresh, nullptr);
  EXPECT_EQ(refresh->schedule, "Every 30 minutes (market hours only)");

  const auto *universe = find(jobs, "universe_refresh");
  ASSERT_NE(universe, nullptr);
  EXPECT_EQ(universe->schedule, "Sunday at 08:00");
}

TEST_F(JobControlServiceTest, ListJobsIncludesLatestRun) {
  control_->runJobNow("eod_scan");

  auto jobs = control_->listJobs();
  const auto *eod = find(jobs, "eod_scan");
  ASSERT_NE(eod, nullptr);
  ASSERT_TRUE(eod->latestRun.has_value());
  EXPECT_EQ(eod->latestRun->status, RunStatus::COMPLETED);

  auto json = eod->toJson();
  EXPECT_EQ(json["job_name"], "eod_scan");
  EXPECT_EQ(json["schedule_type"], "cron");
  EXPECT_EQ(json["schedule"], "Weekdays at 17:30");
  EXPECT_TRUE(json["next_run_time"].is_null());
  EXPECT_EQ(json["last_run"]["status"], "completed");
  EXPECT_EQ(json["last_run"]["records_processed"], 7);
}

TEST_F(JobControlServiceTest, UpdateStoresValidPatch) {
  JobConfigurationPatch patch;
  patch.cronHour = 18;
  patch.cronMinute = 15;
  auto updated = control_->updateJobConfig("eod_scan", patch);

  EXPECT_EQ(updated.cronHour.value_or(-1), 18);
  EXPECT_EQ(updated.cronMinute.value_or(-1), 15);
  EXPECT_EQ(configs_->get("eod_scan")->cronHour.value_or(-1), 18);
}

TEST_F(JobControlServiceTest, UpdateRejectsInvalidSchedule) {
  JobConfigurationPatch patch;
  patch.cronHour = 25;
  EXPECT_THROW(control_->updateJobConfig("eod_scan", patch), ValidationException);
  EXPECT_EQ(configs_->get("eod_scan")->cronHour.value_or(-1), 17);

  JobConfigurationPatch badUnit;
  badUnit.intervalUnit = std::string("fortnights");
  EXPECT_THROW(control_->updateJobConfig("token_validation", badUnit),
               ValidationException);
  EXPECT_EQ(configs_->get("token_validation")->intervalUnit.value_or(""), "hours");
}

TEST_F(JobControlServiceTest, UpdateUnknownOrEmpty) {
  JobConfigurationPatch patch;
  patch.enabled = false;
  try {
    control_->updateJobConfig("no_such_job", patch);
    FAIL() << "expected JOB_NOT_FOUND";
  } catch (const BusinessException &e) {
    EXPECT_EQ(e.getCode(), ErrorCode::JOB_NOT_FOUND);
  }

  EXPECT_THROW(control_->updateJobConfig("eod_scan", JobConfigurationPatch{}),
               ValidationException);
}

TEST_F(JobControlServiceTest, RunJobNowIsManual) {
  auto result = control_->runJobNow("eod_scan");
  EXPECT_EQ(result.status, RunStatus::COMPLETED);
  EXPECT_EQ(lastSource_, TriggerSource::MANUAL);

  auto json = toJson(result);
  EXPECT_EQ(json["status"], "completed");
  EXPECT_EQ(json["records_processed"], 7);
  EXPECT_FALSE(json.contains("error_message"));
}

TEST_F(JobControlServiceTest, RunJobNowWhileRunningIsRejected) {
  auto held = runner_->locks().tryAcquire("eod_scan");
  ASSERT_TRUE(held);
  try {
    control_->runJobNow("eod_scan");
    FAIL() << "expected JOB_ALREADY_RUNNING";
  } catch (const BusinessException &e) {
    EXPECT_EQ(e.getCode(), ErrorCode::JOB_ALREADY_RUNNING);
  }
}

TEST_F(JobControlServiceTest, HistoryRequiresPositiveLimit) {
  control_->runJobNow("eod_scan");
  control_->runJobNow("eod_scan");

  EXPECT_EQ(control_->getExecutionHistory("eod_scan", 1).size(), 1u);
  EXPECT_EQ(control_->getExecutionHistory("eod_scan").size(), 2u);
  EXPECT_THROW(control_->getExecutionHistory("eod_scan", 0), ValidationException);
  EXPECT_THROW(control_->listScans(-1), ValidationException);
}

TEST_F(JobControlServiceTest, ScanListingAndErrors) {
  int64_t scanId = scans_->createRun("2024-01-05", Clock::now());
  ScanError error;
  error.scanRunId = scanId;
  error.symbol = "AAPL";
  error.errorType = ScanErrorType::PROVIDER_ERROR;
  error.message = "HTTP 429";
  error.httpStatus = 429;
  error.occurredAt = Clock::now();
  scans_->addError(error);

  auto scans = control_->listScans();
  ASSERT_EQ(scans.size(), 1u);
  EXPECT_EQ(scans[0].errorCount, 1);

  auto errors = control_->getScanErrors(scanId);
  ASSERT_EQ(errors.size(), 1u);
  auto json = toJson(errors[0]);
  EXPECT_EQ(json["symbol"], "AAPL");
  EXPECT_EQ(json["error_type"], "provider_error");
  EXPECT_EQ(json["http_status"], 429);
}

TEST_F(JobControlServiceTest, RetryUnknownScan) {
  auto summary = control_->retryScan(12345);
  EXPECT_EQ(summary.retried, 0);
  EXPECT_EQ(summary.message.value_or(""), "scan not found");
}

TEST_F(JobControlServiceTest, CleanupStuckRuns) {
  scans_->createRun("2024-01-05", Clock::now());
  tracker_->begin("eod_scan");
  int64_t done = tracker_->begin("universe_refresh");
  tracker_->complete(done, 1);

  auto cleanup = control_->cleanupStuckRuns();
  EXPECT_EQ(cleanup.scansFailed, 1);
  EXPECT_EQ(cleanup.runsFailed, 1);

  auto json = cleanup.toJson();
  EXPECT_EQ(json["scans_marked_failed"], 1);
  EXPECT_EQ(json["runs_marked_failed"], 1);

  auto again = control_->cleanupStuckRuns();
  EXPECT_EQ(again.scansFailed + again.runsFailed, 0);
}

TEST_F(JobControlServiceTest, ReloadNeedsRunningScheduler) {
  EXPECT_THROW(control_->reloadSchedules(), SystemException);

  auto scheduler = std::make_shared<SchedulerService>(SchedulerConfig{}, MarketHours(),
                                                      configs_, runner_);
  control_->setScheduler(scheduler);
  EXPECT_THROW(control_->reloadSchedules(), SystemException);
}

TEST_F(JobControlServiceTest, ConfigurationJson) {
  auto json = toJson(*configs_->get("market_data_refresh"));
  EXPECT_EQ(json["schedule_type"], "interval");
  EXPECT_EQ(json["interval_value"], 30);
  EXPECT_EQ(json["interval_unit"], "minutes");
  EXPECT_EQ(json["only_market_hours"], true);
  EXPECT_EQ(json["market_start_hour"], 9);
  EXPECT_TRUE(json["cron_hour"].is_null());
}

TEST_F(JobControlServiceTest, RequiresCollaborators) {
  EXPECT_THROW(JobControlService(configs_, runner_, nullptr, engine_, MarketHours()),
               SystemException);
}

} // namespace mdjobs
