#include "job_catalog.hpp"
#include "job_exceptions.hpp"
#include "logger.hpp"
#include "scheduler_service.hpp"
#include <algorithm>
#include <atomic>
#include <gtest/gtest.h>
#include <thread>

namespace mdjobs {

class SchedulerServiceTest : public ::testing::Test {
protected:
  void SetUp() override {
    LogConfig config;
    config.level = LogLevel::DEBUG;
    config.consoleOutput = true;
    config.fileOutput = false;
    Logger::getInstance().configure(config);

    configs_ = std::make_shared<InMemoryJobConfigStore>();
    tracker_ = std::make_shared<ExecutionTracker>(
        std::make_shared<InMemoryExecutionStore>(), 5);
    runner_ = std::make_shared<JobRunner>(tracker_, std::make_shared<JobLockRegistry>());
    runner_->registerJob(jobs::kTtlCleanup, [](const JobContext &) -> int64_t { return 0; });

    schedulerConfig_.misfireGraceSeconds = 30;
    schedulerConfig_.jobThreads = 4;
  }

  void TearDown() override {
    if (scheduler_) {
      scheduler_->stop();
    }
  }

  void startScheduler() {
    scheduler_ = std::make_unique<SchedulerService>(schedulerConfig_, MarketHours(),
                                                    configs_, runner_);
    scheduler_->start();
  }

  void registerNoop(const std::string &jobName) {
    runner_->registerJob(jobName, [](const JobContext &) -> int64_t { return 1; });
  }

  static JobConfiguration intervalJob(const std::string &name, int value,
                                      const std::string &unit) {
    JobConfiguration config;
    config.jobName = name;
    config.scheduleKind = ScheduleKind::INTERVAL;
    config.intervalValue = value;
    config.intervalUnit = unit;
    return config;
  }

  static JobConfiguration cronJob(const std::string &name, const std::string &days,
                                  int hour, int minute) {
    JobConfiguration config;
    config.jobName = name;
    config.scheduleKind = ScheduleKind::CRON;
    config.cronDayOfWeek = days;
    config.cronHour = hour;
    config.cronMinute = minute;
    return config;
  }

  std::vector<std::string> scheduledNames() const {
    std::vector<std::string> names;
    for (const auto &job : scheduler_->getScheduledJobs()) {
      names.push_back(job.jobName);
    }
    std::sort(names.begin(), names.end());
    return names;
  }

  size_t countStatus(const std::string &jobName, RunStatus status) {
    size_t count = 0;
    for (const auto &run : tracker_->history(jobName, 100)) {
      if (run.status == status) {
        ++count;
      }
    }
    return count;
  }

  SchedulerConfig schedulerConfig_;
  std::shared_ptr<InMemoryJobConfigStore> configs_;
  std::shared_ptr<ExecutionTracker> tracker_;
  std::shared_ptr<JobRunner> runner_;
  std::unique_ptr<SchedulerService> scheduler_;
};

TEST_F(SchedulerServiceTest, IntervalJobFiresRepeatedly) {
  std::atomic<int> fired{0};
  runner_->registerJob("heartbeat", [&fired](const JobContext &context) -> int64_t {
    EXPECT_EQ(context.source, TriggerSource::SCHEDULED);
    return ++fired;
  });
  configs_->upsert(intervalJob("heartbeat", 1, "seconds"));

  startScheduler();
  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (fired.load() < 2 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
  }
  scheduler_->stop();

  EXPECT_GE(fired.load(), 2);
  EXPECT_GE(countStatus("heartbeat", RunStatus::COMPLETED), 2u);

  auto latest = tracker_->latest("heartbeat");
  ASSERT_TRUE(latest.has_value());
  EXPECT_TRUE(latest->nextRunAt.has_value());
}

TEST_F(SchedulerServiceTest, OverlappingFireIsRecordedAsSkipped) {
  std::atomic<int> active{0};
  std::atomic<int> maxActive{0};
  runner_->registerJob("slow_job", [&](const JobContext &) -> int64_t {
    int now = ++active;
    int seen = maxActive.load();
    while (now > seen && !maxActive.compare_exchange_weak(seen, now)) {
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(2500));
    --active;
    return 1;
  });
  configs_->upsert(intervalJob("slow_job", 1, "seconds"));

  startScheduler();
  std::this_thread::sleep_for(std::chrono::milliseconds(3300));
  scheduler_->stop();

  EXPECT_EQ(maxActive.load(), 1);
  EXPECT_GE(countStatus("slow_job", RunStatus::SKIPPED), 1u);
  EXPECT_EQ(countStatus("slow_job", RunStatus::COMPLETED), 1u);
  EXPECT_EQ(countStatus("slow_job", RunStatus::RUNNING), 0u);
}

TEST_F(SchedulerServiceTest, RetentionJobIsAlwaysArmed) {
  schedulerConfig_.ttlCleanupHour = 4;
  schedulerConfig_.ttlCleanupMinute = 15;
  startScheduler();

  auto scheduled = scheduler_->getScheduledJobs();
  ASSERT_EQ(scheduled.size(), 1u);
  EXPECT_EQ(scheduled[0].jobName, jobs::kTtlCleanup);
  EXPECT_EQ(scheduled[0].schedule, "Daily at 04:15");
  EXPECT_GT(scheduled[0].nextFireTime, Clock::now());

  auto json = scheduled[0].toJson();
  EXPECT_EQ(json["job_name"], jobs::kTtlCleanup);
  EXPECT_TRUE(json.contains("next_run_time"));
}

TEST_F(SchedulerServiceTest, StoredRetentionScheduleWins) {
  configs_->upsert(cronJob(jobs::kTtlCleanup, "sun", 2, 30));
  startScheduler();

  auto scheduled = scheduler_->getScheduledJobs();
  ASSERT_EQ(scheduled.size(), 1u);
  EXPECT_EQ(scheduled[0].schedule, "Sunday at 02:30");
}

TEST_F(SchedulerServiceTest, CronNextFireMatchesTrigger) {
  registerNoop("eod_scan");
  configs_->upsert(cronJob("eod_scan", "mon-fri", 17, 30));

  const auto before = Clock::now();
  startScheduler();

  CronTrigger expected(parseDayOfWeek("mon-fri"), 17, 30, MarketHours());
  auto next = scheduler_->nextFireTime("eod_scan");
  ASSERT_TRUE(next.has_value());
  EXPECT_EQ(*next, expected.nextFireTime(before));
  EXPECT_FALSE(scheduler_->nextFireTime("not_armed").has_value());
}

TEST_F(SchedulerServiceTest, DisabledJobsAreNotArmed) {
  registerNoop("tech_analysis");
  auto config = cronJob("tech_analysis", "mon-fri", 18, 0);
  config.enabled = false;
  configs_->upsert(config);

  startScheduler();
  EXPECT_EQ(scheduledNames(), (std::vector<std::string>{jobs::kTtlCleanup}));
}

TEST_F(SchedulerServiceTest, InvalidConfigurationIsRejectedAlone) {
  registerNoop("good_job");
  registerNoop("bad_job");
  configs_->upsert(intervalJob("good_job", 1, "hours"));
  configs_->upsert(cronJob("bad_job", "mon-fri", 30, 0));

  startScheduler();
  EXPECT_TRUE(scheduler_->isRunning());
  EXPECT_EQ(scheduledNames(),
            (std::vector<std::string>{"good_job", jobs::kTtlCleanup}));

  auto summary = scheduler_->reload();
  EXPECT_EQ(summary.rejected, 1);
  EXPECT_EQ(summary.unchanged, 2);
}

TEST_F(SchedulerServiceTest, JobWithoutBodyIsRejected) {
  configs_->upsert(intervalJob("orphan", 1, "hours"));
  startScheduler();

  EXPECT_FALSE(scheduler_->nextFireTime("orphan").has_value());
  EXPECT_EQ(scheduler_->reload().rejected, 1);
}

TEST_F(SchedulerServiceTest, ReloadAppliesOnlyTheDiff) {
  registerNoop("refresh");
  registerNoop("nightly");
  registerNoop("weekly");
  configs_->upsert(intervalJob("refresh", 1, "hours"));
  configs_->upsert(cronJob("nightly", "*", 3, 0));

  startScheduler();
  ASSERT_EQ(scheduler_->getScheduledJobs().size(), 3u);
  const auto nightlyFire = scheduler_->nextFireTime("nightly");

  auto same = scheduler_->reload();
  EXPECT_EQ(same.unchanged, 3);
  EXPECT_EQ(same.added + same.removed + same.rearmed + same.rejected, 0);

  JobConfigurationPatch every2h;
  every2h.intervalValue = 2;
  ASSERT_TRUE(configs_->update("refresh", every2h).has_value());
  auto rearmed = scheduler_->reload();
  EXPECT_EQ(rearmed.rearmed, 1);
  EXPECT_EQ(rearmed.unchanged, 2);
  EXPECT_EQ(scheduler_->nextFireTime("nightly"), nightlyFire);

  JobConfigurationPatch disable;
  disable.enabled = false;
  configs_->update("nightly", disable);
  configs_->upsert(cronJob("weekly", "sun", 8, 0));
  auto changed = scheduler_->reload();
  EXPECT_EQ(changed.removed, 1);
  EXPECT_EQ(changed.added, 1);
  EXPECT_EQ(changed.unchanged, 2);

  EXPECT_EQ(scheduledNames(),
            (std::vector<std::string>{jobs::kTtlCleanup, "refresh", "weekly"}));

  auto json = changed.toJson();
  EXPECT_EQ(json["removed"], 1);
  EXPECT_EQ(json["added"], 1);
}

TEST_F(SchedulerServiceTest, DescriptionOnlyChangeKeepsTimer) {
  registerNoop("refresh");
  configs_->upsert(intervalJob("refresh", 1, "hours"));
  startScheduler();
  const auto before = scheduler_->nextFireTime("refresh");

  JobConfigurationPatch patch;
  patch.description = "Quote refresh";
  configs_->update("refresh", patch);
  auto summary = scheduler_->reload();

  EXPECT_EQ(summary.unchanged, 2);
  EXPECT_EQ(summary.rearmed, 0);
  EXPECT_EQ(scheduler_->nextFireTime("refresh"), before);
}

TEST_F(SchedulerServiceTest, InvalidUpdateDisarmsOldTimer) {
  registerNoop("refresh");
  configs_->upsert(intervalJob("refresh", 1, "hours"));
  startScheduler();
  ASSERT_TRUE(scheduler_->nextFireTime("refresh").has_value());

  JobConfigurationPatch broken;
  broken.intervalUnit = std::string("fortnights");
  configs_->update("refresh", broken);
  auto summary = scheduler_->reload();

  EXPECT_EQ(summary.rejected, 1);
  EXPECT_FALSE(scheduler_->nextFireTime("refresh").has_value());
}

TEST_F(SchedulerServiceTest, ReloadBeforeStartDoesNothing) {
  scheduler_ = std::make_unique<SchedulerService>(schedulerConfig_, MarketHours(),
                                                  configs_, runner_);
  EXPECT_FALSE(scheduler_->isRunning());

  auto summary = scheduler_->reload();
  EXPECT_EQ(summary.added + summary.removed + summary.rearmed + summary.unchanged +
                summary.rejected,
            0);
  EXPECT_TRUE(scheduler_->getScheduledJobs().empty());
}

TEST_F(SchedulerServiceTest, StopAndRestart) {
  registerNoop("refresh");
  configs_->upsert(intervalJob("refresh", 1, "hours"));
  startScheduler();

  scheduler_->stop();
  EXPECT_FALSE(scheduler_->isRunning());
  EXPECT_TRUE(scheduler_->getScheduledJobs().empty());
  scheduler_->stop();

  scheduler_->start();
  EXPECT_TRUE(scheduler_->isRunning());
  EXPECT_EQ(scheduler_->getScheduledJobs().size(), 2u);
}

TEST_F(SchedulerServiceTest, MarketGate) {
  scheduler_ = std::make_unique<SchedulerService>(schedulerConfig_, MarketHours(),
                                                  configs_, runner_);
  auto gated = intervalJob("market_data_refresh", 30, "minutes");
  gated.onlyMarketHours = true;
  gated.marketStartHour = 9;
  gated.marketEndHour = 16;

  // Monday 2024-01-08 10:00 CST
  EXPECT_TRUE(scheduler_->passesMarketGate(gated, stringToTimePoint("2024-01-08 16:00:00")));
  // Monday 2024-01-08 17:00 CST
  EXPECT_FALSE(scheduler_->passesMarketGate(gated, stringToTimePoint("2024-01-08 23:00:00")));
  // Saturday
  EXPECT_FALSE(scheduler_->passesMarketGate(gated, stringToTimePoint("2024-01-06 16:00:00")));

  gated.marketStartHour = 12;
  EXPECT_FALSE(scheduler_->passesMarketGate(gated, stringToTimePoint("2024-01-08 16:00:00")));

  auto ungated = intervalJob("token_validation", 6, "hours");
  EXPECT_TRUE(scheduler_->passesMarketGate(ungated, stringToTimePoint("2024-01-06 16:00:00")));
}

TEST_F(SchedulerServiceTest, RequiresCollaborators) {
  EXPECT_THROW(SchedulerService(schedulerConfig_, MarketHours(), nullptr, runner_),
               SystemException);
}

} // namespace mdjobs
