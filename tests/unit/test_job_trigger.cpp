#include "job_config_store.hpp"
#include "job_exceptions.hpp"
#include "job_trigger.hpp"
#include "logger.hpp"
#include <gtest/gtest.h>
#include <map>

namespace mdjobs {

class JobTriggerTest : public ::testing::Test {
protected:
  void SetUp() override {
    LogConfig config;
    config.level = LogLevel::DEBUG;
    config.consoleOutput = true;
    config.fileOutput = false;
    Logger::getInstance().configure(config);

    for (const auto &job : defaultJobConfigurations()) {
      defaults_[job.jobName] = job;
    }
  }

  static TimePoint utc(const std::string &text) {
    return stringToTimePoint(text);
  }

  MarketHours hours_;
  std::map<std::string, JobConfiguration> defaults_;
};

TEST_F(JobTriggerTest, ParsesDayOfWeekRangesAndLists) {
  EXPECT_EQ(parseDayOfWeek("mon-fri"), (std::set<int>{1, 2, 3, 4, 5}));
  EXPECT_EQ(parseDayOfWeek("*"), (std::set<int>{0, 1, 2, 3, 4, 5, 6}));
  EXPECT_EQ(parseDayOfWeek(""), (std::set<int>{0, 1, 2, 3, 4, 5, 6}));
  EXPECT_EQ(parseDayOfWeek("mon,wed"), (std::set<int>{1, 3}));
  EXPECT_EQ(parseDayOfWeek("sat-mon"), (std::set<int>{6, 0, 1}));
  EXPECT_EQ(parseDayOfWeek("Tuesday"), (std::set<int>{2}));
  EXPECT_EQ(parseDayOfWeek(" SUN "), (std::set<int>{0}));
}

TEST_F(JobTriggerTest, RejectsUnknownDays) {
  EXPECT_THROW(parseDayOfWeek("xyz"), ValidationException);
  EXPECT_THROW(parseDayOfWeek("mon,,fri"), ValidationException);
}

TEST_F(JobTriggerTest, IntervalPeriods) {
  EXPECT_EQ(intervalPeriod(30, "minutes"), std::chrono::seconds(1800));
  EXPECT_EQ(intervalPeriod(1, "hour"), std::chrono::seconds(3600));
  EXPECT_EQ(intervalPeriod(6, "Hours"), std::chrono::seconds(6 * 3600));
  EXPECT_EQ(intervalPeriod(2, "days"), std::chrono::seconds(2 * 86400));
  EXPECT_EQ(intervalPeriod(5, "seconds"), std::chrono::seconds(5));

  EXPECT_THROW(intervalPeriod(0, "minutes"), ValidationException);
  EXPECT_THROW(intervalPeriod(-1, "minutes"), ValidationException);
  EXPECT_THROW(intervalPeriod(5, "weeks"), ValidationException);
}

TEST_F(JobTriggerTest, IntervalFiresOnAnchorGrid) {
  const auto anchor = utc("2024-01-08 12:00:00");
  IntervalTrigger trigger(std::chrono::minutes(30), anchor, "Every 30 minutes");

  EXPECT_EQ(trigger.nextFireTime(anchor - std::chrono::minutes(5)), anchor);
  EXPECT_EQ(trigger.nextFireTime(anchor), utc("2024-01-08 12:30:00"));
  EXPECT_EQ(trigger.nextFireTime(utc("2024-01-08 12:30:00")),
            utc("2024-01-08 13:00:00"));
  EXPECT_EQ(trigger.nextFireTime(utc("2024-01-08 12:45:00")),
            utc("2024-01-08 13:00:00"));
  EXPECT_EQ(trigger.describe(), "Every 30 minutes");
}

TEST_F(JobTriggerTest, CronSameDayWhenStillAhead) {
  CronTrigger trigger(parseDayOfWeek("mon-fri"), 17, 30, hours_);
  // Monday 06:00 CST -> Monday 17:30 CST
  EXPECT_EQ(trigger.nextFireTime(utc("2024-01-08 12:00:00")),
            utc("2024-01-08 23:30:00"));
}

TEST_F(JobTriggerTest, CronIsStrictlyAfter) {
  CronTrigger trigger(parseDayOfWeek("mon-fri"), 17, 30, hours_);
  // Exactly at Monday 17:30 CST -> Tuesday
  EXPECT_EQ(trigger.nextFireTime(utc("2024-01-08 23:30:00")),
            utc("2024-01-09 23:30:00"));
}

TEST_F(JobTriggerTest, CronSkipsWeekend) {
  CronTrigger trigger(parseDayOfWeek("mon-fri"), 17, 30, hours_);
  // Friday 17:40 CST -> Monday 17:30 CST
  EXPECT_EQ(trigger.nextFireTime(utc("2024-01-05 23:40:00")),
            utc("2024-01-08 23:30:00"));
}

TEST_F(JobTriggerTest, CronFollowsDaylightSaving) {
  auto daily = CronTrigger::daily(3, 0, hours_);
  // Before the March 10 2024 switch 03:00 CST is 09:00 UTC, after it 08:00 UTC
  EXPECT_EQ(daily.nextFireTime(utc("2024-03-08 12:00:00")),
            utc("2024-03-09 09:00:00"));
  EXPECT_EQ(daily.nextFireTime(utc("2024-03-10 12:00:00")),
            utc("2024-03-11 08:00:00"));
}

TEST_F(JobTriggerTest, CronNeedsDays) {
  EXPECT_THROW(CronTrigger({}, 3, 0, hours_), ValidationException);
}

TEST_F(JobTriggerTest, DescribesDefaultSchedules) {
  const auto anchor = utc("2024-01-08 12:00:00");
  auto describe = [&](const std::string &name) {
    return JobTrigger::fromConfiguration(defaults_.at(name), hours_, anchor)
        ->describe();
  };

  EXPECT_EQ(describe("eod_scan"), "Weekdays at 17:30");
  EXPECT_EQ(describe("universe_refresh"), "Sunday at 08:00");
  EXPECT_EQ(describe("market_data_refresh"),
            "Every 30 minutes (market hours only)");
  EXPECT_EQ(describe("token_validation"), "Every 6 hours");
  EXPECT_EQ(describe("tech_analysis"), "Weekdays at 18:00");
}

TEST_F(JobTriggerTest, DescribesOtherShapes) {
  EXPECT_EQ(CronTrigger::daily(3, 0, hours_).describe(), "Daily at 03:00");
  EXPECT_EQ(CronTrigger(parseDayOfWeek("sat,sun"), 9, 5, hours_).describe(),
            "Weekends at 09:05");
  EXPECT_EQ(CronTrigger(parseDayOfWeek("mon,wed,fri"), 7, 0, hours_).describe(),
            "Mon, Wed, Fri at 07:00");

  JobConfiguration hourly;
  hourly.jobName = "hourly";
  hourly.intervalValue = 1;
  hourly.intervalUnit = "hours";
  EXPECT_EQ(JobTrigger::fromConfiguration(hourly, hours_, Clock::now())
                ->describe(),
            "Every hour");
}

TEST_F(JobTriggerTest, CronConfigurationDefaultsToEveryDay) {
  JobConfiguration config;
  config.jobName = "nightly";
  config.scheduleKind = ScheduleKind::CRON;
  config.cronHour = 2;
  auto trigger = JobTrigger::fromConfiguration(config, hours_, Clock::now());
  EXPECT_EQ(trigger->describe(), "Daily at 02:00");
}

TEST_F(JobTriggerTest, RejectsInvalidConfigurations) {
  const auto anchor = Clock::now();

  JobConfiguration badHour = defaults_.at("eod_scan");
  badHour.cronHour = 25;
  EXPECT_THROW(JobTrigger::fromConfiguration(badHour, hours_, anchor),
               ValidationException);

  JobConfiguration badMinute = defaults_.at("eod_scan");
  badMinute.cronMinute = 60;
  EXPECT_THROW(JobTrigger::fromConfiguration(badMinute, hours_, anchor),
               ValidationException);

  JobConfiguration noHour = defaults_.at("eod_scan");
  noHour.cronHour.reset();
  EXPECT_THROW(JobTrigger::fromConfiguration(noHour, hours_, anchor),
               ValidationException);

  JobConfiguration noUnit = defaults_.at("token_validation");
  noUnit.intervalUnit.reset();
  EXPECT_THROW(JobTrigger::fromConfiguration(noUnit, hours_, anchor),
               ValidationException);

  JobConfiguration badDays = defaults_.at("eod_scan");
  badDays.cronDayOfWeek = "someday";
  EXPECT_THROW(JobTrigger::fromConfiguration(badDays, hours_, anchor),
               ValidationException);

  JobConfiguration invertedWindow = defaults_.at("market_data_refresh");
  invertedWindow.marketStartHour = 16;
  invertedWindow.marketEndHour = 9;
  EXPECT_THROW(JobTrigger::fromConfiguration(invertedWindow, hours_, anchor),
               ValidationException);
}

} // namespace mdjobs
