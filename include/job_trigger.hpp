#pragma once

#include "job_models.hpp"
#include "market_hours.hpp"
#include <chrono>
#include <memory>
#include <set>
#include <string>

namespace mdjobs {

// Arms a job: computes successive fire times
class JobTrigger {
public:
  virtual ~JobTrigger() = default;

  // First fire time strictly after `after`
  virtual TimePoint nextFireTime(TimePoint after) const = 0;
  virtual std::string describe() const = 0;

  // Throws ValidationException(CONFIGURATION_ERROR) for unusable schedules
  static std::unique_ptr<JobTrigger>
  fromConfiguration(const JobConfiguration &config, const MarketHours &hours,
                    TimePoint anchor);
};

// Fixed period counted from an anchor (the time the job was armed)
class IntervalTrigger : public JobTrigger {
public:
  IntervalTrigger(std::chrono::seconds period, TimePoint anchor,
                  std::string description);

  TimePoint nextFireTime(TimePoint after) const override;
  std::string describe() const override { return description_; }

  std::chrono::seconds period() const { return period_; }

private:
  std::chrono::seconds period_;
  TimePoint anchor_;
  std::string description_;
};

// Day-of-week + wall-clock time in the market zone
class CronTrigger : public JobTrigger {
public:
  CronTrigger(std::set<int> daysOfWeek, int hour, int minute,
              MarketHours hours);

  static CronTrigger daily(int hour, int minute, MarketHours hours);

  TimePoint nextFireTime(TimePoint after) const override;
  std::string describe() const override;

  const std::set<int> &daysOfWeek() const { return days_; }

private:
  std::set<int> days_; // 0 = Sunday
  int hour_;
  int minute_;
  MarketHours hours_;
};

// Accepts "*", names (mon..sun), ranges (mon-fri) and comma lists.
// Returns day numbers with 0 = Sunday.
std::set<int> parseDayOfWeek(const std::string &field);

// "seconds", "minutes", "hours" or "days", singular forms allowed
std::chrono::seconds intervalPeriod(int value, const std::string &unit);

} // namespace mdjobs
