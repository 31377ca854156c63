#include "job_trigger.hpp"
#include "job_exceptions.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace mdjobs {

namespace {

const std::array<const char *, 7> kDayAbbrev = {"sun", "mon", "tue", "wed",
                                                "thu", "fri", "sat"};
const std::array<const char *, 7> kDayNames = {
    "Sunday", "Monday", "Tuesday", "Wednesday", "Thursday", "Friday", "Saturday"};

std::string lower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return text;
}

std::string trim(const std::string &text) {
  const auto first = text.find_first_not_of(" \t");
  if (first == std::string::npos) {
    return "";
  }
  const auto last = text.find_last_not_of(" \t");
  return text.substr(first, last - first + 1);
}

ValidationException scheduleError(const std::string &message,
                                  const std::string &field,
                                  const std::string &value) {
  return ValidationException(ErrorCode::CONFIGURATION_ERROR, message, field,
                             value);
}

int dayNumber(const std::string &name, const std::string &field) {
  const std::string key = lower(trim(name)).substr(0, 3);
  for (size_t i = 0; i < kDayAbbrev.size(); ++i) {
    if (key == kDayAbbrev[i]) {
      return static_cast<int>(i);
    }
  }
  throw scheduleError("Unknown day of week: " + name, "cron_day_of_week",
                      field);
}

std::string clockText(int hour, int minute) {
  std::ostringstream oss;
  oss << std::setfill('0') << std::setw(2) << hour << ":" << std::setw(2)
      << minute;
  return oss.str();
}

std::string unitLabel(int value, const std::string &unit) {
  std::string singular = lower(unit);
  if (!singular.empty() && singular.back() == 's') {
    singular.pop_back();
  }
  if (value == 1) {
    return "Every " + singular;
  }
  return "Every " + std::to_string(value) + " " + singular + "s";
}

} // namespace

std::set<int> parseDayOfWeek(const std::string &field) {
  const std::string text = trim(field);
  if (text.empty() || text == "*") {
    return {0, 1, 2, 3, 4, 5, 6};
  }

  std::set<int> days;
  std::stringstream ss(text);
  std::string part;
  while (std::getline(ss, part, ',')) {
    part = trim(part);
    if (part.empty()) {
      throw scheduleError("Empty day-of-week entry", "cron_day_of_week", field);
    }
    const auto dash = part.find('-');
    if (dash == std::string::npos) {
      days.insert(dayNumber(part, field));
      continue;
    }
    int from = dayNumber(part.substr(0, dash), field);
    const int to = dayNumber(part.substr(dash + 1), field);
    days.insert(from);
    while (from != to) {
      from = (from + 1) % 7;
      days.insert(from);
    }
  }
  return days;
}

std::chrono::seconds intervalPeriod(int value, const std::string &unit) {
  if (value <= 0) {
    throw scheduleError("Interval value must be positive", "interval_value",
                        std::to_string(value));
  }
  std::string key = lower(trim(unit));
  if (!key.empty() && key.back() != 's') {
    key += "s";
  }
  if (key == "seconds") {
    return std::chrono::seconds(value);
  }
  if (key == "minutes") {
    return std::chrono::minutes(value);
  }
  if (key == "hours") {
    return std::chrono::hours(value);
  }
  if (key == "days") {
    return std::chrono::hours(24 * value);
  }
  throw scheduleError("Unknown interval unit: " + unit, "interval_unit", unit);
}

std::unique_ptr<JobTrigger>
JobTrigger::fromConfiguration(const JobConfiguration &config,
                              const MarketHours &hours, TimePoint anchor) {
  if (config.onlyMarketHours) {
    const int start = config.marketStartHour.value_or(hours.config().openHour);
    const int end = config.marketEndHour.value_or(hours.config().closeHour);
    if (start < 0 || end > 24 || start >= end) {
      throw scheduleError("Invalid market hour window for " + config.jobName,
                          "market_start_hour",
                          std::to_string(start) + "-" + std::to_string(end));
    }
  }

  if (config.scheduleKind == ScheduleKind::INTERVAL) {
    if (!config.intervalValue || !config.intervalUnit) {
      throw scheduleError("Interval schedule for " + config.jobName +
                              " needs interval_value and interval_unit",
                          "interval_value", "");
    }
    auto period = intervalPeriod(*config.intervalValue, *config.intervalUnit);
    std::string description =
        unitLabel(*config.intervalValue, *config.intervalUnit);
    if (config.onlyMarketHours) {
      description += " (market hours only)";
    }
    return std::make_unique<IntervalTrigger>(period, anchor, description);
  }

  if (!config.cronHour) {
    throw scheduleError("Cron schedule for " + config.jobName +
                            " needs cron_hour",
                        "cron_hour", "");
  }
  const int hour = *config.cronHour;
  const int minute = config.cronMinute.value_or(0);
  if (hour < 0 || hour > 23) {
    throw scheduleError("Cron hour out of range", "cron_hour",
                        std::to_string(hour));
  }
  if (minute < 0 || minute > 59) {
    throw scheduleError("Cron minute out of range", "cron_minute",
                        std::to_string(minute));
  }
  return std::make_unique<CronTrigger>(
      parseDayOfWeek(config.cronDayOfWeek.value_or("*")), hour, minute, hours);
}

IntervalTrigger::IntervalTrigger(std::chrono::seconds period, TimePoint anchor,
                                 std::string description)
    : period_(period), anchor_(anchor), description_(std::move(description)) {
  if (period_.count() <= 0) {
    throw scheduleError("Interval period must be positive", "interval_value",
                        std::to_string(period_.count()));
  }
}

TimePoint IntervalTrigger::nextFireTime(TimePoint after) const {
  if (after < anchor_) {
    return anchor_;
  }
  const auto elapsed = after - anchor_;
  const auto periods = elapsed / period_ + 1;
  return anchor_ + periods * period_;
}

CronTrigger::CronTrigger(std::set<int> daysOfWeek, int hour, int minute,
                         MarketHours hours)
    : days_(std::move(daysOfWeek)), hour_(hour), minute_(minute),
      hours_(std::move(hours)) {
  if (days_.empty()) {
    throw scheduleError("Cron schedule has no days", "cron_day_of_week", "");
  }
}

CronTrigger CronTrigger::daily(int hour, int minute, MarketHours hours) {
  return CronTrigger({0, 1, 2, 3, 4, 5, 6}, hour, minute, std::move(hours));
}

TimePoint CronTrigger::nextFireTime(TimePoint after) const {
  const MarketTime local = hours_.toMarketTime(after);
  for (int offset = 0; offset <= 8; ++offset) {
    const auto day = local.date + boost::gregorian::days(offset);
    if (days_.count(day.day_of_week().as_number()) == 0) {
      continue;
    }
    const TimePoint candidate = hours_.fromMarketTime(day, hour_, minute_);
    if (candidate > after) {
      return candidate;
    }
  }
  // unreachable with a non-empty day set
  return after + std::chrono::hours(24 * 7);
}

std::string CronTrigger::describe() const {
  const std::string at = " at " + clockText(hour_, minute_);
  if (days_.size() == 7) {
    return "Daily" + at;
  }
  if (days_ == std::set<int>{1, 2, 3, 4, 5}) {
    return "Weekdays" + at;
  }
  if (days_ == std::set<int>{0, 6}) {
    return "Weekends" + at;
  }
  if (days_.size() == 1) {
    return std::string(kDayNames[static_cast<size_t>(*days_.begin())]) + at;
  }

  std::string names;
  for (int day : days_) {
    if (!names.empty()) {
      names += ", ";
    }
    names += std::string(kDayNames[static_cast<size_t>(day)]).substr(0, 3);
  }
  return names + at;
}

} // namespace mdjobs
