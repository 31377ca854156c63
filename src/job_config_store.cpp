#include "job_config_store.hpp"

namespace mdjobs {

namespace {

JobConfiguration cronJob(const std::string &name, const std::string &description,
                         const std::string &dayOfWeek, int hour, int minute,
                         bool enabled = true) {
  JobConfiguration config;
  config.jobName = name;
  config.description = description;
  config.enabled = enabled;
  config.scheduleKind = ScheduleKind::CRON;
  config.cronDayOfWeek = dayOfWeek;
  config.cronHour = hour;
  config.cronMinute = minute;
  return config;
}

JobConfiguration intervalJob(const std::string &name,
                             const std::string &description, int value,
                             const std::string &unit) {
  JobConfiguration config;
  config.jobName = name;
  config.description = description;
  config.scheduleKind = ScheduleKind::INTERVAL;
  config.intervalValue = value;
  config.intervalUnit = unit;
  return config;
}

} // namespace

std::vector<JobConfiguration> defaultJobConfigurations() {
  std::vector<JobConfiguration> defaults;
  defaults.push_back(cronJob("universe_refresh",
                             "Refresh the symbol universe from reference data",
                             "sun", 8, 0));
  defaults.push_back(cronJob("eod_scan", "End-of-day price scan for all symbols",
                             "mon-fri", 17, 30));

  auto refresh = intervalJob("market_data_refresh",
                             "Refresh watchlist quotes during market hours", 30,
                             "minutes");
  refresh.onlyMarketHours = true;
  refresh.marketStartHour = 9;
  refresh.marketEndHour = 16;
  defaults.push_back(refresh);

  // The scan chain already runs technical analysis after each EOD scan
  defaults.push_back(cronJob("tech_analysis", "Compute technical indicators",
                             "mon-fri", 18, 0, false));
  defaults.push_back(intervalJob("token_validation",
                                 "Validate the upstream provider token", 6,
                                 "hours"));
  return defaults;
}

std::vector<JobConfiguration> InMemoryJobConfigStore::listAll() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<JobConfiguration> result;
  result.reserve(configs_.size());
  for (const auto &[name, config] : configs_) {
    result.push_back(config);
  }
  return result;
}

std::optional<JobConfiguration>
InMemoryJobConfigStore::get(const std::string &jobName) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = configs_.find(jobName);
  if (it == configs_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void InMemoryJobConfigStore::upsert(const JobConfiguration &config) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto now = Clock::now();
  auto it = configs_.find(config.jobName);
  JobConfiguration stored = config;
  stored.createdAt = it == configs_.end() ? now : it->second.createdAt;
  stored.updatedAt = now;
  configs_[config.jobName] = stored;
}

std::optional<JobConfiguration>
InMemoryJobConfigStore::update(const std::string &jobName,
                               const JobConfigurationPatch &patch) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = configs_.find(jobName);
  if (it == configs_.end()) {
    return std::nullopt;
  }
  patch.applyTo(it->second);
  it->second.updatedAt = Clock::now();
  return it->second;
}

int InMemoryJobConfigStore::seedDefaults(
    const std::vector<JobConfiguration> &defaults) {
  std::lock_guard<std::mutex> lock(mutex_);
  int created = 0;
  auto now = Clock::now();
  for (const auto &config : defaults) {
    if (configs_.count(config.jobName) > 0) {
      continue;
    }
    JobConfiguration stored = config;
    stored.createdAt = now;
    stored.updatedAt = now;
    configs_.emplace(config.jobName, stored);
    ++created;
  }
  return created;
}

} // namespace mdjobs
