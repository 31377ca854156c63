#include "scheduler_service.hpp"
#include "job_catalog.hpp"
#include "job_exceptions.hpp"
#include "logger.hpp"
#include <algorithm>
#include <boost/asio/post.hpp>
#include <boost/system/error_code.hpp>
#include <set>

namespace mdjobs {

nlohmann::json ScheduledJob::toJson() const {
  return {{"job_name", jobName},
          {"schedule", schedule},
          {"only_market_hours", onlyMarketHours},
          {"next_run_time", timePointToString(nextFireTime)}};
}

nlohmann::json ReloadSummary::toJson() const {
  return {{"added", added},
          {"removed", removed},
          {"rearmed", rearmed},
          {"unchanged", unchanged},
          {"rejected", rejected}};
}

SchedulerService::SchedulerService(SchedulerConfig config, MarketHours hours,
                                   std::shared_ptr<JobConfigStore> configs,
                                   std::shared_ptr<JobRunner> runner)
    : config_(std::move(config)), hours_(std::move(hours)),
      configs_(std::move(configs)), runner_(std::move(runner)) {
  if (!configs_ || !runner_) {
    throw SystemException(ErrorCode::CONFIGURATION_ERROR,
                          "SchedulerService requires a configuration store "
                          "and a job runner",
                          "SchedulerService");
  }
}

SchedulerService::~SchedulerService() { stop(); }

void SchedulerService::start() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
      SCHED_LOG_WARN("Scheduler already running");
      return;
    }
    running_ = true;
    jobPool_ = std::make_unique<boost::asio::thread_pool>(
        static_cast<size_t>(std::max(1, config_.jobThreads)));
    ioc_.restart();
    work_ = std::make_unique<WorkGuard>(boost::asio::make_work_guard(ioc_));
    dispatcher_ = std::thread([this]() {
      for (;;) {
        try {
          ioc_.run();
          break;
        } catch (const std::exception &e) {
          SCHED_LOG_ERROR("Timer handler failed: {}", e.what());
        }
      }
    });
  }

  ReloadSummary summary = reload();
  SCHED_LOG_INFO("Scheduler started: {} jobs armed, {} rejected",
                 summary.added, summary.rejected);
}

void SchedulerService::stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_) {
      return;
    }
    running_ = false;
    disarmAll();
  }

  work_.reset();
  ioc_.stop();
  if (dispatcher_.joinable()) {
    dispatcher_.join();
  }
  if (jobPool_) {
    jobPool_->join();
    jobPool_.reset();
  }
  SCHED_LOG_INFO("Scheduler stopped");
}

bool SchedulerService::isRunning() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return running_;
}

std::vector<JobConfiguration> SchedulerService::desiredConfigurations() {
  std::vector<JobConfiguration> desired;
  bool hasCleanup = false;
  for (auto &config : configs_->listAll()) {
    if (!config.enabled) {
      continue;
    }
    if (config.jobName == jobs::kTtlCleanup) {
      hasCleanup = true;
    }
    desired.push_back(std::move(config));
  }

  if (!hasCleanup) {
    JobConfiguration cleanup;
    cleanup.jobName = jobs::kTtlCleanup;
    cleanup.description = "Execution history and scan retention";
    cleanup.scheduleKind = ScheduleKind::CRON;
    cleanup.cronDayOfWeek = "*";
    cleanup.cronHour = config_.ttlCleanupHour;
    cleanup.cronMinute = config_.ttlCleanupMinute;
    desired.push_back(std::move(cleanup));
  }
  return desired;
}

ReloadSummary SchedulerService::reload() {
  ReloadSummary summary;
  std::vector<JobConfiguration> desired = desiredConfigurations();

  std::lock_guard<std::mutex> lock(mutex_);
  if (!running_) {
    SCHED_LOG_WARN("Scheduler not running; configuration applies at start");
    return summary;
  }

  const TimePoint now = Clock::now();
  std::set<std::string> wanted;

  for (const auto &config : desired) {
    if (!runner_->hasJob(config.jobName)) {
      SCHED_LOG_WARN("No job body registered for {}, not scheduling",
                     config.jobName);
      summary.rejected++;
      continue;
    }

    auto it = armed_.find(config.jobName);
    const bool existed = it != armed_.end();
    if (existed && it->second.config.sameSchedule(config)) {
      it->second.config = config;
      wanted.insert(config.jobName);
      summary.unchanged++;
      continue;
    }

    if (existed) {
      it->second.timer->cancel();
      armed_.erase(it);
    }

    if (arm(config, now)) {
      wanted.insert(config.jobName);
      if (existed) {
        summary.rearmed++;
      } else {
        summary.added++;
      }
    } else {
      summary.rejected++;
    }
  }

  for (auto it = armed_.begin(); it != armed_.end();) {
    if (wanted.count(it->first) == 0) {
      SCHED_LOG_INFO("Disarming {}", it->first);
      it->second.timer->cancel();
      it = armed_.erase(it);
      summary.removed++;
    } else {
      ++it;
    }
  }

  SCHED_LOG_INFO("Schedules reloaded: {}", summary.toJson().dump());
  return summary;
}

bool SchedulerService::arm(const JobConfiguration &config, TimePoint now) {
  std::unique_ptr<JobTrigger> trigger;
  try {
    trigger = JobTrigger::fromConfiguration(config, hours_, now);
  } catch (const ValidationException &e) {
    SCHED_LOG_ERROR("Invalid schedule for {}, job skipped: {}", config.jobName,
                    e.toLogString());
    return false;
  }

  ArmedJob job;
  job.config = config;
  job.nextFire = trigger->nextFireTime(now);
  job.trigger = std::move(trigger);
  job.timer = std::make_unique<boost::asio::steady_timer>(ioc_);
  job.generation = nextGeneration_++;

  ArmedJob &stored = armed_[config.jobName];
  stored = std::move(job);
  scheduleTimer(stored);

  SCHED_LOG_INFO("Armed {}: {}, next run {}", config.jobName,
                 stored.trigger->describe(), timePointToString(stored.nextFire));
  return true;
}

void SchedulerService::scheduleTimer(ArmedJob &job) {
  auto delay = job.nextFire - Clock::now();
  if (delay < Clock::duration::zero()) {
    delay = Clock::duration::zero();
  }
  job.timer->expires_after(
      std::chrono::duration_cast<std::chrono::steady_clock::duration>(delay));

  const std::string jobName = job.config.jobName;
  const uint64_t generation = job.generation;
  job.timer->async_wait(
      [this, jobName, generation](const boost::system::error_code &ec) {
        if (ec == boost::asio::error::operation_aborted) {
          return;
        }
        if (ec) {
          SCHED_LOG_ERROR("Timer for {} failed: {}", jobName, ec.message());
          return;
        }
        onTimer(jobName, generation);
      });
}

void SchedulerService::onTimer(const std::string &jobName,
                               uint64_t generation) {
  JobConfiguration config;
  TimePoint followingFire;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = armed_.find(jobName);
    if (!running_ || it == armed_.end() || it->second.generation != generation) {
      return;
    }

    ArmedJob &job = it->second;
    const TimePoint now = Clock::now();
    if (now < job.nextFire) {
      scheduleTimer(job);
      return;
    }

    const TimePoint scheduledFor = job.nextFire;
    job.nextFire = job.trigger->nextFireTime(std::max(now, scheduledFor));
    scheduleTimer(job);

    const auto lateness =
        std::chrono::duration_cast<std::chrono::seconds>(now - scheduledFor);
    if (lateness.count() > config_.misfireGraceSeconds) {
      SCHED_LOG_WARN("Dropping misfired run of {} scheduled for {} ({}s late)",
                     jobName, timePointToString(scheduledFor),
                     lateness.count());
      return;
    }

    config = job.config;
    followingFire = job.nextFire;
  }

  dispatch(config, followingFire);
}

bool SchedulerService::passesMarketGate(const JobConfiguration &config,
                                        TimePoint now) const {
  if (!config.onlyMarketHours) {
    return true;
  }
  if (config.marketStartHour && config.marketEndHour) {
    return hours_.withWindow(*config.marketStartHour, *config.marketEndHour)
        .isOpen(now);
  }
  return hours_.isOpen(now);
}

void SchedulerService::dispatch(const JobConfiguration &config,
                                TimePoint nextRunAt) {
  if (!passesMarketGate(config, Clock::now())) {
    SCHED_LOG_INFO("Skipping {}: outside market hours", config.jobName);
    return;
  }

  const std::string jobName = config.jobName;
  boost::asio::post(*jobPool_, [this, jobName, nextRunAt]() {
    RunRequest request;
    request.source = TriggerSource::SCHEDULED;
    request.nextRunAt = nextRunAt;
    try {
      RunResult result = runner_->runJob(jobName, request);
      SCHED_LOG_DEBUG("Scheduled run of {} ended {}", jobName,
                      runStatusToString(result.status));
    } catch (const JobsException &e) {
      SCHED_LOG_ERROR("Scheduled run of {} did not start: {}", jobName,
                      e.toLogString());
    } catch (const std::exception &e) {
      SCHED_LOG_ERROR("Scheduled run of {} did not start: {}", jobName,
                      e.what());
    }
  });
}

void SchedulerService::disarmAll() {
  for (auto &entry : armed_) {
    entry.second.timer->cancel();
  }
  armed_.clear();
}

std::vector<ScheduledJob> SchedulerService::getScheduledJobs() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<ScheduledJob> scheduled;
  scheduled.reserve(armed_.size());
  for (const auto &entry : armed_) {
    ScheduledJob job;
    job.jobName = entry.first;
    job.schedule = entry.second.trigger->describe();
    job.onlyMarketHours = entry.second.config.onlyMarketHours;
    job.nextFireTime = entry.second.nextFire;
    scheduled.push_back(std::move(job));
  }
  return scheduled;
}

std::optional<TimePoint>
SchedulerService::nextFireTime(const std::string &jobName) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = armed_.find(jobName);
  if (it == armed_.end()) {
    return std::nullopt;
  }
  return it->second.nextFire;
}

} // namespace mdjobs
