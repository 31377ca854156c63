#pragma once

#include "config_manager.hpp"
#include "job_config_store.hpp"
#include "job_runner.hpp"
#include "job_trigger.hpp"
#include "market_hours.hpp"
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/thread_pool.hpp>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace mdjobs {

struct ScheduledJob {
  std::string jobName;
  std::string schedule;
  bool onlyMarketHours = false;
  TimePoint nextFireTime{};

  nlohmann::json toJson() const;
};

struct ReloadSummary {
  int added = 0;
  int removed = 0;
  int rearmed = 0;
  int unchanged = 0;
  int rejected = 0;

  nlohmann::json toJson() const;
};

/**
 * Clock-driven dispatcher for the stored job configurations.
 *
 * Timers live on one io_context thread; fired job bodies run on a separate
 * worker pool through JobRunner, which owns the per-job no-overlap guard.
 * Configuration changes are picked up by reload(), which re-arms only the
 * jobs whose schedule changed. The retention job is armed daily even when
 * it has no stored configuration.
 */
class SchedulerService {
public:
  SchedulerService(SchedulerConfig config, MarketHours hours,
                   std::shared_ptr<JobConfigStore> configs,
                   std::shared_ptr<JobRunner> runner);
  ~SchedulerService();

  SchedulerService(const SchedulerService &) = delete;
  SchedulerService &operator=(const SchedulerService &) = delete;

  void start();
  ReloadSummary reload();
  // Cancels every timer and waits for job bodies already dispatched
  void stop();
  bool isRunning() const;

  std::vector<ScheduledJob> getScheduledJobs() const;
  std::optional<TimePoint> nextFireTime(const std::string &jobName) const;

  // True when a market-hours gated job may run at `now`
  bool passesMarketGate(const JobConfiguration &config, TimePoint now) const;

private:
  struct ArmedJob {
    JobConfiguration config;
    std::unique_ptr<JobTrigger> trigger;
    std::unique_ptr<boost::asio::steady_timer> timer;
    TimePoint nextFire{};
    uint64_t generation = 0;
  };

  using WorkGuard =
      boost::asio::executor_work_guard<boost::asio::io_context::executor_type>;

  SchedulerConfig config_;
  MarketHours hours_;
  std::shared_ptr<JobConfigStore> configs_;
  std::shared_ptr<JobRunner> runner_;

  boost::asio::io_context ioc_;
  std::unique_ptr<WorkGuard> work_;
  std::thread dispatcher_;
  std::unique_ptr<boost::asio::thread_pool> jobPool_;

  mutable std::mutex mutex_;
  std::map<std::string, ArmedJob> armed_;
  uint64_t nextGeneration_ = 1;
  bool running_ = false;

  // Stored configurations plus the implicit retention job
  std::vector<JobConfiguration> desiredConfigurations();
  bool arm(const JobConfiguration &config, TimePoint now);
  void scheduleTimer(ArmedJob &job);
  void onTimer(const std::string &jobName, uint64_t generation);
  void dispatch(const JobConfiguration &config, TimePoint nextRunAt);
  void disarmAll();
};

} // namespace mdjobs
