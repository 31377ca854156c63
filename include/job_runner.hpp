#pragma once

#include "execution_tracker.hpp"
#include "job_lock.hpp"
#include "job_models.hpp"
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mdjobs {

class ChainManager;

enum class TriggerSource { SCHEDULED, MANUAL, CHAINED };

std::string triggerSourceToString(TriggerSource source);

struct RunRequest {
    TriggerSource source = TriggerSource::MANUAL;
    std::optional<DateRange> dateRange;
    std::optional<TimePoint> nextRunAt;
};

struct JobContext {
    std::string jobName;
    int64_t runId = 0;
    TriggerSource source = TriggerSource::MANUAL;
    std::optional<DateRange> dateRange;
};

// Returns the number of records processed; throws to fail the run
using JobBody = std::function<int64_t(const JobContext&)>;

struct RunResult {
    std::string jobName;
    std::optional<int64_t> runId;
    RunStatus status = RunStatus::COMPLETED;
    int64_t recordsProcessed = 0;
    std::string errorMessage;
    bool chained = false;
};

/**
 * Single entry point for every run of a registered job.
 *
 * Each run holds the job's slot in the shared lock registry, records a
 * tracked execution row, prunes history, and on success hands off to the
 * chain manager after the slot is released. A scheduled fire that finds
 * the slot taken records a skipped row; manual and chained requests fail
 * with JOB_ALREADY_RUNNING.
 */
class JobRunner {
public:
    JobRunner(std::shared_ptr<ExecutionTracker> tracker,
              std::shared_ptr<JobLockRegistry> locks);

    void registerJob(const std::string& jobName, JobBody body);
    bool hasJob(const std::string& jobName) const;
    std::vector<std::string> registeredJobs() const;

    void setChainManager(std::shared_ptr<ChainManager> chains);

    RunResult runJob(const std::string& jobName, const RunRequest& request = {});

    ExecutionTracker& tracker() { return *tracker_; }
    JobLockRegistry& locks() { return *locks_; }

private:
    std::shared_ptr<ExecutionTracker> tracker_;
    std::shared_ptr<JobLockRegistry> locks_;
    std::shared_ptr<ChainManager> chains_;

    mutable std::mutex registryMutex_;
    std::map<std::string, JobBody> bodies_;

    JobBody findBody(const std::string& jobName) const;
    void pruneQuietly(const std::string& jobName);
};

} // namespace mdjobs
