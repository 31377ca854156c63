#include "job_runner.hpp"
#include "chain_manager.hpp"
#include "job_exceptions.hpp"
#include "logger.hpp"

namespace mdjobs {

std::string triggerSourceToString(TriggerSource source) {
    switch (source) {
    case TriggerSource::SCHEDULED:
        return "scheduled";
    case TriggerSource::MANUAL:
        return "manual";
    case TriggerSource::CHAINED:
        return "chained";
    }
    return "manual";
}

JobRunner::JobRunner(std::shared_ptr<ExecutionTracker> tracker,
                     std::shared_ptr<JobLockRegistry> locks)
    : tracker_(std::move(tracker)), locks_(std::move(locks)) {
    if (!tracker_ || !locks_) {
        throw SystemException(ErrorCode::CONFIGURATION_ERROR,
                              "JobRunner requires a tracker and a lock registry",
                              "JobRunner");
    }
}

void JobRunner::registerJob(const std::string& jobName, JobBody body) {
    std::lock_guard<std::mutex> lock(registryMutex_);
    bodies_[jobName] = std::move(body);
    MDJOBS_LOG_DEBUG("Registered job body {}", jobName);
}

bool JobRunner::hasJob(const std::string& jobName) const {
    std::lock_guard<std::mutex> lock(registryMutex_);
    return bodies_.count(jobName) > 0;
}

std::vector<std::string> JobRunner::registeredJobs() const {
    std::lock_guard<std::mutex> lock(registryMutex_);
    std::vector<std::string> names;
    names.reserve(bodies_.size());
    for (const auto& [name, body] : bodies_) {
        names.push_back(name);
    }
    return names;
}

void JobRunner::setChainManager(std::shared_ptr<ChainManager> chains) {
    chains_ = std::move(chains);
}

JobBody JobRunner::findBody(const std::string& jobName) const {
    std::lock_guard<std::mutex> lock(registryMutex_);
    auto it = bodies_.find(jobName);
    if (it == bodies_.end()) {
        throw BusinessException(ErrorCode::JOB_NOT_FOUND,
                                "Unknown job: " + jobName, "runJob",
                                {{"job_name", jobName}});
    }
    return it->second;
}

RunResult JobRunner::runJob(const std::string& jobName, const RunRequest& request) {
    JobBody body = findBody(jobName);

    RunResult result;
    result.jobName = jobName;

    JobLockGuard slot = locks_->tryAcquire(jobName);
    if (!slot) {
        if (request.source == TriggerSource::SCHEDULED) {
            MDJOBS_LOG_WARN("Job {} is still running, skipping scheduled fire", jobName);
            result.runId = tracker_->recordSkipped(jobName, "Previous run still in progress");
            result.status = RunStatus::SKIPPED;
            pruneQuietly(jobName);
            return result;
        }
        throw BusinessException(ErrorCode::JOB_ALREADY_RUNNING,
                                "Job " + jobName + " is already running", "runJob",
                                {{"job_name", jobName},
                                 {"trigger", triggerSourceToString(request.source)}});
    }

    const int64_t runId = tracker_->begin(jobName, request.nextRunAt);
    result.runId = runId;

    JobContext context;
    context.jobName = jobName;
    context.runId = runId;
    context.source = request.source;
    context.dateRange = request.dateRange;

    MDJOBS_LOG_INFO("Starting {} run {} of {}", triggerSourceToString(request.source),
                    runId, jobName);
    auto started = std::chrono::steady_clock::now();

    try {
        result.recordsProcessed = body(context);
        tracker_->complete(runId, result.recordsProcessed);
        result.status = RunStatus::COMPLETED;
    } catch (const std::exception& e) {
        const auto* jobsError = asException<JobsException>(e);
        result.status = RunStatus::FAILED;
        result.errorMessage = e.what();
        MDJOBS_LOG_ERROR("Job {} run {} failed: {}", jobName, runId,
                         jobsError ? jobsError->toLogString() : std::string(e.what()));
        try {
            tracker_->fail(runId, result.errorMessage);
        } catch (const JobsException& failError) {
            MDJOBS_LOG_ERROR("Could not record failure of run {}: {}", runId,
                             failError.toLogString());
        }
    }

    auto elapsed = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - started);
    JobRunnerLogger::logPerformance(jobName, elapsed.count(),
                                    {{"run_id", std::to_string(runId)},
                                     {"status", runStatusToString(result.status)}});

    pruneQuietly(jobName);
    slot.release();

    if (result.status == RunStatus::COMPLETED && chains_) {
        result.chained = chains_->triggerNext(jobName);
    }
    return result;
}

void JobRunner::pruneQuietly(const std::string& jobName) {
    try {
        tracker_->pruneHistory(jobName);
    } catch (const JobsException& e) {
        MDJOBS_LOG_WARN("History pruning for {} failed: {}", jobName, e.toLogString());
    }
}

} // namespace mdjobs
