#pragma once

#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

namespace mdjobs {

class JobLockRegistry;

/**
 * @brief RAII ownership of one job name's run slot
 *
 * A default-constructed or moved-from guard owns nothing.
 */
class JobLockGuard {
public:
    JobLockGuard() = default;
    ~JobLockGuard() { release(); }

    JobLockGuard(const JobLockGuard&) = delete;
    JobLockGuard& operator=(const JobLockGuard&) = delete;

    JobLockGuard(JobLockGuard&& other) noexcept;
    JobLockGuard& operator=(JobLockGuard&& other) noexcept;

    bool ownsLock() const { return registry_ != nullptr; }
    explicit operator bool() const { return ownsLock(); }
    const std::string& jobName() const { return jobName_; }

    void release();

private:
    friend class JobLockRegistry;
    JobLockGuard(JobLockRegistry* registry, std::string jobName)
        : registry_(registry), jobName_(std::move(jobName)) {}

    JobLockRegistry* registry_ = nullptr;
    std::string jobName_;
};

/**
 * @brief At most one live instance per job name
 *
 * Shared by scheduled, manual and chained runs. Acquisition never blocks:
 * a held name yields an empty guard.
 */
class JobLockRegistry {
public:
    JobLockGuard tryAcquire(const std::string& jobName);
    bool isLocked(const std::string& jobName) const;
    std::vector<std::string> lockedJobs() const;

private:
    friend class JobLockGuard;
    void unlock(const std::string& jobName);

    mutable std::mutex mutex_;
    std::unordered_set<std::string> held_;
};

} // namespace mdjobs
