#include "job_lock.hpp"

namespace mdjobs {

JobLockGuard::JobLockGuard(JobLockGuard&& other) noexcept
    : registry_(other.registry_), jobName_(std::move(other.jobName_)) {
    other.registry_ = nullptr;
}

JobLockGuard& JobLockGuard::operator=(JobLockGuard&& other) noexcept {
    if (this != &other) {
        release();
        registry_ = other.registry_;
        jobName_ = std::move(other.jobName_);
        other.registry_ = nullptr;
    }
    return *this;
}

void JobLockGuard::release() {
    if (registry_) {
        registry_->unlock(jobName_);
        registry_ = nullptr;
    }
}

JobLockGuard JobLockRegistry::tryAcquire(const std::string& jobName) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!held_.insert(jobName).second) {
        return JobLockGuard();
    }
    return JobLockGuard(this, jobName);
}

bool JobLockRegistry::isLocked(const std::string& jobName) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return held_.count(jobName) > 0;
}

std::vector<std::string> JobLockRegistry::lockedJobs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {held_.begin(), held_.end()};
}

void JobLockRegistry::unlock(const std::string& jobName) {
    std::lock_guard<std::mutex> lock(mutex_);
    held_.erase(jobName);
}

} // namespace mdjobs
