#pragma once

#include "job_models.hpp"
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mdjobs {

/**
 * Durable schedule definitions keyed by job name.
 *
 * Updates are not pushed to armed timers; the scheduler picks them up on
 * its next reload().
 */
class JobConfigStore {
public:
  virtual ~JobConfigStore() = default;

  virtual std::vector<JobConfiguration> listAll() = 0;
  virtual std::optional<JobConfiguration> get(const std::string &jobName) = 0;

  // Insert or replace the whole row
  virtual void upsert(const JobConfiguration &config) = 0;

  // Applies the patch and returns the stored result; nullopt for an
  // unknown job name
  virtual std::optional<JobConfiguration>
  update(const std::string &jobName, const JobConfigurationPatch &patch) = 0;

  // Inserts each configuration whose job name is absent. Returns the number
  // of rows created.
  virtual int seedDefaults(const std::vector<JobConfiguration> &defaults) = 0;
};

class InMemoryJobConfigStore : public JobConfigStore {
public:
  std::vector<JobConfiguration> listAll() override;
  std::optional<JobConfiguration> get(const std::string &jobName) override;
  void upsert(const JobConfiguration &config) override;
  std::optional<JobConfiguration>
  update(const std::string &jobName,
         const JobConfigurationPatch &patch) override;
  int seedDefaults(const std::vector<JobConfiguration> &defaults) override;

private:
  std::mutex mutex_;
  std::map<std::string, JobConfiguration> configs_;
};

// Seed set created at first boot
std::vector<JobConfiguration> defaultJobConfigurations();

} // namespace mdjobs
