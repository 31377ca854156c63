#pragma once

#include "job_config_store.hpp"
#include <memory>

namespace mdjobs {

class DatabaseManager;

// job_configurations table
class JobConfigRepository : public JobConfigStore {
public:
  explicit JobConfigRepository(std::shared_ptr<DatabaseManager> dbManager);

  std::vector<JobConfiguration> listAll() override;
  std::optional<JobConfiguration> get(const std::string &jobName) override;
  void upsert(const JobConfiguration &config) override;
  std::optional<JobConfiguration>
  update(const std::string &jobName,
         const JobConfigurationPatch &patch) override;
  int seedDefaults(const std::vector<JobConfiguration> &defaults) override;

private:
  std::shared_ptr<DatabaseManager> dbManager_;

  void requireConnection(const std::string &operation) const;
  JobConfiguration configFromRow(const std::vector<std::string> &row) const;
};

} // namespace mdjobs
