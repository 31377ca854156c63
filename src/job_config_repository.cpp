#include "job_config_repository.hpp"
#include "database_manager.hpp"
#include "job_exceptions.hpp"
#include "logger.hpp"

namespace mdjobs {

namespace {

const char *kSelectColumns =
    "SELECT job_name, description, enabled, schedule_type, interval_value, "
    "interval_unit, cron_day_of_week, cron_hour, cron_minute, "
    "only_market_hours, market_start_hour, market_end_hour, created_at, "
    "updated_at FROM job_configurations";

SqlParams configParams(const JobConfiguration &config) {
  return {config.jobName,
          config.description,
          toSqlParam(config.enabled),
          scheduleKindToString(config.scheduleKind),
          toSqlParam(config.intervalValue),
          toSqlParam(config.intervalUnit),
          toSqlParam(config.cronDayOfWeek),
          toSqlParam(config.cronHour),
          toSqlParam(config.cronMinute),
          toSqlParam(config.onlyMarketHours),
          toSqlParam(config.marketStartHour),
          toSqlParam(config.marketEndHour)};
}

} // namespace

JobConfigRepository::JobConfigRepository(
    std::shared_ptr<DatabaseManager> dbManager)
    : dbManager_(std::move(dbManager)) {}

void JobConfigRepository::requireConnection(const std::string &operation) const {
  if (!dbManager_ || !dbManager_->isConnected()) {
    DB_LOG_ERROR("Database not connected");
    throw SystemException(ErrorCode::DATABASE_ERROR,
                          "Database not connected", "JobConfigRepository",
                          {{"operation", operation}});
  }
}

std::vector<JobConfiguration> JobConfigRepository::listAll() {
  std::vector<JobConfiguration> configs;

  if (!dbManager_ || !dbManager_->isConnected()) {
    DB_LOG_ERROR("Database not connected");
    return configs;
  }

  try {
    auto result =
        dbManager_->selectQuery(std::string(kSelectColumns) + " ORDER BY job_name");
    for (size_t i = 1; i < result.size(); ++i) {
      configs.push_back(configFromRow(result[i]));
    }
  } catch (const std::exception &e) {
    DB_LOG_ERROR("Failed to list job configurations: {}", e.what());
  }
  return configs;
}

std::optional<JobConfiguration>
JobConfigRepository::get(const std::string &jobName) {
  if (!dbManager_ || !dbManager_->isConnected()) {
    DB_LOG_ERROR("Database not connected");
    return std::nullopt;
  }

  try {
    auto result = dbManager_->selectQuery(
        std::string(kSelectColumns) + " WHERE job_name = $1", {jobName});
    if (result.size() <= 1) {
      return std::nullopt;
    }
    return configFromRow(result[1]);
  } catch (const std::exception &e) {
    DB_LOG_ERROR("Failed to get job configuration {}: {}", jobName, e.what());
    return std::nullopt;
  }
}

void JobConfigRepository::upsert(const JobConfiguration &config) {
  requireConnection("upsert");

  const std::string query =
      "INSERT INTO job_configurations (job_name, description, enabled, "
      "schedule_type, interval_value, interval_unit, cron_day_of_week, "
      "cron_hour, cron_minute, only_market_hours, market_start_hour, "
      "market_end_hour) VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11, "
      "$12) ON CONFLICT (job_name) DO UPDATE SET "
      "description = EXCLUDED.description, enabled = EXCLUDED.enabled, "
      "schedule_type = EXCLUDED.schedule_type, "
      "interval_value = EXCLUDED.interval_value, "
      "interval_unit = EXCLUDED.interval_unit, "
      "cron_day_of_week = EXCLUDED.cron_day_of_week, "
      "cron_hour = EXCLUDED.cron_hour, cron_minute = EXCLUDED.cron_minute, "
      "only_market_hours = EXCLUDED.only_market_hours, "
      "market_start_hour = EXCLUDED.market_start_hour, "
      "market_end_hour = EXCLUDED.market_end_hour, "
      "updated_at = (NOW() AT TIME ZONE 'UTC')";

  if (!dbManager_->executeQuery(query, configParams(config))) {
    throw SystemException(ErrorCode::DATABASE_ERROR,
                          "Failed to store job configuration " + config.jobName,
                          "JobConfigRepository");
  }
}

std::optional<JobConfiguration>
JobConfigRepository::update(const std::string &jobName,
                            const JobConfigurationPatch &patch) {
  requireConnection("update");

  auto current = get(jobName);
  if (!current) {
    return std::nullopt;
  }
  patch.applyTo(*current);

  const std::string query =
      "UPDATE job_configurations SET description = $2, enabled = $3, "
      "schedule_type = $4, interval_value = $5, interval_unit = $6, "
      "cron_day_of_week = $7, cron_hour = $8, cron_minute = $9, "
      "only_market_hours = $10, market_start_hour = $11, "
      "market_end_hour = $12, updated_at = (NOW() AT TIME ZONE 'UTC') "
      "WHERE job_name = $1";

  int affected = dbManager_->executeUpdate(query, configParams(*current));
  if (affected < 0) {
    throw SystemException(ErrorCode::DATABASE_ERROR,
                          "Failed to update job configuration " + jobName,
                          "JobConfigRepository");
  }
  if (affected == 0) {
    return std::nullopt;
  }
  return get(jobName);
}

int JobConfigRepository::seedDefaults(
    const std::vector<JobConfiguration> &defaults) {
  requireConnection("seedDefaults");

  const std::string query =
      "INSERT INTO job_configurations (job_name, description, enabled, "
      "schedule_type, interval_value, interval_unit, cron_day_of_week, "
      "cron_hour, cron_minute, only_market_hours, market_start_hour, "
      "market_end_hour) VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11, "
      "$12) ON CONFLICT (job_name) DO NOTHING";

  int created = 0;
  for (const auto &config : defaults) {
    int affected = dbManager_->executeUpdate(query, configParams(config));
    if (affected < 0) {
      throw SystemException(ErrorCode::DATABASE_ERROR,
                            "Failed to seed job configuration " + config.jobName,
                            "JobConfigRepository");
    }
    created += affected;
  }

  if (created > 0) {
    DB_LOG_INFO("Seeded {} job configurations", created);
  }
  return created;
}

JobConfiguration
JobConfigRepository::configFromRow(const std::vector<std::string> &row) const {
  JobConfiguration config;
  config.jobName = row[0];
  config.description = row[1];
  config.enabled = boolColumn(row[2]);
  config.scheduleKind = stringToScheduleKind(row[3]);
  config.intervalValue = optionalIntColumn(row[4]);
  config.intervalUnit = optionalTextColumn(row[5]);
  config.cronDayOfWeek = optionalTextColumn(row[6]);
  config.cronHour = optionalIntColumn(row[7]);
  config.cronMinute = optionalIntColumn(row[8]);
  config.onlyMarketHours = boolColumn(row[9]);
  config.marketStartHour = optionalIntColumn(row[10]);
  config.marketEndHour = optionalIntColumn(row[11]);
  if (!row[12].empty()) {
    config.createdAt = stringToTimePoint(row[12]);
  }
  if (!row[13].empty()) {
    config.updatedAt = stringToTimePoint(row[13]);
  }
  return config;
}

} // namespace mdjobs
