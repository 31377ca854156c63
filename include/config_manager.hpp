#pragma once

#include "logger.hpp"
#include <functional>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace mdjobs {

class ConfigManager;

// Configuration validation result
struct ConfigValidationResult {
  bool isValid = true;
  std::vector<std::string> errors;
  std::vector<std::string> warnings;

  void addError(const std::string &error) {
    isValid = false;
    errors.push_back(error);
  }

  void addWarning(const std::string &warning) { warnings.push_back(warning); }

  void merge(const ConfigValidationResult &other) {
    isValid = isValid && other.isValid;
    errors.insert(errors.end(), other.errors.begin(), other.errors.end());
    warnings.insert(warnings.end(), other.warnings.begin(),
                    other.warnings.end());
  }
};

struct DatabaseSettings {
  std::string host = "localhost";
  int port = 5432;
  std::string name = "stockwatchlist";
  std::string user = "stockuser";
  std::string password;
  int minConnections = 2;
  int maxConnections = 10;
  int connectionTimeoutSeconds = 30;

  static DatabaseSettings fromConfig(const ConfigManager &config);
  ConfigValidationResult validate() const;
};

struct MarketHoliday {
  int month = 1;
  int day = 1;
  std::string name;

  bool operator==(const MarketHoliday &other) const {
    return month == other.month && day == other.day;
  }
};

struct MarketHoursConfig {
  // America/Chicago as a Boost POSIX zone (offsets are east-positive)
  std::string timezone = "CST-06CDT+01,M3.2.0/02:00,M11.1.0/02:00";
  int openHour = 9;
  int openMinute = 0;
  int closeHour = 16;
  int closeMinute = 0;
  std::vector<MarketHoliday> holidays = {{1, 1, "New Year's Day"},
                                         {7, 4, "Independence Day"},
                                         {12, 25, "Christmas Day"}};

  static MarketHoursConfig fromConfig(const ConfigManager &config);
  ConfigValidationResult validate() const;
};

struct ScanConfig {
  int workers = 5;
  double maxRps = 3.0;
  int requestSleepMs = 250;
  int batchSize = 100;
  int maxSymbols = 0; // 0 = no cap
  int retryWorkers = 3;
  double retryMaxRps = 1.0;
  int taskDeadlineSeconds = 90;
  int keepScans = 5;
  std::string source = "schwab";

  static constexpr double kMinRps = 0.1;
  static constexpr double kMinRetryRps = 0.5;

  static ScanConfig fromConfig(const ConfigManager &config);
  ConfigValidationResult validate() const;
};

struct SchedulerConfig {
  int keepHistory = 5;
  int misfireGraceSeconds = 300;
  int ttlCleanupHour = 3;
  int ttlCleanupMinute = 0;
  int jobThreads = 4;

  static SchedulerConfig fromConfig(const ConfigManager &config);
  ConfigValidationResult validate() const;
};

struct ServiceEndpoints {
  std::string backendUrl = "http://backend:8000";
  std::string externalApisUrl = "http://external-apis:8003";
  int requestTimeoutSeconds = 60;
  std::string dailyMoversPath = "/api/movers/calculate";
  std::string weeklyBarsPath = "/api/weekly/bars/run";
  std::string weeklyTechnicalsPath = "/api/weekly/technicals/run";

  static ServiceEndpoints fromConfig(const ConfigManager &config);
  ConfigValidationResult validate() const;
};

struct ChainEdge {
  std::string jobName;
  std::string nextJob;
  std::string description;
  bool weekdayOnly = false;
  std::optional<int> maxHour;
};

struct ChainConfig {
  std::vector<ChainEdge> edges;

  static ChainConfig defaults();
  static ChainConfig fromConfig(const ConfigManager &config);
  ConfigValidationResult validate() const;
};

class ConfigManager {
public:
  static ConfigManager &getInstance();

  bool loadConfig(const std::string &configPath);
  bool loadFromString(const std::string &jsonText);
  bool reloadConfiguration();

  // Copies recognised environment variables over file values
  void applyEnvironmentOverrides();
  void setValue(const std::string &key, const std::string &value);
  void clear();

  std::string getString(const std::string &key,
                        const std::string &defaultValue = "") const;
  int getInt(const std::string &key, int defaultValue = 0) const;
  bool getBool(const std::string &key, bool defaultValue = false) const;
  double getDouble(const std::string &key, double defaultValue = 0.0) const;
  std::unordered_set<std::string> getStringSet(const std::string &key) const;
  bool hasKey(const std::string &key) const;

  LogConfig getLoggingConfig() const;

  DatabaseSettings getDatabaseSettings() const;
  MarketHoursConfig getMarketHoursConfig() const;
  ScanConfig getScanConfig() const;
  SchedulerConfig getSchedulerConfig() const;
  ServiceEndpoints getServiceEndpoints() const;
  ChainConfig getChainConfig() const;

  ConfigValidationResult validateConfiguration() const;

  nlohmann::json getJsonConfig() const;

  template <typename T>
  T getValidatedValue(
      const std::string &key, const T &defaultValue,
      const std::function<bool(const T &)> &validator = nullptr) const;

private:
  ConfigManager() = default;

  mutable std::recursive_mutex mutex_;
  std::unordered_map<std::string, std::string> configData_;
  std::string configFilePath_;
  nlohmann::json rawConfig_;

  bool parseJson(const nlohmann::json &jsonConfig);
  void flattenJson(const nlohmann::json &json, const std::string &prefix,
                   int currentDepth, int maxDepth);
  LogLevel parseLogLevel(const std::string &levelStr) const;
  LogFormat parseLogFormat(const std::string &formatStr) const;
};

template <typename T>
T ConfigManager::getValidatedValue(
    const std::string &key, const T &defaultValue,
    const std::function<bool(const T &)> &validator) const {
  T value;

  if constexpr (std::is_same_v<T, std::string>) {
    value = getString(key, defaultValue);
  } else if constexpr (std::is_same_v<T, int>) {
    value = getInt(key, defaultValue);
  } else if constexpr (std::is_same_v<T, bool>) {
    value = getBool(key, defaultValue);
  } else if constexpr (std::is_same_v<T, double>) {
    value = getDouble(key, defaultValue);
  } else {
    static_assert(std::is_same_v<T, std::string> || std::is_same_v<T, int> ||
                      std::is_same_v<T, bool> || std::is_same_v<T, double>,
                  "Unsupported type for getValidatedValue");
    return defaultValue;
  }

  if (validator && !validator(value)) {
    return defaultValue;
  }

  return value;
}

} // namespace mdjobs
