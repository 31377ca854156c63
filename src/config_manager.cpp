#include "config_manager.hpp"
#include "logger.hpp"
#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace mdjobs {

namespace {

struct EnvOverride {
  const char *variable;
  const char *key;
};

constexpr EnvOverride kEnvOverrides[] = {
    {"DATABASE_HOST", "database.host"},
    {"DATABASE_PORT", "database.port"},
    {"DATABASE_NAME", "database.name"},
    {"DATABASE_USER", "database.user"},
    {"DATABASE_PASSWORD", "database.password"},
    {"BACKEND_URL", "services.backend_url"},
    {"EXTERNAL_APIS_URL", "services.external_apis_url"},
    {"EOD_WORKERS", "scan.workers"},
    {"EOD_MAX_RPS", "scan.max_rps"},
    {"EOD_REQ_SLEEP_MS", "scan.request_sleep_ms"},
    {"EOD_MAX_SYMBOLS", "scan.max_symbols"},
    {"EOD_RETRY_WORKERS", "scan.retry_workers"},
    {"EOD_RETRY_MAX_RPS", "scan.retry_max_rps"},
    {"EOD_TASK_DEADLINE_SECONDS", "scan.task_deadline_seconds"},
    {"MARKET_TIMEZONE", "market.timezone"},
    {"LOG_LEVEL", "logging.level"},
};

bool parseMonthDay(const std::string &text, int &month, int &day) {
  if (text.size() != 5 || text[2] != '-') {
    return false;
  }
  try {
    month = std::stoi(text.substr(0, 2));
    day = std::stoi(text.substr(3, 2));
  } catch (const std::exception &) {
    return false;
  }
  return month >= 1 && month <= 12 && day >= 1 && day <= 31;
}

} // namespace

ConfigManager &ConfigManager::getInstance() {
  static ConfigManager instance;
  return instance;
}

bool ConfigManager::loadConfig(const std::string &configPath) {
  std::scoped_lock lock(mutex_);
  CONFIG_LOG_INFO("Loading configuration from: {}", configPath);

  std::ifstream file(configPath);
  if (!file.is_open()) {
    CONFIG_LOG_ERROR("Cannot open config file: {}", configPath);
    return false;
  }

  configFilePath_ = configPath;
  try {
    nlohmann::json jsonConfig;
    file >> jsonConfig;
    bool result = parseJson(jsonConfig);
    CONFIG_LOG_INFO("Configuration loaded successfully with {} parameters",
                    configData_.size());
    return result;
  } catch (const nlohmann::json::exception &e) {
    CONFIG_LOG_ERROR("Failed to parse JSON config file {}: {}", configPath,
                     e.what());
    return false;
  }
}

bool ConfigManager::loadFromString(const std::string &jsonText) {
  std::scoped_lock lock(mutex_);
  try {
    return parseJson(nlohmann::json::parse(jsonText));
  } catch (const nlohmann::json::exception &e) {
    CONFIG_LOG_ERROR("Failed to parse JSON configuration: {}", e.what());
    return false;
  }
}

bool ConfigManager::reloadConfiguration() {
  std::string path;
  {
    std::scoped_lock lock(mutex_);
    path = configFilePath_;
  }
  if (path.empty()) {
    CONFIG_LOG_ERROR("No configuration file path available for reload");
    return false;
  }

  CONFIG_LOG_INFO("Reloading configuration from: {}", path);
  bool result = loadConfig(path);
  if (result) {
    applyEnvironmentOverrides();
  }
  return result;
}

void ConfigManager::applyEnvironmentOverrides() {
  std::scoped_lock lock(mutex_);
  for (const auto &entry : kEnvOverrides) {
    if (const char *value = std::getenv(entry.variable);
        value != nullptr && *value != '\0') {
      configData_[entry.key] = value;
      CONFIG_LOG_DEBUG("Environment override {} -> {}", entry.variable,
                       entry.key);
    }
  }
}

void ConfigManager::setValue(const std::string &key, const std::string &value) {
  std::scoped_lock lock(mutex_);
  configData_[key] = value;
}

void ConfigManager::clear() {
  std::scoped_lock lock(mutex_);
  configData_.clear();
  rawConfig_ = nlohmann::json::object();
  configFilePath_.clear();
}

std::string ConfigManager::getString(const std::string &key,
                                     const std::string &defaultValue) const {
  std::scoped_lock lock(mutex_);
  if (auto it = configData_.find(key); it != configData_.end()) {
    return it->second;
  }
  return defaultValue;
}

int ConfigManager::getInt(const std::string &key, int defaultValue) const {
  std::scoped_lock lock(mutex_);
  if (auto it = configData_.find(key); it != configData_.end()) {
    try {
      return std::stoi(it->second);
    } catch (const std::invalid_argument &) {
      return defaultValue;
    } catch (const std::out_of_range &) {
      return defaultValue;
    }
  }
  return defaultValue;
}

bool ConfigManager::getBool(const std::string &key, bool defaultValue) const {
  std::scoped_lock lock(mutex_);
  if (auto it = configData_.find(key); it != configData_.end()) {
    std::string value = it->second;
    std::transform(value.begin(), value.end(), value.begin(), ::tolower);
    return value == "true" || value == "1" || value == "yes" || value == "on";
  }
  return defaultValue;
}

double ConfigManager::getDouble(const std::string &key,
                                double defaultValue) const {
  std::scoped_lock lock(mutex_);
  if (auto it = configData_.find(key); it != configData_.end()) {
    try {
      return std::stod(it->second);
    } catch (const std::invalid_argument &) {
      return defaultValue;
    } catch (const std::out_of_range &) {
      return defaultValue;
    }
  }
  return defaultValue;
}

std::unordered_set<std::string>
ConfigManager::getStringSet(const std::string &key) const {
  std::unordered_set<std::string> result;
  const std::string raw = getString(key);
  if (raw.empty()) {
    return result;
  }

  if (raw.front() == '[') {
    try {
      auto arr = nlohmann::json::parse(raw);
      if (arr.is_array()) {
        for (const auto &v : arr) {
          if (v.is_string())
            result.insert(v.get<std::string>());
        }
        return result;
      }
    } catch (const nlohmann::json::exception &) {
      // fall through to CSV parsing
    }
  }

  std::stringstream ss(raw);
  std::string item;
  while (std::getline(ss, item, ',')) {
    item.erase(0, item.find_first_not_of(" \t\"["));
    item.erase(item.find_last_not_of(" \t\"]") + 1);
    if (!item.empty())
      result.insert(item);
  }
  return result;
}

bool ConfigManager::hasKey(const std::string &key) const {
  std::scoped_lock lock(mutex_);
  return configData_.count(key) > 0;
}

LogConfig ConfigManager::getLoggingConfig() const {
  LogConfig config;

  config.level = parseLogLevel(getString("logging.level", "INFO"));
  config.format = parseLogFormat(getString("logging.format", "TEXT"));
  config.consoleOutput = getBool("logging.console_output", true);
  config.fileOutput = getBool("logging.file_output", false);
  config.asyncLogging = getBool("logging.async_logging", false);
  config.logFile = getString("logging.log_file", "logs/mdjobs.log");
  config.maxFileSize =
      static_cast<size_t>(getInt("logging.max_file_size", 10485760));
  config.maxBackupFiles = getInt("logging.max_backup_files", 5);
  config.enableRotation = getBool("logging.enable_rotation", true);
  config.componentFilter = getStringSet("logging.component_filter");
  config.maxQueueSize =
      static_cast<size_t>(getInt("logging.max_queue_size", 10000));

  return config;
}

DatabaseSettings ConfigManager::getDatabaseSettings() const {
  return DatabaseSettings::fromConfig(*this);
}

MarketHoursConfig ConfigManager::getMarketHoursConfig() const {
  return MarketHoursConfig::fromConfig(*this);
}

ScanConfig ConfigManager::getScanConfig() const {
  return ScanConfig::fromConfig(*this);
}

SchedulerConfig ConfigManager::getSchedulerConfig() const {
  return SchedulerConfig::fromConfig(*this);
}

ServiceEndpoints ConfigManager::getServiceEndpoints() const {
  return ServiceEndpoints::fromConfig(*this);
}

ChainConfig ConfigManager::getChainConfig() const {
  return ChainConfig::fromConfig(*this);
}

ConfigValidationResult ConfigManager::validateConfiguration() const {
  ConfigValidationResult result;
  result.merge(getDatabaseSettings().validate());
  result.merge(getMarketHoursConfig().validate());
  result.merge(getScanConfig().validate());
  result.merge(getSchedulerConfig().validate());
  result.merge(getServiceEndpoints().validate());
  result.merge(getChainConfig().validate());
  return result;
}

nlohmann::json ConfigManager::getJsonConfig() const {
  std::scoped_lock lock(mutex_);
  return rawConfig_;
}

LogLevel ConfigManager::parseLogLevel(const std::string &levelStr) const {
  std::string level = levelStr;
  std::transform(level.begin(), level.end(), level.begin(), ::toupper);

  if (level == "DEBUG")
    return LogLevel::DEBUG;
  if (level == "INFO")
    return LogLevel::INFO;
  if (level == "WARN" || level == "WARNING")
    return LogLevel::WARN;
  if (level == "ERROR")
    return LogLevel::ERROR;
  if (level == "FATAL")
    return LogLevel::FATAL;

  return LogLevel::INFO;
}

LogFormat ConfigManager::parseLogFormat(const std::string &formatStr) const {
  std::string format = formatStr;
  std::transform(format.begin(), format.end(), format.begin(), ::toupper);

  if (format == "JSON")
    return LogFormat::JSON;
  return LogFormat::TEXT;
}

bool ConfigManager::parseJson(const nlohmann::json &jsonConfig) {
  // Called with mutex_ held
  if (!jsonConfig.is_object()) {
    CONFIG_LOG_ERROR("Configuration root must be a JSON object");
    return false;
  }
  configData_.clear();
  rawConfig_ = jsonConfig;
  flattenJson(jsonConfig, "", 0, 16);
  return true;
}

void ConfigManager::flattenJson(const nlohmann::json &json,
                                const std::string &prefix, int currentDepth,
                                int maxDepth) {
  if (currentDepth >= maxDepth) {
    configData_[prefix] = json.dump();
    return;
  }

  for (auto it = json.begin(); it != json.end(); ++it) {
    std::string key = prefix.empty() ? it.key() : prefix + "." + it.key();

    if (it->is_object()) {
      flattenJson(*it, key, currentDepth + 1, maxDepth);
    } else if (it->is_array()) {
      // Arrays are kept as JSON text
      configData_[key] = it->dump();
    } else if (it->is_string()) {
      configData_[key] = it->get<std::string>();
    } else if (it->is_number_integer()) {
      configData_[key] = std::to_string(it->get<long long>());
    } else if (it->is_number_float()) {
      configData_[key] = it->dump();
    } else if (it->is_boolean()) {
      configData_[key] = it->get<bool>() ? "true" : "false";
    } else if (it->is_null()) {
      configData_[key] = "";
    }
  }
}

// ===== DatabaseSettings =====

DatabaseSettings DatabaseSettings::fromConfig(const ConfigManager &config) {
  DatabaseSettings settings;
  settings.host = config.getString("database.host", settings.host);
  settings.port = config.getInt("database.port", settings.port);
  settings.name = config.getString("database.name", settings.name);
  settings.user = config.getString("database.user", settings.user);
  settings.password = config.getString("database.password", "");
  settings.minConnections =
      config.getInt("database.min_connections", settings.minConnections);
  settings.maxConnections =
      config.getInt("database.max_connections", settings.maxConnections);
  settings.connectionTimeoutSeconds = config.getInt(
      "database.connection_timeout", settings.connectionTimeoutSeconds);
  return settings;
}

ConfigValidationResult DatabaseSettings::validate() const {
  ConfigValidationResult result;
  if (host.empty()) {
    result.addError("database.host must not be empty");
  }
  if (port <= 0 || port > 65535) {
    result.addError("database.port must be between 1 and 65535, got: " +
                    std::to_string(port));
  }
  if (name.empty()) {
    result.addError("database.name must not be empty");
  }
  if (minConnections < 0 || maxConnections <= 0 ||
      minConnections > maxConnections) {
    result.addError("database connection pool bounds are inconsistent");
  }
  if (password.empty()) {
    result.addWarning("database.password is empty");
  }
  return result;
}

// ===== MarketHoursConfig =====

MarketHoursConfig MarketHoursConfig::fromConfig(const ConfigManager &config) {
  MarketHoursConfig market;
  market.timezone = config.getString("market.timezone", market.timezone);
  market.openHour = config.getInt("market.open_hour", market.openHour);
  market.openMinute = config.getInt("market.open_minute", market.openMinute);
  market.closeHour = config.getInt("market.close_hour", market.closeHour);
  market.closeMinute = config.getInt("market.close_minute", market.closeMinute);

  const std::string rawHolidays = config.getString("market.holidays");
  if (!rawHolidays.empty()) {
    try {
      auto arr = nlohmann::json::parse(rawHolidays);
      std::vector<MarketHoliday> holidays;
      for (const auto &entry : arr) {
        MarketHoliday holiday;
        const std::string date = entry.value("date", "");
        if (!parseMonthDay(date, holiday.month, holiday.day)) {
          CONFIG_LOG_WARN("Ignoring malformed holiday date '{}'", date);
          continue;
        }
        holiday.name = entry.value("name", date);
        holidays.push_back(holiday);
      }
      market.holidays = std::move(holidays);
    } catch (const nlohmann::json::exception &e) {
      CONFIG_LOG_WARN("Ignoring malformed market.holidays: {}", e.what());
    }
  }
  return market;
}

ConfigValidationResult MarketHoursConfig::validate() const {
  ConfigValidationResult result;
  if (timezone.empty()) {
    result.addError("market.timezone must not be empty");
  }
  auto checkTime = [&result](const char *label, int hour, int minute) {
    if (hour < 0 || hour > 23 || minute < 0 || minute > 59) {
      result.addError(std::string(label) + " time is out of range: " +
                      std::to_string(hour) + ":" + std::to_string(minute));
    }
  };
  checkTime("market.open", openHour, openMinute);
  checkTime("market.close", closeHour, closeMinute);
  if (openHour * 60 + openMinute >= closeHour * 60 + closeMinute) {
    result.addError("market open time must be before close time");
  }
  if (holidays.empty()) {
    result.addWarning("market.holidays is empty");
  }
  return result;
}

// ===== ScanConfig =====

ScanConfig ScanConfig::fromConfig(const ConfigManager &config) {
  ScanConfig scan;
  scan.workers = config.getInt("scan.workers", scan.workers);
  scan.maxRps =
      std::max(kMinRps, config.getDouble("scan.max_rps", scan.maxRps));
  scan.requestSleepMs =
      std::max(0, config.getInt("scan.request_sleep_ms", scan.requestSleepMs));
  scan.batchSize = config.getInt("scan.batch_size", scan.batchSize);
  scan.maxSymbols = config.getInt("scan.max_symbols", scan.maxSymbols);
  scan.retryWorkers =
      std::max(1, config.getInt("scan.retry_workers", scan.retryWorkers));
  scan.retryMaxRps = std::max(
      kMinRetryRps, config.getDouble("scan.retry_max_rps", scan.retryMaxRps));
  scan.taskDeadlineSeconds = config.getInt("scan.task_deadline_seconds",
                                           scan.taskDeadlineSeconds);
  scan.keepScans = config.getInt("scan.keep_scans", scan.keepScans);
  scan.source = config.getString("scan.source", scan.source);
  return scan;
}

ConfigValidationResult ScanConfig::validate() const {
  ConfigValidationResult result;
  if (workers <= 0) {
    result.addError("scan.workers must be positive, got: " +
                    std::to_string(workers));
  }
  if (batchSize <= 0) {
    result.addError("scan.batch_size must be positive, got: " +
                    std::to_string(batchSize));
  }
  if (taskDeadlineSeconds <= 0) {
    result.addError("scan.task_deadline_seconds must be positive, got: " +
                    std::to_string(taskDeadlineSeconds));
  }
  if (keepScans <= 0) {
    result.addError("scan.keep_scans must be positive");
  }
  if (maxSymbols > 0) {
    result.addWarning("scan.max_symbols caps the universe at " +
                      std::to_string(maxSymbols) + " symbols");
  }
  if (retryMaxRps > maxRps) {
    result.addWarning("scan.retry_max_rps is higher than scan.max_rps");
  }
  return result;
}

// ===== SchedulerConfig =====

SchedulerConfig SchedulerConfig::fromConfig(const ConfigManager &config) {
  SchedulerConfig scheduler;
  scheduler.keepHistory =
      config.getInt("scheduler.keep_history", scheduler.keepHistory);
  scheduler.misfireGraceSeconds = config.getInt(
      "scheduler.misfire_grace_seconds", scheduler.misfireGraceSeconds);
  scheduler.ttlCleanupHour =
      config.getInt("scheduler.ttl_cleanup_hour", scheduler.ttlCleanupHour);
  scheduler.ttlCleanupMinute =
      config.getInt("scheduler.ttl_cleanup_minute", scheduler.ttlCleanupMinute);
  scheduler.jobThreads =
      config.getInt("scheduler.job_threads", scheduler.jobThreads);
  return scheduler;
}

ConfigValidationResult SchedulerConfig::validate() const {
  ConfigValidationResult result;
  if (keepHistory <= 0) {
    result.addError("scheduler.keep_history must be positive");
  }
  if (misfireGraceSeconds < 0) {
    result.addError("scheduler.misfire_grace_seconds must not be negative");
  }
  if (ttlCleanupHour < 0 || ttlCleanupHour > 23 || ttlCleanupMinute < 0 ||
      ttlCleanupMinute > 59) {
    result.addError("scheduler TTL cleanup time is out of range");
  }
  if (jobThreads <= 0) {
    result.addError("scheduler.job_threads must be positive");
  }
  return result;
}

// ===== ServiceEndpoints =====

ServiceEndpoints ServiceEndpoints::fromConfig(const ConfigManager &config) {
  ServiceEndpoints endpoints;
  endpoints.backendUrl =
      config.getString("services.backend_url", endpoints.backendUrl);
  endpoints.externalApisUrl =
      config.getString("services.external_apis_url", endpoints.externalApisUrl);
  endpoints.requestTimeoutSeconds = config.getInt(
      "services.request_timeout_seconds", endpoints.requestTimeoutSeconds);
  endpoints.dailyMoversPath =
      config.getString("services.daily_movers_path", endpoints.dailyMoversPath);
  endpoints.weeklyBarsPath =
      config.getString("services.weekly_bars_path", endpoints.weeklyBarsPath);
  endpoints.weeklyTechnicalsPath = config.getString(
      "services.weekly_technicals_path", endpoints.weeklyTechnicalsPath);
  return endpoints;
}

ConfigValidationResult ServiceEndpoints::validate() const {
  ConfigValidationResult result;
  auto checkUrl = [&result](const char *label, const std::string &url) {
    if (url.rfind("http://", 0) != 0 && url.rfind("https://", 0) != 0) {
      result.addError(std::string(label) + " must be an http(s) URL, got: " +
                      url);
    }
  };
  checkUrl("services.backend_url", backendUrl);
  checkUrl("services.external_apis_url", externalApisUrl);
  if (requestTimeoutSeconds <= 0) {
    result.addError("services.request_timeout_seconds must be positive");
  }
  return result;
}

// ===== ChainConfig =====

ChainConfig ChainConfig::defaults() {
  ChainConfig chains;
  chains.edges = {
      {"eod_scan", "tech_analysis",
       "Compute technical indicators after the end-of-day scan", true, 22},
      {"tech_analysis", "daily_movers",
       "Calculate daily movers after technical analysis", true, std::nullopt},
      {"universe_refresh", "weekly_bars_etl",
       "Aggregate weekly bars after the universe refresh", false,
       std::nullopt},
      {"weekly_bars_etl", "weekly_technicals_etl",
       "Compute weekly technicals after weekly bars", false, std::nullopt},
  };
  return chains;
}

ChainConfig ChainConfig::fromConfig(const ConfigManager &config) {
  const auto json = config.getJsonConfig();
  auto it = json.find("job_chains");
  if (it == json.end() || !it->is_object()) {
    return defaults();
  }

  ChainConfig chains;
  for (auto entry = it->begin(); entry != it->end(); ++entry) {
    if (!entry->is_object()) {
      CONFIG_LOG_WARN("Ignoring job_chains entry '{}': not an object",
                      entry.key());
      continue;
    }
    ChainEdge edge;
    edge.jobName = entry.key();
    edge.nextJob = entry->value("next_job", "");
    edge.description = entry->value("description", "");
    if (auto conditions = entry->find("conditions");
        conditions != entry->end() && conditions->is_object()) {
      edge.weekdayOnly = conditions->value("weekday_only", false);
      if (auto maxHour = conditions->find("max_hour");
          maxHour != conditions->end() && maxHour->is_number_integer()) {
        edge.maxHour = maxHour->get<int>();
      }
    }
    chains.edges.push_back(std::move(edge));
  }
  return chains;
}

ConfigValidationResult ChainConfig::validate() const {
  ConfigValidationResult result;
  std::unordered_set<std::string> seen;
  for (const auto &edge : edges) {
    if (!seen.insert(edge.jobName).second) {
      result.addError("duplicate chain edge for job: " + edge.jobName);
    }
    if (edge.nextJob.empty()) {
      result.addWarning("chain for " + edge.jobName + " has no next_job");
    }
    if (edge.nextJob == edge.jobName) {
      result.addError("chain for " + edge.jobName + " points at itself");
    }
    if (edge.maxHour && (*edge.maxHour < 0 || *edge.maxHour > 23)) {
      result.addError("chain max_hour for " + edge.jobName +
                      " must be between 0 and 23");
    }
  }
  return result;
}

} // namespace mdjobs
