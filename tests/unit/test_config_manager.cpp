#include "config_manager.hpp"
#include "logger.hpp"
#include <algorithm>
#include <cstdlib>
#include <gtest/gtest.h>

namespace mdjobs {

class ConfigManagerTest : public ::testing::Test {
protected:
  void SetUp() override {
    LogConfig config;
    config.level = LogLevel::DEBUG;
    config.consoleOutput = true;
    config.fileOutput = false;
    Logger::getInstance().configure(config);

    ConfigManager::getInstance().clear();
  }

  void TearDown() override {
    unsetenv("EOD_WORKERS");
    unsetenv("EOD_MAX_RPS");
    ConfigManager::getInstance().clear();
  }

  static bool hasMessage(const std::vector<std::string> &messages,
                         const std::string &fragment) {
    return std::any_of(messages.begin(), messages.end(),
                       [&fragment](const std::string &message) {
                         return message.find(fragment) != std::string::npos;
                       });
  }
};

TEST_F(ConfigManagerTest, DefaultsWithoutConfiguration) {
  auto &config = ConfigManager::getInstance();

  auto scan = config.getScanConfig();
  EXPECT_EQ(scan.workers, 5);
  EXPECT_DOUBLE_EQ(scan.maxRps, 3.0);
  EXPECT_EQ(scan.requestSleepMs, 250);
  EXPECT_EQ(scan.batchSize, 100);
  EXPECT_EQ(scan.maxSymbols, 0);
  EXPECT_EQ(scan.retryWorkers, 3);
  EXPECT_DOUBLE_EQ(scan.retryMaxRps, 1.0);
  EXPECT_EQ(scan.taskDeadlineSeconds, 90);

  auto scheduler = config.getSchedulerConfig();
  EXPECT_EQ(scheduler.keepHistory, 5);
  EXPECT_EQ(scheduler.ttlCleanupHour, 3);
  EXPECT_EQ(scheduler.ttlCleanupMinute, 0);

  auto market = config.getMarketHoursConfig();
  EXPECT_EQ(market.openHour, 9);
  EXPECT_EQ(market.closeHour, 16);
  EXPECT_EQ(market.holidays.size(), 3u);

  EXPECT_EQ(config.getChainConfig().edges.size(), 4u);
  EXPECT_TRUE(config.validateConfiguration().isValid);
}

TEST_F(ConfigManagerTest, LoadsNestedSections) {
  auto &config = ConfigManager::getInstance();
  ASSERT_TRUE(config.loadFromString(R"({
    "database": {"host": "db.internal", "port": 6543, "password": "secret"},
    "scan": {"workers": 8, "max_rps": 2.5, "max_symbols": 200},
    "scheduler": {"keep_history": 10, "ttl_cleanup_hour": 4},
    "services": {"backend_url": "http://backend:9000"},
    "logging": {"level": "warn", "component_filter": ["Scheduler", "EodScan"]}
  })"));

  auto database = config.getDatabaseSettings();
  EXPECT_EQ(database.host, "db.internal");
  EXPECT_EQ(database.port, 6543);
  EXPECT_EQ(database.name, "stockwatchlist");

  auto scan = config.getScanConfig();
  EXPECT_EQ(scan.workers, 8);
  EXPECT_DOUBLE_EQ(scan.maxRps, 2.5);
  EXPECT_EQ(scan.maxSymbols, 200);

  EXPECT_EQ(config.getSchedulerConfig().keepHistory, 10);
  EXPECT_EQ(config.getSchedulerConfig().ttlCleanupHour, 4);
  EXPECT_EQ(config.getServiceEndpoints().backendUrl, "http://backend:9000");

  auto logging = config.getLoggingConfig();
  EXPECT_EQ(logging.level, LogLevel::WARN);
  EXPECT_EQ(logging.componentFilter.size(), 2u);
  EXPECT_EQ(logging.componentFilter.count("Scheduler"), 1u);

  auto result = config.validateConfiguration();
  EXPECT_TRUE(result.isValid);
  EXPECT_TRUE(hasMessage(result.warnings, "max_symbols"));
}

TEST_F(ConfigManagerTest, RejectsMalformedJson) {
  auto &config = ConfigManager::getInstance();
  EXPECT_FALSE(config.loadFromString("{not json"));
  EXPECT_FALSE(config.loadFromString("[1, 2, 3]"));
  EXPECT_FALSE(config.loadConfig("/nonexistent/mdjobs.json"));
}

TEST_F(ConfigManagerTest, RateFloorsAreApplied) {
  auto &config = ConfigManager::getInstance();
  config.setValue("scan.max_rps", "0");
  config.setValue("scan.retry_max_rps", "0.1");
  config.setValue("scan.retry_workers", "0");
  config.setValue("scan.request_sleep_ms", "-5");

  auto scan = config.getScanConfig();
  EXPECT_DOUBLE_EQ(scan.maxRps, ScanConfig::kMinRps);
  EXPECT_DOUBLE_EQ(scan.retryMaxRps, ScanConfig::kMinRetryRps);
  EXPECT_EQ(scan.retryWorkers, 1);
  EXPECT_EQ(scan.requestSleepMs, 0);
}

TEST_F(ConfigManagerTest, UnparsableNumbersFallBack) {
  auto &config = ConfigManager::getInstance();
  config.setValue("scan.workers", "many");
  EXPECT_EQ(config.getScanConfig().workers, 5);
  EXPECT_EQ(config.getInt("missing.key", 7), 7);
  EXPECT_TRUE(config.getBool("missing.flag", true));
}

TEST_F(ConfigManagerTest, EnvironmentOverridesFileValues) {
  auto &config = ConfigManager::getInstance();
  ASSERT_TRUE(config.loadFromString(R"({"scan": {"workers": 2, "max_rps": 1.5}})"));

  setenv("EOD_WORKERS", "12", 1);
  setenv("EOD_MAX_RPS", "4.5", 1);
  config.applyEnvironmentOverrides();

  auto scan = config.getScanConfig();
  EXPECT_EQ(scan.workers, 12);
  EXPECT_DOUBLE_EQ(scan.maxRps, 4.5);
}

TEST_F(ConfigManagerTest, HolidaysFromConfiguration) {
  auto &config = ConfigManager::getInstance();
  ASSERT_TRUE(config.loadFromString(R"({
    "market": {
      "holidays": [
        {"date": "01-01", "name": "New Year's Day"},
        {"date": "07-04"},
        {"date": "2024-12-25", "name": "Malformed"},
        {"date": "13-01", "name": "No such month"}
      ]
    }
  })"));

  auto market = config.getMarketHoursConfig();
  ASSERT_EQ(market.holidays.size(), 2u);
  EXPECT_EQ(market.holidays[0].month, 1);
  EXPECT_EQ(market.holidays[0].name, "New Year's Day");
  EXPECT_EQ(market.holidays[1].month, 7);
  EXPECT_EQ(market.holidays[1].day, 4);
  EXPECT_EQ(market.holidays[1].name, "07-04");
}

TEST_F(ConfigManagerTest, ValidationReportsErrors) {
  auto &config = ConfigManager::getInstance();
  ASSERT_TRUE(config.loadFromString(R"({
    "scan": {"workers": 0, "batch_size": 0},
    "market": {"open_hour": 17},
    "scheduler": {"ttl_cleanup_hour": 24},
    "services": {"backend_url": "backend:8000"}
  })"));

  auto result = config.validateConfiguration();
  EXPECT_FALSE(result.isValid);
  EXPECT_TRUE(hasMessage(result.errors, "scan.workers"));
  EXPECT_TRUE(hasMessage(result.errors, "scan.batch_size"));
  EXPECT_TRUE(hasMessage(result.errors, "open time must be before close"));
  EXPECT_TRUE(hasMessage(result.errors, "TTL cleanup"));
  EXPECT_TRUE(hasMessage(result.errors, "services.backend_url"));
}

TEST_F(ConfigManagerTest, ChainValidation) {
  ChainConfig chains;
  chains.edges.push_back({"a", "a", "", false, std::nullopt});
  chains.edges.push_back({"b", "c", "", true, 30});
  chains.edges.push_back({"b", "", "", false, std::nullopt});

  auto result = chains.validate();
  EXPECT_FALSE(result.isValid);
  EXPECT_TRUE(hasMessage(result.errors, "points at itself"));
  EXPECT_TRUE(hasMessage(result.errors, "duplicate chain edge"));
  EXPECT_TRUE(hasMessage(result.errors, "max_hour"));
  EXPECT_TRUE(hasMessage(result.warnings, "no next_job"));
}

TEST_F(ConfigManagerTest, ValidatedValueFallsBack) {
  auto &config = ConfigManager::getInstance();
  config.setValue("scan.batch_size", "-3");
  int batch = config.getValidatedValue<int>("scan.batch_size", 100,
                                            [](const int &value) { return value > 0; });
  EXPECT_EQ(batch, 100);
}

} // namespace mdjobs
