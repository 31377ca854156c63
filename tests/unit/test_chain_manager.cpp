#include "chain_manager.hpp"
#include "config_manager.hpp"
#include "job_exceptions.hpp"
#include "job_models.hpp"
#include "logger.hpp"
#include <gtest/gtest.h>
#include <stdexcept>
#include <vector>

namespace mdjobs {

class ChainManagerTest : public ::testing::Test {
protected:
  void SetUp() override {
    LogConfig config;
    config.level = LogLevel::DEBUG;
    config.consoleOutput = true;
    config.fileOutput = false;
    Logger::getInstance().configure(config);

    chains_ = std::make_unique<ChainManager>(
        ChainConfig::defaults(), MarketHours(),
        [this](const std::string &jobName) { triggered_.push_back(jobName); });
  }

  static TimePoint utc(const std::string &text) {
    return stringToTimePoint(text);
  }

  std::vector<std::string> triggered_;
  std::unique_ptr<ChainManager> chains_;
};

TEST_F(ChainManagerTest, WeekdayTriggersNextJob) {
  // Monday 2024-01-08 17:45 CST
  EXPECT_TRUE(chains_->triggerNext("eod_scan", utc("2024-01-08 23:45:00")));
  EXPECT_EQ(triggered_, (std::vector<std::string>{"tech_analysis"}));
}

TEST_F(ChainManagerTest, WeekendBlocksWeekdayOnlyEdge) {
  // Saturday 2024-01-06 12:00 CST
  EXPECT_FALSE(chains_->triggerNext("eod_scan", utc("2024-01-06 18:00:00")));
  EXPECT_FALSE(chains_->triggerNext("tech_analysis", utc("2024-01-06 18:00:00")));
  EXPECT_TRUE(triggered_.empty());
}

TEST_F(ChainManagerTest, WeekendUsesMarketZoneNotUtc) {
  // Friday 2024-01-05 20:00 CST is already Saturday in UTC
  EXPECT_TRUE(chains_->triggerNext("tech_analysis", utc("2024-01-06 02:00:00")));
  EXPECT_EQ(triggered_, (std::vector<std::string>{"daily_movers"}));
}

TEST_F(ChainManagerTest, MaxHourBoundaryIsInclusive) {
  // Monday 2024-01-08 22:00:00 CST is still allowed
  EXPECT_TRUE(chains_->shouldTriggerNext("eod_scan", utc("2024-01-09 04:00:00")));
  // One second later is too late
  EXPECT_FALSE(chains_->shouldTriggerNext("eod_scan", utc("2024-01-09 04:00:01")));
  EXPECT_FALSE(chains_->triggerNext("eod_scan", utc("2024-01-09 04:30:00")));
  EXPECT_TRUE(triggered_.empty());
}

TEST_F(ChainManagerTest, UngatedEdgeRunsOnWeekend) {
  // Sunday 2024-01-07 09:00 CST
  EXPECT_TRUE(chains_->triggerNext("universe_refresh", utc("2024-01-07 15:00:00")));
  EXPECT_EQ(triggered_, (std::vector<std::string>{"weekly_bars_etl"}));
}

TEST_F(ChainManagerTest, MissingEdgeEndsChain) {
  EXPECT_FALSE(chains_->triggerNext("daily_movers", utc("2024-01-08 20:00:00")));
  EXPECT_FALSE(chains_->nextJob("daily_movers").has_value());
  EXPECT_TRUE(triggered_.empty());
}

TEST_F(ChainManagerTest, DownstreamFailureIsContained) {
  ChainManager failing(ChainConfig::defaults(), MarketHours(),
                       [](const std::string &jobName) {
                         throw BusinessException(ErrorCode::PROCESSING_FAILED,
                                                 jobName + " failed", "chain");
                       });
  EXPECT_NO_THROW({
    EXPECT_FALSE(failing.triggerNext("universe_refresh", utc("2024-01-07 15:00:00")));
  });

  ChainManager throwing(ChainConfig::defaults(), MarketHours(),
                        [](const std::string &) {
                          throw std::runtime_error("connection reset");
                        });
  EXPECT_NO_THROW({
    EXPECT_FALSE(throwing.triggerNext("universe_refresh", utc("2024-01-07 15:00:00")));
  });
}

TEST_F(ChainManagerTest, NoExecutorMeansNoTrigger) {
  ChainManager idle(ChainConfig::defaults(), MarketHours());
  EXPECT_FALSE(idle.triggerNext("universe_refresh", utc("2024-01-07 15:00:00")));

  idle.setExecutor([this](const std::string &jobName) { triggered_.push_back(jobName); });
  EXPECT_TRUE(idle.triggerNext("universe_refresh", utc("2024-01-07 15:00:00")));
  EXPECT_EQ(triggered_.size(), 1u);
}

TEST_F(ChainManagerTest, ChainInfoDescribesEdges) {
  auto info = chains_->getChainInfo("eod_scan");
  EXPECT_TRUE(info.hasChain);
  EXPECT_EQ(info.nextJob.value_or(""), "tech_analysis");
  EXPECT_EQ(info.conditions.value("weekday_only", false), true);
  EXPECT_EQ(info.conditions.value("max_hour", 0), 22);

  auto json = info.toJson();
  EXPECT_EQ(json["job_name"], "eod_scan");
  EXPECT_EQ(json["next_job"], "tech_analysis");
  EXPECT_EQ(json["has_chain"], true);

  auto weekly = chains_->getChainInfo("universe_refresh");
  EXPECT_TRUE(weekly.conditions.empty());

  auto none = chains_->getChainInfo("daily_movers");
  EXPECT_FALSE(none.hasChain);
  EXPECT_FALSE(none.nextJob.has_value());
  EXPECT_EQ(none.description, "No description");
  EXPECT_TRUE(none.toJson()["next_job"].is_null());
}

TEST_F(ChainManagerTest, AllChainsListsDefaults) {
  auto all = chains_->getAllChains();
  ASSERT_EQ(all.size(), 4u);
  EXPECT_EQ(all[0].jobName, "eod_scan");
  EXPECT_EQ(all[1].jobName, "tech_analysis");
  EXPECT_EQ(all[2].jobName, "universe_refresh");
  EXPECT_EQ(all[3].jobName, "weekly_bars_etl");
  EXPECT_EQ(all[3].nextJob.value_or(""), "weekly_technicals_etl");
}

TEST_F(ChainManagerTest, ChainsFromConfiguration) {
  auto &config = ConfigManager::getInstance();
  config.clear();
  ASSERT_TRUE(config.loadFromString(R"({
    "job_chains": {
      "eod_scan": {
        "next_job": "daily_movers",
        "description": "Movers straight after the scan",
        "conditions": {"weekday_only": true, "max_hour": 20}
      }
    }
  })"));

  ChainManager configured(config.getChainConfig(), MarketHours(),
                          [this](const std::string &jobName) { triggered_.push_back(jobName); });
  config.clear();

  EXPECT_EQ(configured.getAllChains().size(), 1u);
  EXPECT_FALSE(configured.nextJob("universe_refresh").has_value());
  // Monday 2024-01-08 20:30 CST is past max_hour 20
  EXPECT_FALSE(configured.triggerNext("eod_scan", utc("2024-01-09 02:30:00")));
  // Monday 2024-01-08 19:00 CST
  EXPECT_TRUE(configured.triggerNext("eod_scan", utc("2024-01-09 01:00:00")));
  EXPECT_EQ(triggered_, (std::vector<std::string>{"daily_movers"}));
}

} // namespace mdjobs
