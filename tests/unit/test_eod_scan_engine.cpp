#include "eod_scan_engine.hpp"
#include "job_exceptions.hpp"
#include "logger.hpp"
#include <chrono>
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <map>
#include <mutex>
#include <thread>

namespace mdjobs {

namespace {

// One scripted provider response; the last step repeats once exhausted
struct Step {
  std::vector<Bar> bars;
  bool fail = false;
  std::optional<int> httpStatus;
  std::chrono::milliseconds delay{0};

  static Step data(std::vector<Bar> bars) {
    Step step;
    step.bars = std::move(bars);
    return step;
  }

  static Step error(std::optional<int> status) {
    Step step;
    step.fail = true;
    step.httpStatus = status;
    return step;
  }

  static Step slow(std::chrono::milliseconds delay, std::vector<Bar> bars) {
    Step step = data(std::move(bars));
    step.delay = delay;
    return step;
  }
};

class ScriptedProvider : public MarketDataProvider {
public:
  void script(const std::string &symbol, std::vector<Step> steps) {
    std::lock_guard<std::mutex> lock(mutex_);
    scripts_[symbol] = std::move(steps);
  }

  void preWarmToken() override {
    std::lock_guard<std::mutex> lock(mutex_);
    ++preWarmCalls_;
  }

  std::vector<Bar> fetchDailyBars(const std::string &symbol,
                                  const DateRange &) override {
    Step step;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      const int call = calls_[symbol]++;
      auto it = scripts_.find(symbol);
      if (it == scripts_.end() || it->second.empty()) {
        return {};
      }
      const auto index = std::min(static_cast<size_t>(call), it->second.size() - 1);
      step = it->second[index];
    }
    if (step.delay.count() > 0) {
      std::this_thread::sleep_for(step.delay);
    }
    if (step.fail) {
      throw ProviderException(step.httpStatus,
                              "HTTP " + (step.httpStatus ? std::to_string(*step.httpStatus)
                                                         : std::string("error")) +
                                  " for " + symbol);
    }
    return step.bars;
  }

  int calls(const std::string &symbol) {
    std::lock_guard<std::mutex> lock(mutex_);
    return calls_[symbol];
  }

  int totalCalls() {
    std::lock_guard<std::mutex> lock(mutex_);
    int total = 0;
    for (const auto &[symbol, count] : calls_) {
      total += count;
    }
    return total;
  }

  int preWarmCalls() {
    std::lock_guard<std::mutex> lock(mutex_);
    return preWarmCalls_;
  }

private:
  std::mutex mutex_;
  std::map<std::string, std::vector<Step>> scripts_;
  std::map<std::string, int> calls_;
  int preWarmCalls_ = 0;
};

class MockProvider : public MarketDataProvider {
public:
  MOCK_METHOD(void, preWarmToken, (), (override));
  MOCK_METHOD(std::vector<Bar>, fetchDailyBars,
              (const std::string &, const DateRange &), (override));
};

Bar bar(const std::string &date, double close) {
  return Bar{date, close - 1.0, close + 1.0, close - 2.0, close, 1000};
}

std::vector<SymbolRecord> records(const std::vector<std::string> &symbols) {
  std::vector<SymbolRecord> rows;
  for (const auto &symbol : symbols) {
    rows.push_back({symbol, "N"});
  }
  return rows;
}

} // namespace

class EodScanEngineTest : public ::testing::Test {
protected:
  void SetUp() override {
    LogConfig config;
    config.level = LogLevel::DEBUG;
    config.consoleOutput = true;
    config.fileOutput = false;
    Logger::getInstance().configure(config);

    config_.workers = 3;
    config_.maxRps = 100.0;
    config_.requestSleepMs = 0;
    config_.batchSize = 2;
    config_.retryWorkers = 2;
    config_.retryMaxRps = 100.0;
    config_.taskDeadlineSeconds = 5;
    config_.keepScans = 5;

    scans_ = std::make_shared<InMemoryScanStore>();
    bars_ = std::make_shared<InMemoryBarStore>();
    provider_ = std::make_shared<ScriptedProvider>();
  }

  std::unique_ptr<EodScanEngine>
  makeEngine(const std::vector<SymbolRecord> &universe,
             std::shared_ptr<MarketDataProvider> provider = nullptr) {
    return std::make_unique<EodScanEngine>(
        config_, MarketHours(), scans_,
        provider ? provider : std::static_pointer_cast<MarketDataProvider>(provider_),
        bars_, std::make_shared<StaticSymbolUniverse>(universe));
  }

  static DateRange day() { return DateRange::fromStrings("2024-01-08", "2024-01-08"); }

  ScanConfig config_;
  std::shared_ptr<InMemoryScanStore> scans_;
  std::shared_ptr<InMemoryBarStore> bars_;
  std::shared_ptr<ScriptedProvider> provider_;
};

TEST_F(EodScanEngineTest, RecordsFetchedUpdatedAndMissingSymbols) {
  bars_->upsertBars("BBB", {bar("2024-01-08", 20.0)}, "schwab");

  provider_->script("AAA", {Step::data({bar("2024-01-05", 10.0), bar("2024-01-08", 11.0)})});
  provider_->script("BBB", {Step::data({bar("2024-01-08", 21.0)})});
  // CCC is unscripted and returns no candles

  auto engine = makeEngine(records({"AAA", "BBB", "CCC"}));
  auto summary = engine->runScan(day());

  EXPECT_EQ(summary.status, ScanStatus::COMPLETED);
  EXPECT_EQ(summary.scanDate, "2024-01-08");
  EXPECT_EQ(summary.symbolsRequested, 3);
  EXPECT_EQ(summary.symbolsFetched, 2);
  EXPECT_EQ(summary.inserted, 2);
  EXPECT_EQ(summary.updated, 1);
  EXPECT_EQ(summary.skipped, 0);
  EXPECT_EQ(summary.errors, 0);
  EXPECT_EQ(summary.retried, 0);

  auto run = scans_->getRun(summary.scanId);
  ASSERT_TRUE(run.has_value());
  EXPECT_EQ(run->status, ScanStatus::COMPLETED);
  EXPECT_EQ(run->symbolsRequested, 3);
  EXPECT_EQ(run->symbolsFetched, 2);
  EXPECT_EQ(run->errorCount, 1);
  EXPECT_TRUE(run->completedAt.has_value());

  auto errors = scans_->getErrors(summary.scanId, 100);
  ASSERT_EQ(errors.size(), 1u);
  EXPECT_EQ(errors[0].symbol, "CCC");
  EXPECT_EQ(errors[0].errorType, ScanErrorType::EMPTY_RESULT);
  EXPECT_EQ(errors[0].message, "No candles for CCC in range 2024-01-08..2024-01-08");
  EXPECT_FALSE(errors[0].httpStatus.has_value());

  EXPECT_TRUE(bars_->contains("AAA", "2024-01-05"));
  EXPECT_EQ(provider_->preWarmCalls(), 1);
}

TEST_F(EodScanEngineTest, AuthFailureAbortsBeforeAnyFetch) {
  auto mock = std::make_shared<::testing::StrictMock<MockProvider>>();
  EXPECT_CALL(*mock, preWarmToken())
      .WillOnce(::testing::Throw(AuthException("Schwab credentials missing")));
  EXPECT_CALL(*mock, fetchDailyBars(::testing::_, ::testing::_)).Times(0);

  std::vector<std::string> symbols;
  for (int i = 0; i < 50; ++i) {
    symbols.push_back("SYM" + std::to_string(i));
  }
  auto engine = makeEngine(records(symbols), mock);
  auto summary = engine->runScan(day());

  EXPECT_EQ(summary.status, ScanStatus::FAILED);
  EXPECT_EQ(summary.errors, 1);
  EXPECT_EQ(summary.symbolsFetched, 0);

  auto run = scans_->getRun(summary.scanId);
  ASSERT_TRUE(run.has_value());
  EXPECT_EQ(run->status, ScanStatus::FAILED);
  EXPECT_EQ(run->symbolsRequested, 50);
  EXPECT_EQ(run->symbolsFetched, 0);
  EXPECT_EQ(run->errorCount, 1);

  auto errors = scans_->getErrors(summary.scanId, 100);
  ASSERT_EQ(errors.size(), 1u);
  EXPECT_EQ(errors[0].errorType, ScanErrorType::AUTH);
  EXPECT_EQ(errors[0].symbol, "AUTH");
  EXPECT_EQ(errors[0].message, "Schwab credentials missing");
}

TEST_F(EodScanEngineTest, TransientErrorRecoversOnRetry) {
  provider_->script("AAA", {Step::error(429), Step::data({bar("2024-01-08", 5.0)})});
  provider_->script("BBB", {Step::error(404)});
  provider_->script("CCC", {Step::data({bar("2024-01-08", 7.0)})});

  auto engine = makeEngine(records({"AAA", "BBB", "CCC"}));
  auto summary = engine->runScan(day());

  EXPECT_EQ(summary.status, ScanStatus::COMPLETED);
  EXPECT_EQ(summary.retried, 1);
  EXPECT_EQ(summary.recovered, 1);
  EXPECT_EQ(summary.errors, 1);
  EXPECT_EQ(summary.inserted, 2);
  EXPECT_EQ(summary.symbolsFetched, 1);

  EXPECT_EQ(provider_->calls("AAA"), 2);
  EXPECT_EQ(provider_->calls("BBB"), 1);
  EXPECT_EQ(provider_->calls("CCC"), 1);

  auto run = scans_->getRun(summary.scanId);
  ASSERT_TRUE(run.has_value());
  EXPECT_EQ(run->errorCount, 1);

  auto errors = scans_->getErrors(summary.scanId, 100);
  ASSERT_EQ(errors.size(), 1u);
  EXPECT_EQ(errors[0].symbol, "BBB");
  EXPECT_EQ(errors[0].errorType, ScanErrorType::PROVIDER_ERROR);
  EXPECT_EQ(errors[0].httpStatus.value_or(0), 404);
  EXPECT_TRUE(bars_->contains("AAA", "2024-01-08"));
}

TEST_F(EodScanEngineTest, FailedRetryKeepsOriginalError) {
  provider_->script("AAA", {Step::error(503), Step::error(503)});

  auto engine = makeEngine(records({"AAA"}));
  auto summary = engine->runScan(day());

  EXPECT_EQ(summary.status, ScanStatus::COMPLETED);
  EXPECT_EQ(summary.retried, 1);
  EXPECT_EQ(summary.recovered, 0);
  EXPECT_EQ(summary.errors, 1);

  auto errors = scans_->getErrors(summary.scanId, 100);
  ASSERT_EQ(errors.size(), 1u);
  EXPECT_EQ(errors[0].httpStatus.value_or(0), 503);
  EXPECT_EQ(scans_->getRun(summary.scanId)->errorCount, 1);
}

TEST_F(EodScanEngineTest, EmptyRetryResponseIsStillAFailure) {
  provider_->script("AAA", {Step::error(500), Step::data({})});

  auto engine = makeEngine(records({"AAA"}));
  auto summary = engine->runScan(day());

  EXPECT_EQ(summary.retried, 1);
  EXPECT_EQ(summary.recovered, 0);
  auto errors = scans_->getErrors(summary.scanId, 100);
  ASSERT_EQ(errors.size(), 1u);
  EXPECT_EQ(errors[0].errorType, ScanErrorType::PROVIDER_ERROR);
}

TEST_F(EodScanEngineTest, RescanIsIdempotent) {
  provider_->script("AAA", {Step::data({bar("2024-01-05", 1.0), bar("2024-01-08", 2.0)})});
  provider_->script("BBB", {Step::data({bar("2024-01-08", 3.0)})});

  auto engine = makeEngine(records({"AAA", "BBB"}));
  auto first = engine->runScan(day());
  auto second = engine->runScan(day());

  EXPECT_EQ(first.inserted, 3);
  EXPECT_EQ(second.inserted, 0);
  EXPECT_EQ(second.updated, 0);
  EXPECT_EQ(second.skipped, 3);
  EXPECT_EQ(bars_->size(), 3u);
  EXPECT_NE(first.scanId, second.scanId);
}

TEST_F(EodScanEngineTest, EmptyUniverseCompletesImmediately) {
  auto engine = makeEngine({});
  auto summary = engine->runScan(day());

  EXPECT_EQ(summary.status, ScanStatus::COMPLETED);
  EXPECT_EQ(summary.symbolsRequested, 0);
  EXPECT_EQ(provider_->totalCalls(), 0);
  EXPECT_EQ(provider_->preWarmCalls(), 1);

  auto run = scans_->getRun(summary.scanId);
  ASSERT_TRUE(run.has_value());
  EXPECT_EQ(run->status, ScanStatus::COMPLETED);
  EXPECT_EQ(run->errorCount, 0);
}

TEST_F(EodScanEngineTest, AuthFailureWithEmptyUniverseStillFails) {
  auto mock = std::make_shared<::testing::StrictMock<MockProvider>>();
  EXPECT_CALL(*mock, preWarmToken())
      .WillOnce(::testing::Throw(AuthException("token endpoint unreachable")));

  auto engine = makeEngine({}, mock);
  auto summary = engine->runScan(day());

  EXPECT_EQ(summary.status, ScanStatus::FAILED);
  EXPECT_EQ(summary.symbolsRequested, 0);

  auto run = scans_->getRun(summary.scanId);
  ASSERT_TRUE(run.has_value());
  EXPECT_EQ(run->status, ScanStatus::FAILED);
  EXPECT_EQ(run->errorCount, 1);

  auto errors = scans_->getErrors(summary.scanId, 100);
  ASSERT_EQ(errors.size(), 1u);
  EXPECT_EQ(errors[0].errorType, ScanErrorType::AUTH);
}

TEST_F(EodScanEngineTest, UniverseIsFilteredAndCapped) {
  std::vector<SymbolRecord> rows = {{"AAA", "N"}, {"ABC.WS", "N"}, {"TEST", "Y"},
                                    {"BBB", "N"}, {"CCC", "N"},    {"DDD", "N"}};
  config_.maxSymbols = 3;

  auto engine = makeEngine(rows);
  auto summary = engine->runScan(day());

  EXPECT_EQ(summary.symbolsRequested, 3);
  EXPECT_EQ(provider_->totalCalls(), 3);
  EXPECT_EQ(provider_->calls("ABC.WS"), 0);
  EXPECT_EQ(provider_->calls("TEST"), 0);
  EXPECT_EQ(provider_->calls("DDD"), 0);
}

TEST_F(EodScanEngineTest, BatchesCoverEverySymbol) {
  std::vector<std::string> symbols = {"A1", "A2", "A3", "A4", "A5"};
  for (const auto &symbol : symbols) {
    provider_->script(symbol, {Step::data({bar("2024-01-08", 1.0)})});
  }

  auto engine = makeEngine(records(symbols));
  auto summary = engine->runScan(day());

  EXPECT_EQ(summary.symbolsFetched, 5);
  EXPECT_EQ(summary.inserted, 5);
  for (const auto &symbol : symbols) {
    EXPECT_EQ(provider_->calls(symbol), 1) << symbol;
  }
}

TEST_F(EodScanEngineTest, ScanRespectsRateLimit) {
  config_.maxRps = 5.0;
  std::vector<std::string> symbols = {"A1", "A2", "A3", "A4", "A5", "A6"};
  for (const auto &symbol : symbols) {
    provider_->script(symbol, {Step::data({bar("2024-01-08", 1.0)})});
  }

  auto engine = makeEngine(records(symbols));
  auto started = std::chrono::steady_clock::now();
  engine->runScan(day());
  auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - started);

  EXPECT_GE(elapsed.count(), 0.9);
}

TEST_F(EodScanEngineTest, OverdueTaskBecomesProviderErrorWithoutStatus) {
  config_.taskDeadlineSeconds = 1;
  provider_->script("SLOW", {Step::slow(std::chrono::milliseconds(1500),
                                        {bar("2024-01-08", 1.0)})});
  provider_->script("FAST", {Step::data({bar("2024-01-08", 2.0)})});

  auto engine = makeEngine(records({"SLOW", "FAST"}));
  auto summary = engine->runScan(day());

  EXPECT_EQ(summary.status, ScanStatus::COMPLETED);
  EXPECT_EQ(summary.symbolsFetched, 1);
  EXPECT_EQ(summary.retried, 1);
  EXPECT_EQ(summary.recovered, 0);
  EXPECT_EQ(summary.errors, 1);

  auto errors = scans_->getErrors(summary.scanId, 100);
  ASSERT_EQ(errors.size(), 1u);
  EXPECT_EQ(errors[0].symbol, "SLOW");
  EXPECT_EQ(errors[0].errorType, ScanErrorType::PROVIDER_ERROR);
  EXPECT_FALSE(errors[0].httpStatus.has_value());
  EXPECT_THAT(errors[0].message, ::testing::HasSubstr("Deadline of 1s exceeded"));
}

TEST_F(EodScanEngineTest, HungTaskDoesNotStallQueuedSymbols) {
  config_.workers = 1;
  config_.batchSize = 3;
  config_.taskDeadlineSeconds = 1;
  provider_->script("HANG", {Step::slow(std::chrono::milliseconds(4000),
                                        {bar("2024-01-08", 1.0)}),
                             Step::data({bar("2024-01-08", 1.0)})});
  provider_->script("AAA", {Step::data({bar("2024-01-08", 2.0)})});
  provider_->script("BBB", {Step::data({bar("2024-01-08", 3.0)})});

  auto engine = makeEngine(records({"HANG", "AAA", "BBB"}));
  auto started = std::chrono::steady_clock::now();
  auto summary = engine->runScan(day());
  auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - started);

  EXPECT_LT(elapsed.count(), 3.0);
  EXPECT_EQ(summary.status, ScanStatus::COMPLETED);
  EXPECT_EQ(summary.symbolsFetched, 2);
  EXPECT_EQ(summary.retried, 1);
  EXPECT_EQ(summary.recovered, 1);
  EXPECT_EQ(summary.errors, 0);
  EXPECT_EQ(provider_->calls("AAA"), 1);
  EXPECT_EQ(provider_->calls("BBB"), 1);
  EXPECT_EQ(provider_->calls("HANG"), 2);
}

TEST_F(EodScanEngineTest, RecoveryClearsEveryErrorRowForSymbol) {
  config_.batchSize = 5;
  provider_->script("AAA", {Step::error(429), Step::error(429),
                            Step::data({bar("2024-01-08", 5.0)})});

  // Listed twice, so the first pass records two rows for one symbol
  auto engine = makeEngine(records({"AAA", "AAA"}));
  auto summary = engine->runScan(day());

  EXPECT_EQ(summary.retried, 1);
  EXPECT_EQ(summary.recovered, 1);
  EXPECT_EQ(summary.errors, 0);
  EXPECT_EQ(provider_->calls("AAA"), 3);

  auto run = scans_->getRun(summary.scanId);
  ASSERT_TRUE(run.has_value());
  EXPECT_EQ(run->errorCount, summary.errors);
  EXPECT_TRUE(scans_->getErrors(summary.scanId, 100).empty());
}

TEST_F(EodScanEngineTest, DefaultRangeIsLatestTradingDay) {
  auto engine = makeEngine({});
  // Monday 2024-01-08 12:00 CST -> Friday's session
  auto summary = engine->runScan(std::nullopt, stringToTimePoint("2024-01-08 18:00:00"));
  EXPECT_EQ(summary.scanDate, "2024-01-05");
  EXPECT_EQ(scans_->getRun(summary.scanId)->scanDate, "2024-01-05");

  auto range = engine->resolveRange(DateRange::fromStrings("2024-01-02", "2024-01-05"),
                                    Clock::now());
  EXPECT_EQ(range.label(), "2024-01-02..2024-01-05");
}

TEST_F(EodScanEngineTest, OldScansArePruned) {
  config_.keepScans = 3;
  auto engine = makeEngine({});
  for (int i = 0; i < 5; ++i) {
    engine->runScan(day());
  }
  EXPECT_EQ(scans_->listRuns(100).size(), 3u);
}

TEST_F(EodScanEngineTest, ManualRetryRecoversRemainingErrors) {
  provider_->script("AAA", {Step::error(503), Step::error(503),
                            Step::data({bar("2024-01-08", 4.0)})});
  provider_->script("BBB", {Step::data({bar("2024-01-08", 5.0)})});

  auto engine = makeEngine(records({"AAA", "BBB"}));
  auto summary = engine->runScan(day());
  ASSERT_EQ(scans_->getRun(summary.scanId)->errorCount, 1);

  auto retry = engine->retryScan(summary.scanId);
  EXPECT_FALSE(retry.message.has_value());
  EXPECT_EQ(retry.retried, 1);
  EXPECT_EQ(retry.inserted, 1);
  EXPECT_EQ(retry.failed, 0);

  EXPECT_TRUE(scans_->getErrors(summary.scanId, 100).empty());
  EXPECT_EQ(scans_->getRun(summary.scanId)->errorCount, 0);

  auto json = retry.toJson();
  EXPECT_EQ(json["retried"], 1);
  EXPECT_EQ(json["inserted"], 1);
  EXPECT_EQ(json["failed"], 0);
}

TEST_F(EodScanEngineTest, ManualRetryCountsFailures) {
  provider_->script("AAA", {Step::error(500)});

  auto engine = makeEngine(records({"AAA"}));
  auto summary = engine->runScan(day());

  auto retry = engine->retryScan(summary.scanId);
  EXPECT_EQ(retry.retried, 1);
  EXPECT_EQ(retry.failed, 1);
  EXPECT_EQ(scans_->getErrors(summary.scanId, 100).size(), 1u);
}

TEST_F(EodScanEngineTest, ManualRetryReportsNothingToDo) {
  provider_->script("AAA", {Step::data({bar("2024-01-08", 1.0)})});
  auto engine = makeEngine(records({"AAA"}));
  auto summary = engine->runScan(day());

  auto none = engine->retryScan(summary.scanId);
  EXPECT_EQ(none.message.value_or(""), "no retryable symbols");
  EXPECT_EQ(none.retried, 0);

  auto missing = engine->retryScan(9999);
  EXPECT_EQ(missing.message.value_or(""), "scan not found");
  auto json = missing.toJson();
  EXPECT_EQ(json["message"], "scan not found");
  EXPECT_EQ(json["retried"], 0);
  EXPECT_FALSE(json.contains("inserted"));
}

TEST_F(EodScanEngineTest, SummaryJsonUsesSnakeCase) {
  ScanSummary summary;
  summary.scanId = 7;
  summary.status = ScanStatus::COMPLETED;
  summary.symbolsRequested = 3;
  auto json = summary.toJson();
  EXPECT_EQ(json["scan_id"], 7);
  EXPECT_EQ(json["status"], "completed");
  EXPECT_EQ(json["symbols_requested"], 3);
  EXPECT_TRUE(json.contains("recovered"));
}

TEST_F(EodScanEngineTest, RequiresCollaborators) {
  EXPECT_THROW(EodScanEngine(config_, MarketHours(), nullptr, provider_, bars_,
                             std::make_shared<StaticSymbolUniverse>(records({}))),
               SystemException);
}

} // namespace mdjobs
