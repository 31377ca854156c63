#pragma once

#include "config_manager.hpp"
#include "market_data_provider.hpp"
#include "market_hours.hpp"
#include "rate_limiter.hpp"
#include "scan_store.hpp"
#include <boost/asio/thread_pool.hpp>
#include <functional>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace mdjobs {

struct ScanSummary {
  int64_t scanId = 0;
  ScanStatus status = ScanStatus::RUNNING;
  std::string scanDate;
  int symbolsRequested = 0;
  int symbolsFetched = 0;
  int inserted = 0;
  int updated = 0;
  int skipped = 0;
  int errors = 0;
  int retried = 0;
  int recovered = 0;

  nlohmann::json toJson() const;
};

struct RetrySummary {
  int retried = 0;
  int inserted = 0;
  int updated = 0;
  int skipped = 0;
  int failed = 0;
  std::optional<std::string> message;

  nlohmann::json toJson() const;
};

/**
 * End-of-day price scan over the symbol universe.
 *
 * A run creates its scan row, resolves and caps the universe, pre-warms the
 * provider token (failure aborts the run before any fetch), then processes
 * symbols in sequential batches on a bounded worker pool behind a shared
 * rate limiter. Transient provider errors get a second pass through a
 * smaller pool and a stricter limiter. Each task has its own deadline; a
 * task past it is recorded as a provider error without status and left to
 * finish in the background.
 */
class EodScanEngine {
public:
  using TimePoint = std::chrono::system_clock::time_point;

  EodScanEngine(ScanConfig config, MarketHours hours,
                std::shared_ptr<ScanStore> scans,
                std::shared_ptr<MarketDataProvider> provider,
                std::shared_ptr<BarStore> bars,
                std::shared_ptr<SymbolUniverse> universe);
  ~EodScanEngine();

  EodScanEngine(const EodScanEngine &) = delete;
  EodScanEngine &operator=(const EodScanEngine &) = delete;

  ScanSummary runScan(const std::optional<DateRange> &range = std::nullopt);
  ScanSummary runScan(const std::optional<DateRange> &range, TimePoint now);

  // Re-fetches the transient provider errors of an earlier scan
  RetrySummary retryScan(int64_t scanId);

  DateRange resolveRange(const std::optional<DateRange> &range,
                         TimePoint now) const;

  const ScanConfig &config() const { return config_; }

private:
  enum class OutcomeKind { SUCCESS, EMPTY_RESULT, PROVIDER_ERROR };

  struct TaskOutcome {
    std::string symbol;
    OutcomeKind kind = OutcomeKind::SUCCESS;
    UpsertCounts counts;
    std::optional<int> httpStatus;
    std::string message;
  };

  using OutcomeHandler = std::function<void(const TaskOutcome &)>;

  ScanConfig config_;
  MarketHours hours_;
  std::shared_ptr<ScanStore> scans_;
  std::shared_ptr<MarketDataProvider> provider_;
  std::shared_ptr<BarStore> bars_;
  std::shared_ptr<SymbolUniverse> universe_;

  std::mutex drainMutex_;
  std::vector<std::unique_ptr<boost::asio::thread_pool>> draining_;

  TaskOutcome fetchSymbol(const std::string &symbol, const DateRange &range,
                          RateLimiter &limiter, int sleepMs,
                          bool emptyIsFailure) const;

  // Runs one task per symbol and reports every outcome on the calling
  // thread; returns once each symbol has an outcome or missed its deadline
  void fanOut(const std::vector<std::string> &symbols, const DateRange &range,
              int workers, std::shared_ptr<RateLimiter> limiter, int sleepMs,
              bool emptyIsFailure, const OutcomeHandler &onOutcome);

  void retryTransientErrors(int64_t scanId, const DateRange &range,
                            ScanSummary &summary);
  void drainStragglers();
  void recordError(int64_t scanId, const std::string &symbol,
                   ScanErrorType type, const std::string &message,
                   std::optional<int> httpStatus);
};

} // namespace mdjobs
