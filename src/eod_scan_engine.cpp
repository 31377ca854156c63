#include "eod_scan_engine.hpp"
#include "job_exceptions.hpp"
#include "logger.hpp"
#include <algorithm>
#include <boost/asio/post.hpp>
#include <condition_variable>
#include <deque>
#include <iomanip>
#include <sstream>
#include <thread>

namespace mdjobs {

namespace {

enum class SlotState { QUEUED, RUNNING, DONE, ABANDONED };

template <typename Outcome> struct FanOutState {
  explicit FanOutState(std::vector<std::string> names)
      : symbols(std::move(names)), slots(symbols.size()),
        outcomes(symbols.size()) {}

  struct Slot {
    SlotState state = SlotState::QUEUED;
    std::chrono::steady_clock::time_point startedAt;
  };

  std::vector<std::string> symbols;
  size_t nextQueued = 0;
  std::mutex mutex;
  std::condition_variable cv;
  std::vector<Slot> slots;
  std::vector<std::optional<Outcome>> outcomes;
  std::deque<size_t> finished;
};

std::string fixed(double value, int precision) {
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(precision) << value;
  return oss.str();
}

} // namespace

nlohmann::json ScanSummary::toJson() const {
  return {{"scan_id", scanId},
          {"status", scanStatusToString(status)},
          {"scan_date", scanDate},
          {"symbols_requested", symbolsRequested},
          {"symbols_fetched", symbolsFetched},
          {"inserted", inserted},
          {"updated", updated},
          {"skipped", skipped},
          {"errors", errors},
          {"retried", retried},
          {"recovered", recovered}};
}

nlohmann::json RetrySummary::toJson() const {
  nlohmann::json json = {{"retried", retried}};
  if (message) {
    json["message"] = *message;
    return json;
  }
  json["inserted"] = inserted;
  json["updated"] = updated;
  json["skipped"] = skipped;
  json["failed"] = failed;
  return json;
}

EodScanEngine::EodScanEngine(ScanConfig config, MarketHours hours,
                             std::shared_ptr<ScanStore> scans,
                             std::shared_ptr<MarketDataProvider> provider,
                             std::shared_ptr<BarStore> bars,
                             std::shared_ptr<SymbolUniverse> universe)
    : config_(std::move(config)), hours_(std::move(hours)),
      scans_(std::move(scans)), provider_(std::move(provider)),
      bars_(std::move(bars)), universe_(std::move(universe)) {
  if (!scans_ || !provider_ || !bars_ || !universe_) {
    throw SystemException(ErrorCode::CONFIGURATION_ERROR,
                          "EodScanEngine requires a scan store, provider, bar "
                          "store and symbol universe",
                          "EodScanEngine");
  }
  config_.workers = std::max(1, config_.workers);
  config_.batchSize = std::max(1, config_.batchSize);
  config_.retryWorkers = std::max(1, config_.retryWorkers);
  config_.maxRps = std::max(ScanConfig::kMinRps, config_.maxRps);
  config_.retryMaxRps = std::max(ScanConfig::kMinRetryRps, config_.retryMaxRps);
}

EodScanEngine::~EodScanEngine() { drainStragglers(); }

void EodScanEngine::drainStragglers() {
  std::vector<std::unique_ptr<boost::asio::thread_pool>> pools;
  {
    std::lock_guard<std::mutex> lock(drainMutex_);
    pools.swap(draining_);
  }
  if (!pools.empty()) {
    SCAN_LOG_INFO("Waiting for {} worker pools with overdue tasks",
                  pools.size());
  }
  for (auto &pool : pools) {
    pool->join();
  }
}

DateRange EodScanEngine::resolveRange(const std::optional<DateRange> &range,
                                      TimePoint now) const {
  if (range) {
    return *range;
  }
  return DateRange::singleDay(hours_.tradingDateFor(now));
}

void EodScanEngine::recordError(int64_t scanId, const std::string &symbol,
                                ScanErrorType type, const std::string &message,
                                std::optional<int> httpStatus) {
  ScanError error;
  error.scanRunId = scanId;
  error.symbol = symbol;
  error.errorType = type;
  error.message = message;
  error.httpStatus = httpStatus;
  error.occurredAt = std::chrono::system_clock::now();
  scans_->addError(error);
}

EodScanEngine::TaskOutcome
EodScanEngine::fetchSymbol(const std::string &symbol, const DateRange &range,
                           RateLimiter &limiter, int sleepMs,
                           bool emptyIsFailure) const {
  TaskOutcome outcome;
  outcome.symbol = symbol;

  try {
    limiter.acquire();
    if (sleepMs > 0) {
      std::this_thread::sleep_for(std::chrono::milliseconds(sleepMs));
    }

    auto bars = provider_->fetchDailyBars(symbol, range);
    if (bars.empty()) {
      if (emptyIsFailure) {
        outcome.kind = OutcomeKind::PROVIDER_ERROR;
        outcome.message = "No candles on retry for " + symbol + " " +
                          range.startString() + ".." + range.endString();
      } else {
        outcome.kind = OutcomeKind::EMPTY_RESULT;
        outcome.message = "No candles for " + symbol + " in range " +
                          range.startString() + ".." + range.endString();
      }
      return outcome;
    }

    outcome.counts = bars_->upsertBars(symbol, bars, config_.source);
    outcome.kind = OutcomeKind::SUCCESS;
  } catch (const ProviderException &e) {
    outcome.kind = OutcomeKind::PROVIDER_ERROR;
    outcome.httpStatus = e.getHttpStatus();
    outcome.message = e.getMessage();
  } catch (const std::exception &e) {
    outcome.kind = OutcomeKind::PROVIDER_ERROR;
    outcome.message = e.what();
  }
  return outcome;
}

void EodScanEngine::fanOut(const std::vector<std::string> &symbols,
                           const DateRange &range, int workers,
                           std::shared_ptr<RateLimiter> limiter, int sleepMs,
                           bool emptyIsFailure,
                           const OutcomeHandler &onOutcome) {
  if (symbols.empty()) {
    return;
  }

  using State = FanOutState<TaskOutcome>;
  auto state = std::make_shared<State>(symbols);
  std::vector<std::unique_ptr<boost::asio::thread_pool>> pools;

  // Each worker claims queued symbols until none are left. A worker whose
  // task was abandoned stops claiming once its call finally returns.
  auto addWorkers = [&](size_t count) {
    pools.push_back(std::make_unique<boost::asio::thread_pool>(count));
    for (size_t w = 0; w < count; ++w) {
      boost::asio::post(*pools.back(), [this, state, limiter, range, sleepMs,
                                        emptyIsFailure]() {
        for (;;) {
          size_t i = 0;
          {
            std::lock_guard<std::mutex> lock(state->mutex);
            if (state->nextQueued >= state->symbols.size()) {
              return;
            }
            i = state->nextQueued++;
            state->slots[i].state = SlotState::RUNNING;
            state->slots[i].startedAt = std::chrono::steady_clock::now();
          }

          TaskOutcome outcome = fetchSymbol(state->symbols[i], range, *limiter,
                                            sleepMs, emptyIsFailure);

          {
            std::lock_guard<std::mutex> lock(state->mutex);
            if (state->slots[i].state == SlotState::ABANDONED) {
              return;
            }
            state->slots[i].state = SlotState::DONE;
            state->outcomes[i] = std::move(outcome);
            state->finished.push_back(i);
          }
          state->cv.notify_one();
        }
      });
    }
  };

  addWorkers(std::min(symbols.size(),
                      static_cast<size_t>(std::max(1, workers))));

  const auto deadline = std::chrono::seconds(std::max(1, config_.taskDeadlineSeconds));
  const auto pollInterval = std::chrono::seconds(1);
  size_t resolved = 0;
  bool abandonedAny = false;

  std::unique_lock<std::mutex> lock(state->mutex);
  while (resolved < symbols.size()) {
    while (!state->finished.empty()) {
      const size_t index = state->finished.front();
      state->finished.pop_front();
      TaskOutcome outcome = std::move(*state->outcomes[index]);
      lock.unlock();
      onOutcome(outcome);
      lock.lock();
      ++resolved;
    }
    if (resolved == symbols.size()) {
      break;
    }

    const auto now = std::chrono::steady_clock::now();
    auto wakeAt = now + pollInterval;
    std::vector<size_t> overdue;
    for (size_t i = 0; i < state->slots.size(); ++i) {
      auto &slot = state->slots[i];
      if (slot.state != SlotState::RUNNING) {
        continue;
      }
      if (now - slot.startedAt >= deadline) {
        slot.state = SlotState::ABANDONED;
        overdue.push_back(i);
      } else {
        wakeAt = std::min(wakeAt, slot.startedAt + deadline);
      }
    }

    if (!overdue.empty()) {
      abandonedAny = true;
      const size_t queued = symbols.size() - state->nextQueued;
      lock.unlock();

      // Abandoned calls still hold their threads; queued symbols get fresh ones
      if (queued > 0) {
        const size_t replacements = std::min(queued, overdue.size());
        SCAN_LOG_DEBUG("Adding {} workers for {} queued symbols",
                       replacements, queued);
        addWorkers(replacements);
      }

      for (size_t index : overdue) {
        TaskOutcome outcome;
        outcome.symbol = symbols[index];
        outcome.kind = OutcomeKind::PROVIDER_ERROR;
        outcome.message = "Deadline of " +
                          std::to_string(deadline.count()) +
                          "s exceeded for " + symbols[index];
        onOutcome(outcome);
      }
      lock.lock();
      resolved += overdue.size();
      continue;
    }

    state->cv.wait_until(lock, wakeAt);
  }
  lock.unlock();

  if (abandonedAny) {
    std::lock_guard<std::mutex> drainLock(drainMutex_);
    for (auto &pool : pools) {
      draining_.push_back(std::move(pool));
    }
  } else {
    for (auto &pool : pools) {
      pool->join();
    }
  }
}

ScanSummary EodScanEngine::runScan(const std::optional<DateRange> &range) {
  return runScan(range, std::chrono::system_clock::now());
}

ScanSummary EodScanEngine::runScan(const std::optional<DateRange> &range,
                                   TimePoint now) {
  drainStragglers();

  const DateRange effective = resolveRange(range, now);
  ScanSummary summary;
  summary.scanDate = effective.label();
  SCAN_LOG_INFO("EOD scan starting for {}..{}", effective.startString(),
                effective.endString());

  summary.scanId = scans_->createRun(summary.scanDate,
                                     std::chrono::system_clock::now());
  const int64_t scanId = summary.scanId;

  try {
    std::vector<std::string> symbols = universe_->resolveSymbolUniverse();
    if (config_.maxSymbols > 0 &&
        symbols.size() > static_cast<size_t>(config_.maxSymbols)) {
      symbols.resize(static_cast<size_t>(config_.maxSymbols));
    }
    summary.symbolsRequested = static_cast<int>(symbols.size());
    scans_->setRequested(scanId, summary.symbolsRequested);
    SCAN_LOG_INFO("EOD scan will process {} symbols in batches of {}",
                  symbols.size(), config_.batchSize);

    try {
      provider_->preWarmToken();
    } catch (const std::exception &e) {
      SCAN_LOG_ERROR("Pre-warm token failed: {}", e.what());
      scans_->finishRun(scanId, ScanStatus::FAILED,
                        std::chrono::system_clock::now());
      recordError(scanId, "AUTH", ScanErrorType::AUTH, e.what(), std::nullopt);
      summary.status = ScanStatus::FAILED;
      summary.errors = 1;
      return summary;
    }

    if (symbols.empty()) {
      scans_->finishRun(scanId, ScanStatus::COMPLETED,
                        std::chrono::system_clock::now());
      summary.status = ScanStatus::COMPLETED;
      scans_->pruneRuns(config_.keepScans);
      SCAN_LOG_INFO("EOD scan {} has no symbols to process", scanId);
      return summary;
    }

    auto limiter = std::make_shared<RateLimiter>(config_.maxRps);
    const auto started = std::chrono::steady_clock::now();
    int callsMade = 0;

    auto onOutcome = [&](const TaskOutcome &outcome) {
      ++callsMade;
      switch (outcome.kind) {
      case OutcomeKind::SUCCESS:
        summary.inserted += outcome.counts.inserted;
        summary.updated += outcome.counts.updated;
        summary.skipped += outcome.counts.skipped;
        summary.symbolsFetched++;
        scans_->incrementFetched(scanId);
        break;
      case OutcomeKind::EMPTY_RESULT:
        recordError(scanId, outcome.symbol, ScanErrorType::EMPTY_RESULT,
                    outcome.message, std::nullopt);
        break;
      case OutcomeKind::PROVIDER_ERROR:
        summary.errors++;
        SCAN_LOG_WARN("EOD upsert failed for {}: {}", outcome.symbol,
                      outcome.message);
        recordError(scanId, outcome.symbol, ScanErrorType::PROVIDER_ERROR,
                    outcome.message, outcome.httpStatus);
        break;
      }
    };

    const size_t batchSize = static_cast<size_t>(config_.batchSize);
    for (size_t offset = 0; offset < symbols.size(); offset += batchSize) {
      const auto last = std::min(symbols.size(), offset + batchSize);
      const std::vector<std::string> batch(symbols.begin() + offset,
                                           symbols.begin() + last);
      fanOut(batch, effective, config_.workers, limiter, config_.requestSleepMs,
             false, onOutcome);

      const double elapsed = std::max(
          0.001, std::chrono::duration<double>(std::chrono::steady_clock::now() -
                                               started)
                     .count());
      SCAN_LOG_INFO("EOD batch {}: ins={} upd={} skip={} err={} | calls={}, "
                    "elapsed={}s, rate={}/s, workers={}, rps={}",
                    offset / batchSize + 1, summary.inserted, summary.updated,
                    summary.skipped, summary.errors, callsMade,
                    fixed(elapsed, 1), fixed(callsMade / elapsed, 2),
                    config_.workers, fixed(config_.maxRps, 1));
    }

    retryTransientErrors(scanId, effective, summary);

    SCAN_LOG_INFO("EOD scan done: inserted={}, updated={}, skipped={}, errors={}",
                  summary.inserted, summary.updated, summary.skipped,
                  summary.errors);
    scans_->finishRun(scanId, ScanStatus::COMPLETED,
                      std::chrono::system_clock::now());
    summary.status = ScanStatus::COMPLETED;
  } catch (const std::exception &e) {
    SCAN_LOG_ERROR("EOD scan {} aborted: {}", scanId, e.what());
    try {
      scans_->finishRun(scanId, ScanStatus::FAILED,
                        std::chrono::system_clock::now());
    } catch (const JobsException &finishError) {
      SCAN_LOG_ERROR("Could not mark scan {} failed: {}", scanId,
                     finishError.toLogString());
    }
    throw;
  }

  int pruned = scans_->pruneRuns(config_.keepScans);
  if (pruned > 0) {
    SCAN_LOG_DEBUG("Pruned {} old scan runs", pruned);
  }
  return summary;
}

void EodScanEngine::retryTransientErrors(int64_t scanId, const DateRange &range,
                                         ScanSummary &summary) {
  const auto symbols = scans_->retryableSymbols(scanId);
  if (symbols.empty()) {
    return;
  }

  SCAN_LOG_INFO("Retrying {} transient failures with reduced rate",
                symbols.size());
  summary.retried = static_cast<int>(symbols.size());
  auto limiter = std::make_shared<RateLimiter>(config_.retryMaxRps);

  fanOut(symbols, range, config_.retryWorkers, limiter, config_.requestSleepMs,
         true, [&](const TaskOutcome &outcome) {
           if (outcome.kind != OutcomeKind::SUCCESS) {
             SCAN_LOG_WARN("Retry still failed for {}: {}", outcome.symbol,
                           outcome.message);
             return;
           }
           summary.inserted += outcome.counts.inserted;
           summary.updated += outcome.counts.updated;
           summary.skipped += outcome.counts.skipped;
           summary.recovered++;

           const int deleted = scans_->deleteProviderErrors(scanId, outcome.symbol);
           if (deleted > 0) {
             scans_->decrementErrors(scanId, deleted);
             summary.errors = std::max(0, summary.errors - deleted);
           }
         });
}

RetrySummary EodScanEngine::retryScan(int64_t scanId) {
  drainStragglers();

  RetrySummary summary;
  auto run = scans_->getRun(scanId);
  if (!run) {
    summary.message = "scan not found";
    return summary;
  }
  const DateRange range = DateRange::fromLabel(run->scanDate);

  const auto symbols = scans_->retryableSymbols(scanId);
  if (symbols.empty()) {
    summary.message = "no retryable symbols";
    return summary;
  }

  SCAN_LOG_INFO("Manual retry for scan {}: {} symbols", scanId, symbols.size());
  try {
    provider_->preWarmToken();
  } catch (const JobsException &e) {
    SCAN_LOG_WARN("Pre-warm token failed before manual retry: {}",
                  e.toLogString());
  }

  summary.retried = static_cast<int>(symbols.size());
  auto limiter = std::make_shared<RateLimiter>(config_.retryMaxRps);

  fanOut(symbols, range, config_.retryWorkers, limiter, 0, true,
         [&](const TaskOutcome &outcome) {
           if (outcome.kind != OutcomeKind::SUCCESS) {
             summary.failed++;
             SCAN_LOG_WARN("Manual retry failed for {}: {}", outcome.symbol,
                           outcome.message);
             return;
           }
           summary.inserted += outcome.counts.inserted;
           summary.updated += outcome.counts.updated;
           summary.skipped += outcome.counts.skipped;

           const int deleted = scans_->deleteProviderErrors(scanId, outcome.symbol);
           if (deleted > 0) {
             scans_->decrementErrors(scanId, deleted);
           }
         });

  return summary;
}

} // namespace mdjobs
