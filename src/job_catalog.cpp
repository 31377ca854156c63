#include "job_catalog.hpp"
#include "job_exceptions.hpp"
#include "logger.hpp"

namespace mdjobs {

namespace {

constexpr int64_t kExpiryWarningSeconds = 2 * 3600;
constexpr int64_t kRefreshAgeWarningSeconds = 6 * 24 * 3600;

int64_t integerField(const nlohmann::json &json, const char *key) {
  auto it = json.find(key);
  if (it == json.end() || !it->is_number()) {
    return 0;
  }
  return it->get<int64_t>();
}

JobBody delegatedJob(std::shared_ptr<BackendClient> backend, std::string path) {
  return [backend, path](const JobContext &context) -> int64_t {
    MDJOBS_LOG_INFO("Delegating {} to backend {}", context.jobName, path);
    auto response = backend->postJob(path);
    return integerField(response, "records_processed");
  };
}

} // namespace

RetentionResult runRetentionCleanup(ExecutionTracker &tracker, ScanStore &scans,
                                    int keepScans) {
  RetentionResult result;
  result.executionRowsDeleted = tracker.pruneAll();
  result.scanRunsDeleted = scans.pruneRuns(keepScans);
  MDJOBS_LOG_INFO("Retention cleanup removed {} execution rows and {} scan runs",
                  result.executionRowsDeleted, result.scanRunsDeleted);
  return result;
}

std::vector<std::string> evaluateTokenStatus(const TokenStatus &status) {
  if (!status.credentialsAvailable) {
    throw AuthException("Provider credentials are not available" +
                        (status.message.empty() ? std::string()
                                                : ": " + status.message));
  }

  std::vector<std::string> warnings;
  if (!status.valid || status.stale) {
    warnings.push_back("Provider token is stale and will be refreshed on next use");
  }
  if (status.expiresIn && *status.expiresIn < kExpiryWarningSeconds) {
    if (*status.expiresIn <= 0) {
      warnings.push_back("Provider access token has expired");
    } else {
      warnings.push_back("Provider access token expires in " +
                         std::to_string(*status.expiresIn / 60) + " minutes");
    }
  }
  if (status.ageSeconds && *status.ageSeconds > kRefreshAgeWarningSeconds) {
    warnings.push_back("Provider refresh token is " +
                       std::to_string(*status.ageSeconds / (24 * 3600)) +
                       " days old and needs re-authorization soon");
  }
  return warnings;
}

void registerJobCatalog(JobRunner &runner, const JobCatalogDeps &deps) {
  if (deps.scanEngine) {
    auto engine = deps.scanEngine;
    runner.registerJob(jobs::kEodScan, [engine](const JobContext &context) {
      ScanSummary summary = engine->runScan(context.dateRange);
      if (summary.status == ScanStatus::FAILED) {
        throw BusinessException(ErrorCode::PROCESSING_FAILED,
                                "EOD scan " + std::to_string(summary.scanId) +
                                    " failed before fan-out",
                                "eod_scan",
                                {{"scan_id", std::to_string(summary.scanId)}});
      }
      MDJOBS_LOG_INFO("EOD scan {} summary: {}", summary.scanId,
                      summary.toJson().dump());
      return static_cast<int64_t>(summary.symbolsRequested);
    });
  }

  if (deps.tracker && deps.scans) {
    auto tracker = deps.tracker;
    auto scans = deps.scans;
    const int keepScans = deps.keepScans;
    runner.registerJob(jobs::kTtlCleanup,
                       [tracker, scans, keepScans](const JobContext &) {
                         return static_cast<int64_t>(
                             runRetentionCleanup(*tracker, *scans, keepScans)
                                 .total());
                       });
  }

  if (deps.externalApi) {
    auto external = deps.externalApi;
    runner.registerJob(jobs::kTokenValidation, [external](const JobContext &) {
      TokenStatus status;
      try {
        status = external->getTokenStatus();
      } catch (const JobsException &e) {
        throw AuthException("Token status check failed: " + e.getMessage());
      }
      for (const auto &warning : evaluateTokenStatus(status)) {
        MDJOBS_LOG_WARN("{}", warning);
      }
      MDJOBS_LOG_INFO("Provider token check passed (valid={}, stale={})",
                      status.valid, status.stale);
      return static_cast<int64_t>(0);
    });
  }

  if (!deps.backend) {
    return;
  }
  auto backend = deps.backend;

  if (deps.externalApi) {
    auto external = deps.externalApi;
    runner.registerJob(
        jobs::kMarketDataRefresh, [backend, external](const JobContext &) {
          auto symbols = backend->getWatchlistSymbols();
          if (symbols.empty()) {
            MDJOBS_LOG_INFO("No watchlist symbols to refresh");
            return static_cast<int64_t>(0);
          }
          MDJOBS_LOG_INFO("Refreshing quotes for {} watchlist symbols",
                          symbols.size());
          auto quotes = external->getQuotes(symbols);
          return backend->storePrices(quotes);
        });
  }

  runner.registerJob(jobs::kUniverseRefresh, [backend](const JobContext &) {
    auto response = backend->refreshUniverse();
    return integerField(response, "symbols_updated");
  });

  runner.registerJob(jobs::kTechAnalysis, [backend](const JobContext &) {
    auto response = backend->runTechAnalysis();
    return integerField(response, "updated_symbols");
  });

  runner.registerJob(jobs::kDailyMovers,
                     delegatedJob(backend, deps.endpoints.dailyMoversPath));
  runner.registerJob(jobs::kWeeklyBarsEtl,
                     delegatedJob(backend, deps.endpoints.weeklyBarsPath));
  runner.registerJob(jobs::kWeeklyTechnicalsEtl,
                     delegatedJob(backend, deps.endpoints.weeklyTechnicalsPath));
}

} // namespace mdjobs
