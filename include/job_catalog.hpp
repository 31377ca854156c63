#pragma once

#include "config_manager.hpp"
#include "eod_scan_engine.hpp"
#include "execution_tracker.hpp"
#include "job_runner.hpp"
#include "scan_store.hpp"
#include "service_clients.hpp"
#include <memory>
#include <string>
#include <vector>

namespace mdjobs {

namespace jobs {
constexpr const char *kEodScan = "eod_scan";
constexpr const char *kMarketDataRefresh = "market_data_refresh";
constexpr const char *kUniverseRefresh = "universe_refresh";
constexpr const char *kTechAnalysis = "tech_analysis";
constexpr const char *kDailyMovers = "daily_movers";
constexpr const char *kWeeklyBarsEtl = "weekly_bars_etl";
constexpr const char *kWeeklyTechnicalsEtl = "weekly_technicals_etl";
constexpr const char *kTokenValidation = "token_validation";
constexpr const char *kTtlCleanup = "job_ttl_cleanup";
} // namespace jobs

// Collaborators of the registered job bodies. A job whose collaborator is
// missing is not registered.
struct JobCatalogDeps {
  std::shared_ptr<EodScanEngine> scanEngine;
  std::shared_ptr<ExternalApiClient> externalApi;
  std::shared_ptr<BackendClient> backend;
  std::shared_ptr<ExecutionTracker> tracker;
  std::shared_ptr<ScanStore> scans;
  ServiceEndpoints endpoints;
  int keepScans = 5;
};

void registerJobCatalog(JobRunner &runner, const JobCatalogDeps &deps);

struct RetentionResult {
  int executionRowsDeleted = 0;
  int scanRunsDeleted = 0;

  int total() const { return executionRowsDeleted + scanRunsDeleted; }
};

RetentionResult runRetentionCleanup(ExecutionTracker &tracker, ScanStore &scans,
                                    int keepScans);

// Throws AuthException when no provider credentials are configured.
// Returns the warnings worth logging for a usable token.
std::vector<std::string> evaluateTokenStatus(const TokenStatus &status);

} // namespace mdjobs
