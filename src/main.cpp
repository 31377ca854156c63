#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>

#include "chain_manager.hpp"
#include "config_manager.hpp"
#include "database_manager.hpp"
#include "eod_scan_engine.hpp"
#include "execution_repository.hpp"
#include "execution_tracker.hpp"
#include "http_client.hpp"
#include "job_catalog.hpp"
#include "job_config_repository.hpp"
#include "job_control_service.hpp"
#include "job_exceptions.hpp"
#include "job_lock.hpp"
#include "job_runner.hpp"
#include "logger.hpp"
#include "market_data_provider.hpp"
#include "market_hours.hpp"
#include "price_repository.hpp"
#include "scan_repository.hpp"
#include "scheduler_service.hpp"

using namespace mdjobs;

namespace {

std::atomic<bool> shutdownRequested{false};

void signalHandler(int) { shutdownRequested.store(true); }

constexpr std::chrono::seconds kBackendTimeout{300};

struct Stores {
  std::shared_ptr<JobConfigStore> configs;
  std::shared_ptr<ExecutionStore> executions;
  std::shared_ptr<ScanStore> scans;
  std::shared_ptr<BarStore> bars;
  std::shared_ptr<SymbolUniverse> universe;
};

Stores openStores(const std::shared_ptr<DatabaseManager> &dbManager,
                  bool connected) {
  Stores stores;
  if (connected) {
    stores.configs = std::make_shared<JobConfigRepository>(dbManager);
    stores.executions = std::make_shared<ExecutionRepository>(dbManager);
    stores.scans = std::make_shared<ScanRepository>(dbManager);
    stores.bars = std::make_shared<PriceRepository>(dbManager);
    stores.universe = std::make_shared<SymbolRepository>(dbManager);
  } else {
    stores.configs = std::make_shared<InMemoryJobConfigStore>();
    stores.executions = std::make_shared<InMemoryExecutionStore>();
    stores.scans = std::make_shared<InMemoryScanStore>();
    stores.bars = std::make_shared<InMemoryBarStore>();
    stores.universe =
        std::make_shared<StaticSymbolUniverse>(std::vector<SymbolRecord>{});
  }
  return stores;
}

void printUsage(const char *program) {
  std::cerr << "Usage: " << program
            << " [config.json] [--run <job> [start [end]]]" << std::endl;
}

} // namespace

int main(int argc, char *argv[]) {
  std::string configPath = "config.json";
  std::string runOnce;
  std::optional<DateRange> runRange;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--run" && i + 1 < argc) {
      runOnce = argv[++i];
      if (i + 1 < argc) {
        std::string start = argv[++i];
        std::string end = i + 1 < argc ? argv[++i] : start;
        try {
          runRange = DateRange::fromStrings(start, end);
        } catch (const ValidationException &e) {
          std::cerr << "Invalid date range: " << e.getMessage() << std::endl;
          return 2;
        }
      }
    } else if (arg == "--help" || arg == "-h") {
      printUsage(argv[0]);
      return 0;
    } else if (!arg.empty() && arg[0] != '-') {
      configPath = arg;
    } else {
      printUsage(argv[0]);
      return 2;
    }
  }

  try {
    auto &config = ConfigManager::getInstance();
    if (!config.loadConfig(configPath)) {
      std::cerr << "Failed to load configuration from " << configPath
                << std::endl;
      return 1;
    }
    config.applyEnvironmentOverrides();

    Logger::getInstance().configure(config.getLoggingConfig());
    LOG_INFO("Main", "Starting market data job scheduler");

    auto validation = config.validateConfiguration();
    for (const auto &warning : validation.warnings) {
      LOG_WARN("Main", "Configuration warning: " + warning);
    }
    if (!validation.isValid) {
      for (const auto &error : validation.errors) {
        LOG_ERROR("Main", "Configuration error: " + error);
      }
      return 1;
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    auto dbManager = std::make_shared<DatabaseManager>();
    bool connected = dbManager->connect(config.getDatabaseSettings());
    if (!connected) {
      LOG_WARN("Main", "Failed to connect to database. Running in offline "
                       "mode with in-memory stores.");
    } else if (!dbManager->initializeSchema()) {
      LOG_ERROR("Main", "Failed to initialize database schema");
      return 1;
    }

    Stores stores = openStores(dbManager, connected);
    int seeded = stores.configs->seedDefaults(defaultJobConfigurations());
    LOG_INFO("Main", "Seeded " + std::to_string(seeded) +
                         " default job configurations");

    const SchedulerConfig schedulerConfig = config.getSchedulerConfig();
    const ScanConfig scanConfig = config.getScanConfig();
    const ServiceEndpoints endpoints = config.getServiceEndpoints();
    MarketHours hours(config.getMarketHoursConfig());

    auto tracker = std::make_shared<ExecutionTracker>(
        stores.executions, schedulerConfig.keepHistory);
    auto locks = std::make_shared<JobLockRegistry>();
    auto runner = std::make_shared<JobRunner>(tracker, locks);

    auto externalHttp = std::make_shared<HttpClient>(
        std::chrono::seconds(endpoints.requestTimeoutSeconds));
    auto backendHttp = std::make_shared<HttpClient>(kBackendTimeout);
    auto externalApi =
        std::make_shared<ExternalApiClient>(endpoints.externalApisUrl, externalHttp);
    auto backend =
        std::make_shared<BackendClient>(endpoints.backendUrl, backendHttp);

    auto scanEngine = std::make_shared<EodScanEngine>(
        scanConfig, hours, stores.scans, externalApi, stores.bars,
        stores.universe);

    JobCatalogDeps deps;
    deps.scanEngine = scanEngine;
    deps.externalApi = externalApi;
    deps.backend = backend;
    deps.tracker = tracker;
    deps.scans = stores.scans;
    deps.endpoints = endpoints;
    deps.keepScans = scanConfig.keepScans;
    registerJobCatalog(*runner, deps);

    auto chains = std::make_shared<ChainManager>(config.getChainConfig(), hours);
    std::weak_ptr<JobRunner> weakRunner = runner;
    chains->setExecutor([weakRunner](const std::string &jobName) {
      auto owner = weakRunner.lock();
      if (!owner) {
        return;
      }
      RunRequest request;
      request.source = TriggerSource::CHAINED;
      RunResult result = owner->runJob(jobName, request);
      if (result.status != RunStatus::COMPLETED) {
        throw BusinessException(ErrorCode::PROCESSING_FAILED,
                                "Chained job " + jobName + " ended " +
                                    runStatusToString(result.status) +
                                    (result.errorMessage.empty()
                                         ? std::string()
                                         : ": " + result.errorMessage),
                                "chain");
      }
    });
    runner->setChainManager(chains);

    auto control = std::make_shared<JobControlService>(
        stores.configs, runner, stores.scans, scanEngine, hours);

    auto stuck = control->cleanupStuckRuns();
    if (stuck.scansFailed + stuck.runsFailed > 0) {
      LOG_WARN("Main", "Recovered stuck rows from a previous process: " +
                           stuck.toJson().dump());
    }

    if (!runOnce.empty()) {
      RunResult result = control->runJobNow(runOnce, runRange);
      std::cout << toJson(result).dump(2) << std::endl;
      Logger::getInstance().flush();
      return result.status == RunStatus::COMPLETED ? 0 : 1;
    }

    auto scheduler = std::make_shared<SchedulerService>(
        schedulerConfig, hours, stores.configs, runner);
    control->setScheduler(scheduler);
    scheduler->start();

    for (const auto &job : scheduler->getScheduledJobs()) {
      LOG_INFO("Main", "Scheduled " + job.toJson().dump());
    }
    LOG_INFO("Main", "Scheduler is running. Press Ctrl+C to stop.");

    while (!shutdownRequested.load()) {
      std::this_thread::sleep_for(std::chrono::seconds(1));
    }

    LOG_INFO("Main", "Shutdown requested, waiting for running jobs");
    scheduler->stop();
    dbManager->disconnect();
  } catch (const JobsException &e) {
    LOG_FATAL("Main", "Unhandled error: " + e.toLogString());
    Logger::getInstance().flush();
    return 1;
  } catch (const std::exception &e) {
    LOG_FATAL("Main", "Unhandled exception: " + std::string(e.what()));
    Logger::getInstance().flush();
    return 1;
  }

  LOG_INFO("Main", "Market data job scheduler shutdown complete");
  Logger::getInstance().shutdown();
  return 0;
}
