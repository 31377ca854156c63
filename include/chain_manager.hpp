#pragma once

#include "config_manager.hpp"
#include "market_hours.hpp"
#include <chrono>
#include <functional>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace mdjobs {

// Runs the named job to completion; failures surface as exceptions
using ChainExecutor = std::function<void(const std::string &jobName)>;

struct ChainInfo {
  std::string jobName;
  std::optional<std::string> nextJob;
  std::string description;
  nlohmann::json conditions = nlohmann::json::object();
  bool hasChain = false;

  nlohmann::json toJson() const;
};

/**
 * Static job -> next-job links evaluated after a successful run.
 *
 * Gating predicates are evaluated in the market time zone. A missing edge,
 * a failed predicate and a failing downstream job all end the chain
 * without raising.
 */
class ChainManager {
public:
  using TimePoint = std::chrono::system_clock::time_point;

  ChainManager(ChainConfig config, MarketHours hours,
               ChainExecutor executor = nullptr);

  void setExecutor(ChainExecutor executor);

  // True when the downstream job was started and completed
  bool triggerNext(const std::string &jobName);
  bool triggerNext(const std::string &jobName, TimePoint now);

  bool shouldTriggerNext(const std::string &jobName, TimePoint now) const;
  std::optional<std::string> nextJob(const std::string &jobName) const;

  ChainInfo getChainInfo(const std::string &jobName) const;
  std::vector<ChainInfo> getAllChains() const;

private:
  ChainConfig config_;
  MarketHours hours_;
  ChainExecutor executor_;

  const ChainEdge *findEdge(const std::string &jobName) const;
};

} // namespace mdjobs
