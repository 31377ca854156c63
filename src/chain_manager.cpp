#include "chain_manager.hpp"
#include "job_exceptions.hpp"
#include "logger.hpp"

namespace mdjobs {

nlohmann::json ChainInfo::toJson() const {
  nlohmann::json json;
  json["job_name"] = jobName;
  json["next_job"] = nextJob ? nlohmann::json(*nextJob) : nlohmann::json();
  json["description"] = description;
  json["conditions"] = conditions;
  json["has_chain"] = hasChain;
  return json;
}

ChainManager::ChainManager(ChainConfig config, MarketHours hours,
                           ChainExecutor executor)
    : config_(std::move(config)), hours_(std::move(hours)),
      executor_(std::move(executor)) {}

void ChainManager::setExecutor(ChainExecutor executor) {
  executor_ = std::move(executor);
}

const ChainEdge *ChainManager::findEdge(const std::string &jobName) const {
  for (const auto &edge : config_.edges) {
    if (edge.jobName == jobName && !edge.nextJob.empty()) {
      return &edge;
    }
  }
  return nullptr;
}

std::optional<std::string>
ChainManager::nextJob(const std::string &jobName) const {
  const ChainEdge *edge = findEdge(jobName);
  if (!edge) {
    return std::nullopt;
  }
  return edge->nextJob;
}

bool ChainManager::shouldTriggerNext(const std::string &jobName,
                                     TimePoint now) const {
  const ChainEdge *edge = findEdge(jobName);
  if (!edge) {
    return false;
  }

  const MarketTime local = hours_.toMarketTime(now);
  if (edge->weekdayOnly && local.isWeekend()) {
    CHAIN_LOG_INFO("Skipping next job trigger for {} - weekend day", jobName);
    return false;
  }

  if (edge->maxHour) {
    const int secondsOfDay =
        local.hour * 3600 + local.minute * 60 + local.second;
    if (secondsOfDay > *edge->maxHour * 3600) {
      CHAIN_LOG_WARN(
          "Skipping next job trigger for {} - too late in the day (after {}:00)",
          jobName, *edge->maxHour);
      return false;
    }
  }
  return true;
}

bool ChainManager::triggerNext(const std::string &jobName) {
  return triggerNext(jobName, std::chrono::system_clock::now());
}

bool ChainManager::triggerNext(const std::string &jobName, TimePoint now) {
  const ChainEdge *edge = findEdge(jobName);
  if (!edge) {
    CHAIN_LOG_INFO("{} - no chained job configured, chain ends here", jobName);
    return false;
  }

  const std::string next = edge->nextJob;
  if (!shouldTriggerNext(jobName, now)) {
    CHAIN_LOG_INFO("{} -> {} - conditions not met, skipping trigger", jobName,
                   next);
    return false;
  }

  if (!executor_) {
    CHAIN_LOG_ERROR("{} -> {} - no executor configured", jobName, next);
    return false;
  }

  CHAIN_LOG_INFO("{} -> {} - triggering next job in chain", jobName, next);
  try {
    executor_(next);
    CHAIN_LOG_INFO("{} -> {} - completed", jobName, next);
    return true;
  } catch (const JobsException &e) {
    CHAIN_LOG_ERROR("{} -> {} - failed: {}", jobName, next, e.toLogString());
  } catch (const std::exception &e) {
    CHAIN_LOG_ERROR("{} -> {} - failed: {}", jobName, next, e.what());
  }
  return false;
}

ChainInfo ChainManager::getChainInfo(const std::string &jobName) const {
  ChainInfo info;
  info.jobName = jobName;
  info.description = "No description";

  const ChainEdge *edge = findEdge(jobName);
  if (!edge) {
    return info;
  }

  info.nextJob = edge->nextJob;
  info.hasChain = true;
  if (!edge->description.empty()) {
    info.description = edge->description;
  }
  if (edge->weekdayOnly) {
    info.conditions["weekday_only"] = true;
  }
  if (edge->maxHour) {
    info.conditions["max_hour"] = *edge->maxHour;
  }
  return info;
}

std::vector<ChainInfo> ChainManager::getAllChains() const {
  std::vector<ChainInfo> chains;
  for (const auto &edge : config_.edges) {
    if (!edge.nextJob.empty()) {
      chains.push_back(getChainInfo(edge.jobName));
    }
  }
  return chains;
}

} // namespace mdjobs
